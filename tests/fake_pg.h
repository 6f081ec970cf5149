#pragma once

#include <libpq-fe.h>

// Control surface of the link-time libpq replacement in fake_libpq.cpp.
// Every PQexec/PQexecParams call pops the next queued result in order.
extern "C" {
  void fake_pg_clear_queue();
  void fake_pg_set_connect_ok(int ok);
  void fake_pg_queue_null();
  // cols_csv: "a,b"; rows_csv: "1,x;2,<NULL>"
  void fake_pg_queue_response(ExecStatusType status, const char* errmsg, const char* sqlstate, const char* cols_csv, const char* rows_csv, const char* cmd_tuples);
  int fake_pg_exec_count();
  // Parameters of the most recent PQexecParams call, joined by '|'.
  const char* fake_pg_last_params();
}
