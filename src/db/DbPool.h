#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/asio.hpp>

namespace db {


struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;
};

using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;

// Builds a PostgreSQL text[] literal, quoting every element.
std::string build_pg_text_array(const std::vector<std::string>& vals);

// Fixed set of worker threads, each owning one libpq connection. Queries run
// on the workers; callbacks are posted back to the application io_context.
class DbPool {
public:

    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 4, int statement_timeout_ms = 0);
    ~DbPool();


    void async_exec(const std::string& sql, DbResultCb cb);


    void async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb);


    using ScalarIntCb = std::function<void(const boost::system::error_code&, int)>;
    void async_scalar_int(const std::string& sql, ScalarIntCb cb);

    // Columns: id, status, max_attendees, version, user_id, registered_at, attendance_status.
    // One row per attendee in roster order; a single row with null attendee
    // columns for an empty roster; no rows when the event does not exist.
    void async_get_event_roster(std::string event_id, DbResultCb cb);

    // Transactionally replaces the roster when events.version == expected_version.
    // ok && affected_rows == 0 means the version did not match.
    // ok && affected_rows == 1 carries the new version in rows[0][0].
    void async_commit_roster(std::string event_id, int64_t expected_version,
                             std::vector<std::string> user_ids,
                             std::vector<std::string> registered_ats,
                             std::vector<std::string> statuses,
                             DbResultCb cb);

    void async_list_events_for_attendee(std::string user_id, DbResultCb cb);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
