#include "DbPool.h"
#include <stdexcept>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <cstdlib>
#include "../observability/Logging.h"
#include "../net/MiniJson.h"
#include <vector>

namespace db {


static void post_db_result(boost::asio::io_context& ioc, DbResultCb cb, boost::system::error_code ec, DbResult&& r) {
    boost::asio::post(ioc, [cb = std::move(cb), ec, r = std::move(r)]() mutable {
        cb(ec, std::move(r));
    });
}

static DbResult to_db_result(PGresult* pr) {
    DbResult r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr, i) ? PQfname(pr, i) : "");
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                char* v = PQgetvalue(pr, i, j);
                row.emplace_back(v ? std::optional<std::string>(std::string(v)) : std::nullopt);
            }
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr);
        r.affected_rows = ct ? std::atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    if (!r.ok) {
        observability::log_warn("dbpool.result_non_ok", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    }
    return r;
}

std::string build_pg_text_array(const std::vector<std::string>& vals) {
    if (vals.empty()) return std::string("{}");
    std::string out = "{";
    for (size_t i = 0; i < vals.size(); ++i) {
        if (i) out += ",";
        out += '"';
        for (char c : vals[i]) {
            if (c == '\\') out += "\\\\";
            else if (c == '"') out += "\\\"";
            else out.push_back(c);
        }
        out += '"';
    }
    out += "}";
    return out;
}

struct DbPool::Impl {
    boost::asio::io_context& app_ioc;
    std::string conninfo;
    int workers = 2;
    int statement_timeout_ms = 0;

    struct Task { std::function<void(PGconn*&)> fn; };
    std::queue<Task> tasks;
    std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;

    std::vector<std::thread> threads;

    Impl(boost::asio::io_context& ioc, const std::string& ci, int workers_, int timeout_ms)
        : app_ioc(ioc), conninfo(ci), workers(workers_), statement_timeout_ms(timeout_ms) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto &t : threads) if (t.joinable()) t.join();
    }

    PGconn* connect_one() {
        PGconn* c = PQconnectdb(conninfo.c_str());
        if (c == nullptr) return nullptr;
        if (PQstatus(c) != CONNECTION_OK) {
            PQfinish(c);
            return nullptr;
        }
        if (statement_timeout_ms > 0) {
            std::string sql = "SET statement_timeout = " + std::to_string(statement_timeout_ms);
            PGresult* r = PQexec(c, sql.c_str());
            bool ok = r && PQresultStatus(r) == PGRES_COMMAND_OK;
            if (r) PQclear(r);
            if (!ok) {
                observability::log_warn("dbpool.statement_timeout_failed", {{"timeout_ms", int64_t(statement_timeout_ms)}});
                PQfinish(c);
                return nullptr;
            }
        }
        return c;
    }

    void worker_loop() {
        PGconn* local_conn = connect_one();
        observability::log_info("dbpool.worker_started", {{"local_conn", local_conn ? std::string("ok") : std::string("null")}});
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) {
                    if (local_conn) { PQfinish(local_conn); local_conn = nullptr; }
                    return;
                }
                task = std::move(tasks.front()); tasks.pop();
            }
            try {
                task.fn(local_conn);
            } catch (const std::exception& e) {
                observability::log_error(std::string("db task exception: ") + e.what());
            }
        }
    }

    void post_task(std::function<void(PGconn*&)> f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(Task{std::move(f)});
        }
        cv_tasks.notify_one();
    }

    // Runs one statement with a single reconnect on a dropped connection.
    void run_statement(std::string sql, std::optional<std::vector<std::string>> params, DbResultCb cb) {
        post_task([this, sql = std::move(sql), params = std::move(params), cb = std::move(cb)](PGconn*& local_conn) mutable {
            boost::system::error_code ec;
            PGresult* r = nullptr;
            for (int attempt = 0; attempt < 2; ++attempt) {
                if (!local_conn) {
                    local_conn = connect_one();
                    if (!local_conn) { ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable); break; }
                }
                if (params) {
                    std::vector<const char*> cparams; cparams.reserve(params->size());
                    for (const auto& p : *params) cparams.push_back(p.c_str());
                    r = PQexecParams(local_conn, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
                } else {
                    r = PQexec(local_conn, sql.c_str());
                }
                if (!r) { PQfinish(local_conn); local_conn = nullptr; ec = boost::system::errc::make_error_code(boost::system::errc::io_error); continue; }
                ec = {};
                break;
            }
            DbResult out;
            if (r) {
                out = to_db_result(r);
                PQclear(r);
            } else {
                observability::log_warn("dbpool.exec_null", {{"err", ec.message()}});
            }
            post_db_result(app_ioc, std::move(cb), ec, std::move(out));
        });
    }
};

DbPool::DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers, int statement_timeout_ms) {
    impl_ = std::make_unique<Impl>(app_ioc, conninfo, workers, statement_timeout_ms);
}

DbPool::~DbPool() = default;

void DbPool::async_exec(const std::string& sql, DbResultCb cb) {
    impl_->run_statement(sql, std::nullopt, std::move(cb));
}

void DbPool::async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb) {
    impl_->run_statement(sql, std::move(params), std::move(cb));
}

void DbPool::async_scalar_int(const std::string& sql, ScalarIntCb cb) {
    async_exec(sql, [cb](const boost::system::error_code& ec, const DbResult& r) {
        if (ec) { cb(ec, 0); return; }
        if (!r.ok || r.rows.empty() || r.rows[0].empty()) { cb(boost::asio::error::operation_aborted, 0); return; }
        std::optional<int> val;
        if (r.rows[0][0].has_value()) val = parse_int_strict_sv(*r.rows[0][0]);
        if (!val) { cb(boost::asio::error::invalid_argument, 0); return; }
        cb({}, *val);
    });
}

void DbPool::async_get_event_roster(std::string event_id, DbResultCb cb) {
    const std::string sql =
        "SELECT e.id, e.status, e.max_attendees, e.version, a.user_id, "
        "to_char(a.registered_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"'), a.attendance_status "
        "FROM events e LEFT JOIN event_attendees a ON a.event_id = e.id "
        "WHERE e.id = $1 ORDER BY a.position";
    async_exec_params(sql, std::vector<std::string>{std::move(event_id)}, std::move(cb));
}

void DbPool::async_list_events_for_attendee(std::string user_id, DbResultCb cb) {
    const std::string sql = "SELECT event_id FROM event_attendees WHERE user_id = $1 ORDER BY registered_at, event_id";
    async_exec_params(sql, std::vector<std::string>{std::move(user_id)}, std::move(cb));
}

void DbPool::async_commit_roster(std::string event_id, int64_t expected_version,
                                 std::vector<std::string> user_ids,
                                 std::vector<std::string> registered_ats,
                                 std::vector<std::string> statuses,
                                 DbResultCb cb) {
    auto impl = impl_.get();
    std::string users_arr = build_pg_text_array(user_ids);
    std::string ts_arr = build_pg_text_array(registered_ats);
    std::string st_arr = build_pg_text_array(statuses);
    bool empty_roster = user_ids.empty();
    impl->post_task([impl, event_id = std::move(event_id), expected_version, users_arr = std::move(users_arr),
                     ts_arr = std::move(ts_arr), st_arr = std::move(st_arr), empty_roster, cb = std::move(cb)](PGconn*& local_conn) mutable {
        boost::system::error_code ec;
        DbResult r;
        if (!local_conn) local_conn = impl->connect_one();
        if (!local_conn) {
            ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable);
            post_db_result(impl->app_ioc, std::move(cb), ec, std::move(r));
            return;
        }

        auto rollback = [&local_conn]() {
            PGresult* rb = PQexec(local_conn, "ROLLBACK");
            if (rb) PQclear(rb);
        };
        auto fail_io = [&]() {
            rollback();
            PQfinish(local_conn); local_conn = nullptr;
            ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
            post_db_result(impl->app_ioc, std::move(cb), ec, std::move(r));
        };
        // Returns false after reporting the failure.
        auto check = [&](PGresult* res, ExecStatusType want) -> bool {
            if (!res) { fail_io(); return false; }
            if (PQresultStatus(res) != want) {
                r = to_db_result(res);
                r.ok = false;
                PQclear(res);
                rollback();
                post_db_result(impl->app_ioc, std::move(cb), ec, std::move(r));
                return false;
            }
            return true;
        };

        PGresult* res = PQexec(local_conn, "BEGIN");
        if (!check(res, PGRES_COMMAND_OK)) return;
        PQclear(res);

        const char* sql_bump = "UPDATE events SET version = version + 1, updated_at = now() WHERE id = $1 AND version = $2 RETURNING version";
        std::string ver = std::to_string(expected_version);
        const char* p_bump[2] = { event_id.c_str(), ver.c_str() };
        res = PQexecParams(local_conn, sql_bump, 2, nullptr, p_bump, nullptr, nullptr, 0);
        if (!check(res, PGRES_TUPLES_OK)) return;
        if (PQntuples(res) == 0) {
            PQclear(res);
            rollback();
            r.ok = true;
            r.affected_rows = 0;
            post_db_result(impl->app_ioc, std::move(cb), ec, std::move(r));
            return;
        }
        char* nv = PQgetvalue(res, 0, 0);
        std::string new_version = nv ? nv : std::string();
        PQclear(res);

        const char* sql_clear = "DELETE FROM event_attendees WHERE event_id = $1";
        const char* p_clear[1] = { event_id.c_str() };
        res = PQexecParams(local_conn, sql_clear, 1, nullptr, p_clear, nullptr, nullptr, 0);
        if (!check(res, PGRES_COMMAND_OK)) return;
        PQclear(res);

        if (!empty_roster) {
            const char* sql_fill =
                "INSERT INTO event_attendees(event_id, user_id, registered_at, attendance_status, position) "
                "SELECT $1::uuid, t.user_id, t.registered_at::timestamptz, t.attendance_status, t.ord::int "
                "FROM UNNEST($2::text[], $3::text[], $4::text[]) WITH ORDINALITY AS t(user_id, registered_at, attendance_status, ord)";
            const char* p_fill[4] = { event_id.c_str(), users_arr.c_str(), ts_arr.c_str(), st_arr.c_str() };
            res = PQexecParams(local_conn, sql_fill, 4, nullptr, p_fill, nullptr, nullptr, 0);
            if (!check(res, PGRES_COMMAND_OK)) return;
            PQclear(res);
        }

        res = PQexec(local_conn, "COMMIT");
        if (!check(res, PGRES_COMMAND_OK)) return;
        PQclear(res);

        r.ok = true;
        r.affected_rows = 1;
        r.columns.emplace_back("version");
        r.rows.emplace_back();
        r.rows.back().emplace_back(new_version);
        post_db_result(impl->app_ioc, std::move(cb), ec, std::move(r));
    });
}

}
