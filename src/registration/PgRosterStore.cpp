#include "PgRosterStore.h"
#include "../db/DbPool.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

namespace registration {

namespace errc = boost::system::errc;

static const std::string kSqlStateTimeout = "57014";
static const std::string kSqlStateSerialization = "40001";
static const std::string kSqlStateDeadlock = "40P01";
static const std::string kSqlStateUnique = "23505";
static const std::string kSqlStateBadText = "22P02";

static boost::system::error_code ec_from_result(const db::DbResult& r) {
    if (r.sqlstate == kSqlStateTimeout) return errc::make_error_code(errc::timed_out);
    return errc::make_error_code(errc::io_error);
}

PgRosterStore::PgRosterStore(std::shared_ptr<db::DbPool> db) : db_(std::move(db)) {}

std::optional<EventSnapshot> snapshot_from_rows(const db::DbResult& r, boost::system::error_code& ec) {
    ec = {};
    if (r.rows.empty()) return std::nullopt;
    auto bad = [&](const char* what) -> std::optional<EventSnapshot> {
        observability::log_error("roster.malformed_row", {{"field", std::string(what)}});
        ec = errc::make_error_code(errc::bad_message);
        return std::nullopt;
    };

    const auto& head = r.rows[0];
    if (head.size() < 7) return bad("columns");
    EventSnapshot ev;
    if (!head[0].has_value()) return bad("id");
    ev.id = *head[0];
    auto status = head[1].has_value() ? parse_event_status(*head[1]) : std::nullopt;
    if (!status) return bad("status");
    ev.status = *status;
    auto max = head[2].has_value() ? parse_int_strict_sv(*head[2]) : std::nullopt;
    if (!max || *max <= 0) return bad("max_attendees");
    ev.max_attendees = *max;
    auto ver = json_parse_int_strict(head[3]);
    if (!ver) return bad("version");
    ev.version = *ver;

    for (const auto& row : r.rows) {
        if (row.size() < 7) return bad("columns");
        if (!row[4].has_value()) continue;
        Attendee a;
        a.user_id = *row[4];
        a.registered_at = row[5].value_or(std::string());
        auto ast = row[6].has_value() ? parse_attendance_status(*row[6]) : std::nullopt;
        if (!ast) return bad("attendance_status");
        a.status = *ast;
        ev.attendees.push_back(std::move(a));
    }
    return ev;
}

void PgRosterStore::async_get_event(const std::string& event_id, GetEventCb cb) {
    db_->async_get_event_roster(event_id, [cb = std::move(cb), event_id](const boost::system::error_code& ec, const db::DbResult& r) {
        if (ec) { cb(ec, std::nullopt); return; }
        if (!r.ok) {
            if (r.sqlstate == kSqlStateBadText) { cb({}, std::nullopt); return; }
            cb(ec_from_result(r), std::nullopt);
            return;
        }
        boost::system::error_code parse_ec;
        auto snap = snapshot_from_rows(r, parse_ec);
        if (parse_ec) observability::log_warn("roster.read_rejected", {{"event_id", event_id}});
        cb(parse_ec, std::move(snap));
    });
}

void PgRosterStore::async_persist_roster(const std::string& event_id, int64_t expected_version,
                                         std::vector<Attendee> roster, CommitCb cb) {
    std::vector<std::string> users, stamps, statuses;
    users.reserve(roster.size()); stamps.reserve(roster.size()); statuses.reserve(roster.size());
    for (auto& a : roster) {
        users.push_back(std::move(a.user_id));
        stamps.push_back(std::move(a.registered_at));
        statuses.emplace_back(to_string(a.status));
    }
    db_->async_commit_roster(event_id, expected_version, std::move(users), std::move(stamps), std::move(statuses),
        [cb = std::move(cb)](const boost::system::error_code& ec, const db::DbResult& r) {
            if (ec) { cb(ec, CommitStatus::Conflict); return; }
            if (!r.ok) {
                if (r.sqlstate == kSqlStateSerialization || r.sqlstate == kSqlStateDeadlock || r.sqlstate == kSqlStateUnique) {
                    cb({}, CommitStatus::Conflict);
                    return;
                }
                cb(ec_from_result(r), CommitStatus::Conflict);
                return;
            }
            cb({}, r.affected_rows == 1 ? CommitStatus::Committed : CommitStatus::Conflict);
        });
}

void PgRosterStore::async_list_registered_events(const std::string& user_id, EventIdsCb cb) {
    db_->async_list_events_for_attendee(user_id, [cb = std::move(cb)](const boost::system::error_code& ec, const db::DbResult& r) {
        if (ec) { cb(ec, {}); return; }
        if (!r.ok) { cb(ec_from_result(r), {}); return; }
        std::vector<std::string> ids;
        ids.reserve(r.rows.size());
        for (const auto& row : r.rows) {
            if (!row.empty() && row[0].has_value()) ids.push_back(*row[0]);
        }
        cb({}, std::move(ids));
    });
}

}
