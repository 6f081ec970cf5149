#pragma once

#include "RosterStore.h"
#include <memory>

namespace db { struct DbResult; class DbPool; }

namespace registration {

class PgRosterStore : public RosterStore {
public:
    explicit PgRosterStore(std::shared_ptr<db::DbPool> db);

    void async_get_event(const std::string& event_id, GetEventCb cb) override;
    void async_persist_roster(const std::string& event_id, int64_t expected_version,
                              std::vector<Attendee> roster, CommitCb cb) override;
    void async_list_registered_events(const std::string& user_id, EventIdsCb cb) override;

private:
    std::shared_ptr<db::DbPool> db_;
};

// Folds the joined event/attendee rows into a snapshot. Sets ec on rows that
// do not describe a valid event.
std::optional<EventSnapshot> snapshot_from_rows(const db::DbResult& r, boost::system::error_code& ec);

}
