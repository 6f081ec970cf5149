#pragma once

#include "RosterStore.h"
#include <boost/asio.hpp>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace registration {

class InMemoryRosterStore : public RosterStore {
public:
    explicit InMemoryRosterStore(boost::asio::io_context& ioc);

    void put_event(EventSnapshot ev);
    bool erase_event(const std::string& event_id);
    std::optional<EventSnapshot> get_event_now(const std::string& event_id) const;

    void async_get_event(const std::string& event_id, GetEventCb cb) override;
    void async_persist_roster(const std::string& event_id, int64_t expected_version,
                              std::vector<Attendee> roster, CommitCb cb) override;
    void async_list_registered_events(const std::string& user_id, EventIdsCb cb) override;

private:
    boost::asio::io_context& ioc_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, EventSnapshot> events_;
};

// Parses "id:status:max[,id:status:max...]". Malformed entries are skipped.
std::vector<EventSnapshot> parse_seed_events(const std::string& text);

}
