#pragma once

#include "Roster.h"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace registration {

enum class CommitStatus { Committed, Conflict };

using GetEventCb = std::function<void(const boost::system::error_code&, std::optional<EventSnapshot>)>;
using CommitCb = std::function<void(const boost::system::error_code&, CommitStatus)>;
using EventIdsCb = std::function<void(const boost::system::error_code&, std::vector<std::string>)>;

// Persistence seam for the registration core. Callbacks run on the
// application io_context, never inline from the calling stack.
class RosterStore {
public:
    virtual ~RosterStore() = default;

    // nullopt with a clear error_code means the event does not exist.
    virtual void async_get_event(const std::string& event_id, GetEventCb cb) = 0;

    // Conditional write: replaces the roster only while the stored version
    // still equals expected_version, then bumps the version by one.
    virtual void async_persist_roster(const std::string& event_id, int64_t expected_version,
                                      std::vector<Attendee> roster, CommitCb cb) = 0;

    virtual void async_list_registered_events(const std::string& user_id, EventIdsCb cb) = 0;
};

}
