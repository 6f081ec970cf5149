#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace registration {

enum class EventStatus { Draft, Published, Cancelled, Completed };
enum class AttendanceStatus { Registered, Attended, Cancelled };

std::optional<EventStatus> parse_event_status(std::string_view s);
const char* to_string(EventStatus s);
std::optional<AttendanceStatus> parse_attendance_status(std::string_view s);
const char* to_string(AttendanceStatus s);

struct Attendee {
    std::string user_id;
    std::string registered_at;
    AttendanceStatus status = AttendanceStatus::Registered;
};

// One consistent read of an event's registration state. version increases by
// one on every committed roster change.
struct EventSnapshot {
    std::string id;
    EventStatus status = EventStatus::Draft;
    int max_attendees = 0;
    int64_t version = 0;
    std::vector<Attendee> attendees;
};

enum class RegistrationError {
    None,
    NotFound,
    NotAvailable,
    AlreadyRegistered,
    Full,
    NotRegistered,
    Busy,
    Unavailable
};

const char* error_name(RegistrationError e);
const char* error_message(RegistrationError e);
bool is_retryable(RegistrationError e);

bool is_user_registered(const EventSnapshot& ev, const std::string& user_id);
bool is_full(const EventSnapshot& ev);
int available_spots(const EventSnapshot& ev);

// Preconditions after the event is known to exist, checked in order:
// status, duplicate, capacity.
RegistrationError check_register(const EventSnapshot& ev, const std::string& user_id);
RegistrationError check_unregister(const EventSnapshot& ev, const std::string& user_id);

std::vector<Attendee> roster_with(const EventSnapshot& ev, Attendee a);
std::vector<Attendee> roster_without(const EventSnapshot& ev, const std::string& user_id);

struct RosterView {
    std::string event_id;
    EventStatus status = EventStatus::Draft;
    int max_attendees = 0;
    int attendee_count = 0;
    int available_spots = 0;
    bool is_full = false;
    int64_t version = 0;
    std::vector<Attendee> attendees;
};

RosterView make_view(const EventSnapshot& ev);

std::string now_iso_utc_ms();

}
