#include "Roster.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace registration {

std::optional<EventStatus> parse_event_status(std::string_view s) {
    if (s == "draft") return EventStatus::Draft;
    if (s == "published") return EventStatus::Published;
    if (s == "cancelled") return EventStatus::Cancelled;
    if (s == "completed") return EventStatus::Completed;
    return std::nullopt;
}

const char* to_string(EventStatus s) {
    switch (s) {
        case EventStatus::Draft: return "draft";
        case EventStatus::Published: return "published";
        case EventStatus::Cancelled: return "cancelled";
        case EventStatus::Completed: return "completed";
    }
    return "draft";
}

std::optional<AttendanceStatus> parse_attendance_status(std::string_view s) {
    if (s == "registered") return AttendanceStatus::Registered;
    if (s == "attended") return AttendanceStatus::Attended;
    if (s == "cancelled") return AttendanceStatus::Cancelled;
    return std::nullopt;
}

const char* to_string(AttendanceStatus s) {
    switch (s) {
        case AttendanceStatus::Registered: return "registered";
        case AttendanceStatus::Attended: return "attended";
        case AttendanceStatus::Cancelled: return "cancelled";
    }
    return "registered";
}

const char* error_name(RegistrationError e) {
    switch (e) {
        case RegistrationError::None: return "none";
        case RegistrationError::NotFound: return "not_found";
        case RegistrationError::NotAvailable: return "not_available";
        case RegistrationError::AlreadyRegistered: return "already_registered";
        case RegistrationError::Full: return "full";
        case RegistrationError::NotRegistered: return "not_registered";
        case RegistrationError::Busy: return "busy";
        case RegistrationError::Unavailable: return "unavailable";
    }
    return "unavailable";
}

const char* error_message(RegistrationError e) {
    switch (e) {
        case RegistrationError::None: return "";
        case RegistrationError::NotFound: return "Event not found";
        case RegistrationError::NotAvailable: return "Event is not available for registration";
        case RegistrationError::AlreadyRegistered: return "Already registered for this event";
        case RegistrationError::Full: return "Event is full";
        case RegistrationError::NotRegistered: return "Not registered for this event";
        case RegistrationError::Busy: return "Event is busy, please retry";
        case RegistrationError::Unavailable: return "Registration storage unavailable";
    }
    return "";
}

bool is_retryable(RegistrationError e) {
    return e == RegistrationError::Busy || e == RegistrationError::Unavailable;
}

bool is_user_registered(const EventSnapshot& ev, const std::string& user_id) {
    return std::any_of(ev.attendees.begin(), ev.attendees.end(),
                       [&](const Attendee& a) { return a.user_id == user_id; });
}

bool is_full(const EventSnapshot& ev) {
    return static_cast<int64_t>(ev.attendees.size()) >= ev.max_attendees;
}

int available_spots(const EventSnapshot& ev) {
    int64_t left = int64_t(ev.max_attendees) - int64_t(ev.attendees.size());
    return left > 0 ? static_cast<int>(left) : 0;
}

RegistrationError check_register(const EventSnapshot& ev, const std::string& user_id) {
    if (ev.status != EventStatus::Published) return RegistrationError::NotAvailable;
    if (is_user_registered(ev, user_id)) return RegistrationError::AlreadyRegistered;
    if (is_full(ev)) return RegistrationError::Full;
    return RegistrationError::None;
}

RegistrationError check_unregister(const EventSnapshot& ev, const std::string& user_id) {
    if (!is_user_registered(ev, user_id)) return RegistrationError::NotRegistered;
    return RegistrationError::None;
}

std::vector<Attendee> roster_with(const EventSnapshot& ev, Attendee a) {
    std::vector<Attendee> out = ev.attendees;
    out.push_back(std::move(a));
    return out;
}

std::vector<Attendee> roster_without(const EventSnapshot& ev, const std::string& user_id) {
    std::vector<Attendee> out;
    out.reserve(ev.attendees.size());
    bool removed = false;
    for (const auto& a : ev.attendees) {
        if (!removed && a.user_id == user_id) { removed = true; continue; }
        out.push_back(a);
    }
    return out;
}

RosterView make_view(const EventSnapshot& ev) {
    RosterView v;
    v.event_id = ev.id;
    v.status = ev.status;
    v.max_attendees = ev.max_attendees;
    v.attendee_count = static_cast<int>(ev.attendees.size());
    v.available_spots = available_spots(ev);
    v.is_full = is_full(ev);
    v.version = ev.version;
    v.attendees = ev.attendees;
    return v;
}

std::string now_iso_utc_ms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, int(ms));
    return std::string(buf);
}

}
