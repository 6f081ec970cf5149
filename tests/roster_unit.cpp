#include <iostream>
#include <string>
#include "registration/Roster.h"

using namespace registration;

static EventSnapshot make_event(EventStatus st, int max, std::initializer_list<const char*> users) {
    EventSnapshot ev;
    ev.id = "e1";
    ev.status = st;
    ev.max_attendees = max;
    for (const char* u : users) {
        Attendee a;
        a.user_id = u;
        a.registered_at = "2026-01-01T00:00:00.000Z";
        ev.attendees.push_back(a);
    }
    return ev;
}

int main() {
    for (auto st : {EventStatus::Draft, EventStatus::Published, EventStatus::Cancelled, EventStatus::Completed}) {
        auto parsed = parse_event_status(to_string(st));
        if (!parsed || *parsed != st) { std::cerr << "event status name does not parse back: " << to_string(st) << "\n"; return 1; }
    }
    if (parse_event_status("Published").has_value()) { std::cerr << "status names are case sensitive\n"; return 1; }
    if (parse_attendance_status("attended") != AttendanceStatus::Attended) { std::cerr << "attendance status parse failed\n"; return 1; }
    if (parse_attendance_status("maybe").has_value()) { std::cerr << "unknown attendance status accepted\n"; return 1; }

    // status is checked before duplicates, duplicates before capacity
    {
        auto ev = make_event(EventStatus::Draft, 1, {"u1"});
        if (check_register(ev, "u1") != RegistrationError::NotAvailable) { std::cerr << "draft should be not_available\n"; return 1; }
        ev.status = EventStatus::Cancelled;
        if (check_register(ev, "u2") != RegistrationError::NotAvailable) { std::cerr << "cancelled should be not_available\n"; return 1; }
        ev.status = EventStatus::Completed;
        if (check_register(ev, "u2") != RegistrationError::NotAvailable) { std::cerr << "completed should be not_available\n"; return 1; }
        ev.status = EventStatus::Published;
        if (check_register(ev, "u1") != RegistrationError::AlreadyRegistered) { std::cerr << "duplicate on full event should be already_registered\n"; return 1; }
        if (check_register(ev, "u2") != RegistrationError::Full) { std::cerr << "full event should be full\n"; return 1; }
    }
    {
        auto ev = make_event(EventStatus::Published, 3, {"u1", "u2"});
        if (check_register(ev, "u3") != RegistrationError::None) { std::cerr << "open spot rejected\n"; return 1; }
        if (is_full(ev) || available_spots(ev) != 1) { std::cerr << "spots mismatch\n"; return 1; }
        auto next = roster_with(ev, Attendee{"u3", "2026-01-01T00:00:02.000Z", AttendanceStatus::Registered});
        if (next.size() != 3 || next.back().user_id != "u3" || next.front().user_id != "u1") { std::cerr << "roster_with should append\n"; return 1; }
        if (ev.attendees.size() != 2) { std::cerr << "roster_with modified its input\n"; return 1; }
    }

    // unregister ignores event status
    {
        auto ev = make_event(EventStatus::Cancelled, 2, {"u1", "u2"});
        if (check_unregister(ev, "u1") != RegistrationError::None) { std::cerr << "unregister from cancelled event rejected\n"; return 1; }
        if (check_unregister(ev, "u9") != RegistrationError::NotRegistered) { std::cerr << "unknown user should be not_registered\n"; return 1; }
        auto next = roster_without(ev, "u1");
        if (next.size() != 1 || next[0].user_id != "u2") { std::cerr << "roster_without mismatch\n"; return 1; }
        if (roster_without(ev, "u9").size() != 2) { std::cerr << "roster_without removed a stranger\n"; return 1; }
    }

    // a roster already over capacity reports zero spots, never negative
    {
        auto ev = make_event(EventStatus::Published, 1, {"u1", "u2", "u3"});
        if (!is_full(ev) || available_spots(ev) != 0) { std::cerr << "over-capacity spots mismatch\n"; return 1; }
        auto v = make_view(ev);
        if (v.attendee_count != 3 || v.available_spots != 0 || !v.is_full) { std::cerr << "view mismatch\n"; return 1; }
    }

    if (std::string(error_name(RegistrationError::AlreadyRegistered)) != "already_registered") { std::cerr << "wire name mismatch\n"; return 1; }
    if (std::string(error_message(RegistrationError::Full)) != "Event is full") { std::cerr << "message mismatch\n"; return 1; }
    if (std::string(error_message(RegistrationError::NotAvailable)) != "Event is not available for registration") { std::cerr << "message mismatch\n"; return 1; }
    if (!is_retryable(RegistrationError::Busy) || !is_retryable(RegistrationError::Unavailable) || is_retryable(RegistrationError::Full)) {
        std::cerr << "retryable classification mismatch\n"; return 1;
    }

    auto ts = now_iso_utc_ms();
    if (ts.size() != 24 || ts[10] != 'T' || ts[19] != '.' || ts.back() != 'Z') { std::cerr << "timestamp format mismatch: " << ts << "\n"; return 1; }

    std::cout << "roster_unit ok\n";
    return 0;
}
