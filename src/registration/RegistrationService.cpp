#include "RegistrationService.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include <algorithm>
#include <chrono>
#include <random>

namespace registration {

using observability::log_debug;
using observability::log_info;
using observability::log_warn;

RegistrationService::RegistrationService(boost::asio::io_context& ioc, std::shared_ptr<RosterStore> store, RetryPolicy policy)
    : ioc_(ioc), store_(std::move(store)), policy_(policy) {
    policy_.max_attempts = std::max(1, policy_.max_attempts);
    policy_.base_backoff_ms = std::max(0, policy_.base_backoff_ms);
    policy_.max_backoff_ms = std::max(policy_.base_backoff_ms, policy_.max_backoff_ms);
}

void RegistrationService::async_register(std::string event_id, std::string user_id, RegistrationCb cb) {
    auto a = std::make_shared<Attempt>(Attempt{Op::Register, std::move(event_id), std::move(user_id), std::move(cb)});
    start(std::move(a));
}

void RegistrationService::async_unregister(std::string event_id, std::string user_id, RegistrationCb cb) {
    auto a = std::make_shared<Attempt>(Attempt{Op::Unregister, std::move(event_id), std::move(user_id), std::move(cb)});
    start(std::move(a));
}

void RegistrationService::start(std::shared_ptr<Attempt> a) {
    a->attempts += 1;
    auto self = shared_from_this();
    std::string event_id = a->event_id;
    store_->async_get_event(event_id, [self, a](const boost::system::error_code& ec, std::optional<EventSnapshot> snap) {
        self->on_snapshot(a, ec, std::move(snap));
    });
}

void RegistrationService::on_snapshot(std::shared_ptr<Attempt> a, const boost::system::error_code& ec, std::optional<EventSnapshot> snap) {
    if (ec) {
        log_warn("registration.store_read_failed", {{"event_id", a->event_id}, {"err", ec.message()}});
        finish(a, RegistrationError::Unavailable);
        return;
    }
    if (!snap) { finish(a, RegistrationError::NotFound); return; }

    RegistrationError err = a->op == Op::Register ? check_register(*snap, a->user_id) : check_unregister(*snap, a->user_id);
    if (err != RegistrationError::None) { finish(a, err, make_view(*snap)); return; }

    EventSnapshot next = *snap;
    if (a->op == Op::Register) {
        Attendee added;
        added.user_id = a->user_id;
        added.registered_at = now_iso_utc_ms();
        added.status = AttendanceStatus::Registered;
        next.attendees = roster_with(*snap, std::move(added));
    } else {
        next.attendees = roster_without(*snap, a->user_id);
    }

    auto self = shared_from_this();
    std::vector<Attendee> roster = next.attendees;
    store_->async_persist_roster(a->event_id, snap->version, std::move(roster),
        [self, a, next = std::move(next)](const boost::system::error_code& ec2, CommitStatus st) mutable {
            self->on_commit(a, std::move(next), ec2, st);
        });
}

void RegistrationService::on_commit(std::shared_ptr<Attempt> a, EventSnapshot next, const boost::system::error_code& ec, CommitStatus st) {
    if (ec) {
        log_warn("registration.store_commit_failed", {{"event_id", a->event_id}, {"err", ec.message()}});
        finish(a, RegistrationError::Unavailable);
        return;
    }
    if (st == CommitStatus::Conflict) {
        observability::Metrics::instance().inc_commit_conflict();
        if (a->attempts >= policy_.max_attempts) {
            log_warn("registration.retries_exhausted", {{"event_id", a->event_id}, {"attempts", int64_t(a->attempts)}});
            finish(a, RegistrationError::Busy);
            return;
        }
        log_debug("registration.commit_conflict", {{"event_id", a->event_id}, {"attempt", int64_t(a->attempts)}});
        retry_later(a);
        return;
    }

    next.version += 1;
    log_info(a->op == Op::Register ? "registration.registered" : "registration.unregistered",
             {{"event_id", a->event_id}, {"user_id", a->user_id}, {"count", int64_t(next.attendees.size())}});
    finish(a, RegistrationError::None, make_view(next));
}

int RegistrationService::backoff_ms(int attempt) const {
    if (policy_.base_backoff_ms <= 0) return 0;
    int exp = std::min(std::max(attempt - 1, 0), 16);
    int64_t delay = std::min<int64_t>(policy_.max_backoff_ms, int64_t(policy_.base_backoff_ms) << exp);
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> jitter(0, delay);
    return static_cast<int>(std::min<int64_t>(policy_.max_backoff_ms, delay / 2 + jitter(rng) / 2));
}

void RegistrationService::retry_later(std::shared_ptr<Attempt> a) {
    auto self = shared_from_this();
    int delay = backoff_ms(a->attempts);
    if (delay <= 0) {
        boost::asio::post(ioc_, [self, a]{ self->start(a); });
        return;
    }
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc_);
    timer->expires_after(std::chrono::milliseconds(delay));
    timer->async_wait([self, a, timer](const boost::system::error_code& ec) {
        if (ec) { self->finish(a, RegistrationError::Busy); return; }
        self->start(a);
    });
}

void RegistrationService::finish(std::shared_ptr<Attempt> a, RegistrationError err, RosterView view) {
    const char* op = a->op == Op::Register ? "register" : "unregister";
    auto& metrics = observability::Metrics::instance();
    metrics.inc_registration(op, err == RegistrationError::None ? "ok" : error_name(err));
    metrics.observe_attempts(op, a->attempts);
    RegistrationResult res;
    res.error = err;
    res.roster = std::move(view);
    res.attempts = a->attempts;
    if (a->cb) a->cb(std::move(res));
}

void RegistrationService::async_availability(std::string event_id, RegistrationCb cb) {
    store_->async_get_event(event_id, [cb = std::move(cb), event_id](const boost::system::error_code& ec, std::optional<EventSnapshot> snap) {
        RegistrationResult res;
        res.attempts = 1;
        if (ec) {
            log_warn("registration.store_read_failed", {{"event_id", event_id}, {"err", ec.message()}});
            res.error = RegistrationError::Unavailable;
        } else if (!snap) {
            res.error = RegistrationError::NotFound;
        } else {
            res.roster = make_view(*snap);
        }
        cb(std::move(res));
    });
}

void RegistrationService::async_registered_events(std::string user_id, RegisteredEventsCb cb) {
    store_->async_list_registered_events(user_id, [cb = std::move(cb), user_id](const boost::system::error_code& ec, std::vector<std::string> ids) {
        if (ec) {
            log_warn("registration.store_list_failed", {{"user_id", user_id}, {"err", ec.message()}});
            cb(RegistrationError::Unavailable, {});
            return;
        }
        cb(RegistrationError::None, std::move(ids));
    });
}

}
