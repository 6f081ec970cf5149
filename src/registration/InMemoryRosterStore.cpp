#include "InMemoryRosterStore.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include <algorithm>
#include <utility>

namespace registration {

InMemoryRosterStore::InMemoryRosterStore(boost::asio::io_context& ioc) : ioc_(ioc) {}

void InMemoryRosterStore::put_event(EventSnapshot ev) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string id = ev.id;
    events_[id] = std::move(ev);
}

bool InMemoryRosterStore::erase_event(const std::string& event_id) {
    std::lock_guard<std::mutex> lk(mu_);
    return events_.erase(event_id) > 0;
}

std::optional<EventSnapshot> InMemoryRosterStore::get_event_now(const std::string& event_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = events_.find(event_id);
    if (it == events_.end()) return std::nullopt;
    return it->second;
}

void InMemoryRosterStore::async_get_event(const std::string& event_id, GetEventCb cb) {
    auto snap = get_event_now(event_id);
    boost::asio::post(ioc_, [cb = std::move(cb), snap = std::move(snap)]() mutable {
        cb(boost::system::error_code{}, std::move(snap));
    });
}

void InMemoryRosterStore::async_persist_roster(const std::string& event_id, int64_t expected_version,
                                               std::vector<Attendee> roster, CommitCb cb) {
    CommitStatus st = CommitStatus::Conflict;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = events_.find(event_id);
        if (it != events_.end() && it->second.version == expected_version) {
            it->second.attendees = std::move(roster);
            it->second.version += 1;
            st = CommitStatus::Committed;
        }
    }
    boost::asio::post(ioc_, [cb = std::move(cb), st]() {
        cb(boost::system::error_code{}, st);
    });
}

void InMemoryRosterStore::async_list_registered_events(const std::string& user_id, EventIdsCb cb) {
    std::vector<std::pair<std::string, std::string>> hits;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& p : events_) {
            for (const auto& a : p.second.attendees) {
                if (a.user_id == user_id) { hits.emplace_back(a.registered_at, p.first); break; }
            }
        }
    }
    std::sort(hits.begin(), hits.end());
    std::vector<std::string> ids;
    ids.reserve(hits.size());
    for (auto& h : hits) ids.push_back(std::move(h.second));
    boost::asio::post(ioc_, [cb = std::move(cb), ids = std::move(ids)]() mutable {
        cb(boost::system::error_code{}, std::move(ids));
    });
}

std::vector<EventSnapshot> parse_seed_events(const std::string& text) {
    std::vector<EventSnapshot> out;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        std::string item = comma == std::string::npos ? text.substr(pos) : text.substr(pos, comma - pos);
        pos = comma == std::string::npos ? text.size() + 1 : comma + 1;
        if (item.empty()) continue;

        size_t c1 = item.find(':');
        size_t c2 = c1 == std::string::npos ? std::string::npos : item.find(':', c1 + 1);
        if (c2 == std::string::npos) {
            observability::log_warn("seed_event_malformed", {{"entry", item}});
            continue;
        }
        auto status = parse_event_status(std::string_view(item).substr(c1 + 1, c2 - c1 - 1));
        auto max = parse_int_strict_sv(std::string_view(item).substr(c2 + 1));
        if (c1 == 0 || !status || !max || *max <= 0) {
            observability::log_warn("seed_event_malformed", {{"entry", item}});
            continue;
        }
        EventSnapshot ev;
        ev.id = item.substr(0, c1);
        ev.status = *status;
        ev.max_attendees = *max;
        out.push_back(std::move(ev));
    }
    return out;
}

}
