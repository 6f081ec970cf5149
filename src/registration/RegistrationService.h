#pragma once

#include "Roster.h"
#include "RosterStore.h"
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace registration {

struct RegistrationResult {
    RegistrationError error = RegistrationError::None;
    RosterView roster;
    int attempts = 0;
    bool ok() const { return error == RegistrationError::None; }
};

using RegistrationCb = std::function<void(RegistrationResult)>;
using RegisteredEventsCb = std::function<void(RegistrationError, std::vector<std::string>)>;

struct RetryPolicy {
    int max_attempts = 5;
    int base_backoff_ms = 5;
    int max_backoff_ms = 200;
};

// Register/unregister with per-event linearizability. Each attempt reads a
// snapshot, validates it and commits conditionally on the snapshot version;
// a lost race re-runs the whole attempt. Only commit conflicts are retried.
class RegistrationService : public std::enable_shared_from_this<RegistrationService> {
public:
    RegistrationService(boost::asio::io_context& ioc, std::shared_ptr<RosterStore> store, RetryPolicy policy = {});

    void async_register(std::string event_id, std::string user_id, RegistrationCb cb);
    void async_unregister(std::string event_id, std::string user_id, RegistrationCb cb);

    // IsFull / AvailableSpots, from a single snapshot.
    void async_availability(std::string event_id, RegistrationCb cb);

    void async_registered_events(std::string user_id, RegisteredEventsCb cb);

    const RetryPolicy& policy() const { return policy_; }

private:
    enum class Op { Register, Unregister };
    struct Attempt {
        Op op;
        std::string event_id;
        std::string user_id;
        RegistrationCb cb;
        int attempts = 0;
    };

    void start(std::shared_ptr<Attempt> a);
    void on_snapshot(std::shared_ptr<Attempt> a, const boost::system::error_code& ec, std::optional<EventSnapshot> snap);
    void on_commit(std::shared_ptr<Attempt> a, EventSnapshot next, const boost::system::error_code& ec, CommitStatus st);
    void retry_later(std::shared_ptr<Attempt> a);
    void finish(std::shared_ptr<Attempt> a, RegistrationError err, RosterView view = {});
    int backoff_ms(int attempt) const;

    boost::asio::io_context& ioc_;
    std::shared_ptr<RosterStore> store_;
    RetryPolicy policy_;
};

}
