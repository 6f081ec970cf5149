#include <boost/asio.hpp>
#include <ctime>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "http_test_util.h"
#include "auth/Jwt.h"
#include "net/HttpServer.h"
#include "net/MiniJson.h"
#include "net/Router.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include "registration/InMemoryRosterStore.h"
#include "registration/RegistrationService.h"

using namespace registration;

static const std::string kSecret = "http-test-secret";

static void fail(const std::string& what) { std::cerr << what << std::endl; std::exit(1); }

static void expect(bool cond, const std::string& what, const HttpReply& r) {
    if (!cond) fail(what + " (code=" + std::to_string(r.code) + " body=" + r.body + ")");
}

static std::string token_for(const std::string& user) {
    auth::Claims c;
    c.sub = user;
    c.iat = static_cast<int64_t>(std::time(nullptr));
    c.exp = c.iat + 3600;
    return auth::create_jwt(c, kSecret);
}

static EventSnapshot event(const std::string& id, EventStatus st, int max) {
    EventSnapshot ev;
    ev.id = id;
    ev.status = st;
    ev.max_attendees = max;
    return ev;
}

// Every read fails, as if the database went away.
class DownStore : public RosterStore {
public:
    explicit DownStore(boost::asio::io_context& ioc) : ioc_(ioc) {}
    void async_get_event(const std::string&, GetEventCb cb) override {
        boost::asio::post(ioc_, [cb = std::move(cb)]{ cb(boost::asio::error::connection_refused, std::nullopt); });
    }
    void async_persist_roster(const std::string&, int64_t, std::vector<Attendee>, CommitCb cb) override {
        boost::asio::post(ioc_, [cb = std::move(cb)]{ cb(boost::asio::error::connection_refused, CommitStatus::Conflict); });
    }
    void async_list_registered_events(const std::string&, EventIdsCb cb) override {
        boost::asio::post(ioc_, [cb = std::move(cb)]{ cb(boost::asio::error::connection_refused, {}); });
    }
private:
    boost::asio::io_context& ioc_;
};

// Reads from the inner store; every commit times out without writing.
class StalledCommitStore : public RosterStore {
public:
    StalledCommitStore(boost::asio::io_context& ioc, std::shared_ptr<RosterStore> inner) : ioc_(ioc), inner_(std::move(inner)) {}
    void async_get_event(const std::string& event_id, GetEventCb cb) override { inner_->async_get_event(event_id, std::move(cb)); }
    void async_persist_roster(const std::string&, int64_t, std::vector<Attendee>, CommitCb cb) override {
        boost::asio::post(ioc_, [cb = std::move(cb)]{
            cb(boost::system::errc::make_error_code(boost::system::errc::timed_out), CommitStatus::Conflict);
        });
    }
    void async_list_registered_events(const std::string& user_id, EventIdsCb cb) override { inner_->async_list_registered_events(user_id, std::move(cb)); }
private:
    boost::asio::io_context& ioc_;
    std::shared_ptr<RosterStore> inner_;
};

// Server on an ephemeral port, served from its own thread.
struct TestServer {
    boost::asio::io_context ioc;
    Router router;
    std::unique_ptr<HttpServer> server;
    std::thread thread;

    void start(std::shared_ptr<RosterStore> store) {
        router.add_route("GET", "/health", [](const Request& req) {
            Response res{boost::beast::http::status::ok, req.version()};
            res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
            res.body() = "{\"status\":\"ok\"}";
            res.prepare_payload();
            return res;
        });
        router.add_route("GET", "/metrics", [](const Request& req) {
            Response res{boost::beast::http::status::ok, req.version()};
            res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
            res.body() = observability::Metrics::instance().scrape();
            res.prepare_payload();
            return res;
        });
        auto svc = std::make_shared<RegistrationService>(ioc, std::move(store), RetryPolicy{3, 0, 0});
        server = std::make_unique<HttpServer>(ioc, 0, router, true, false, svc, nullptr, kSecret);
        server->run();
        thread = std::thread([this]{ ioc.run(); });
    }

    unsigned short port() const { return server->port(); }

    ~TestServer() {
        ioc.stop();
        if (thread.joinable()) thread.join();
    }
};

int main() {
    observability::set_log_level(4);

    {
        TestServer ts;
        auto store = std::make_shared<InMemoryRosterStore>(ts.ioc);
        store->put_event(event("tiny", EventStatus::Published, 1));
        store->put_event(event("open", EventStatus::Published, 5));
        store->put_event(event("draft", EventStatus::Draft, 10));
        ts.start(store);
        const unsigned short port = ts.port();
        const std::string alice = token_for("alice");
        const std::string bob = token_for("bob");

        auto r = request(port, "GET", "/health");
        expect(r.code == 200, "health", r);

        r = request(port, "POST", "/events/tiny/register");
        expect(r.code == 401 && json_extract_string(r.body, "error") == "unauthorized", "missing token should be 401", r);
        r = request(port, "POST", "/events/tiny/register", "", token_for("alice") + "x");
        expect(r.code == 401, "tampered token should be 401", r);
        auth::Claims expired{"alice", 1000, 2000};
        r = request(port, "POST", "/events/tiny/register", "", auth::create_jwt(expired, kSecret));
        expect(r.code == 401, "expired token should be 401", r);

        r = request(port, "POST", "/events/tiny/register", "", alice);
        expect(r.code == 200, "alice register", r);
        expect(json_extract_string(r.body, "message") == "Successfully registered for event", "register message", r);
        expect(r.body.find("\"available_spots\":0") != std::string::npos, "register should return updated event", r);
        expect(r.body.find("\"user_id\":\"alice\"") != std::string::npos, "roster should list alice", r);

        r = request(port, "POST", "/events/tiny/register", "", alice);
        expect(r.code == 400 && json_extract_string(r.body, "error") == "already_registered", "duplicate register", r);
        expect(json_extract_string(r.body, "message") == "Already registered for this event", "duplicate message", r);

        r = request(port, "POST", "/events/tiny/register", "", bob);
        expect(r.code == 400 && json_extract_string(r.body, "error") == "full", "full event", r);

        r = request(port, "POST", "/events/draft/register", "", bob);
        expect(r.code == 400 && json_extract_string(r.body, "error") == "not_available", "draft event", r);

        r = request(port, "POST", "/events/missing/register", "", bob);
        expect(r.code == 404 && json_extract_string(r.body, "error") == "not_found", "unknown event", r);

        // a broken escape in the id names no event
        r = request(port, "POST", "/events/open%ZZ/register", "", bob);
        expect(r.code == 404, "bad escape in event id should be 404", r);
        r = request(port, "POST", "/events/open%/register", "", bob);
        expect(r.code == 404, "truncated escape in event id should be 404", r);
        r = request(port, "DELETE", "/events/open%4/register", "", bob);
        expect(r.code == 404, "short escape in event id should be 404", r);
        r = request(port, "GET", "/events/op%65n/availability");
        expect(r.code == 200 && json_extract_string(r.body, "event_id") == "open", "valid escape should decode", r);
        if (!store->get_event_now("open")->attendees.empty()) fail("malformed ids must not touch another event");

        r = request(port, "GET", "/events/tiny/availability");
        expect(r.code == 200, "availability", r);
        expect(r.body.find("\"is_full\":true") != std::string::npos && r.body.find("\"attendee_count\":1") != std::string::npos,
               "availability counts", r);
        expect(r.body.find("attendees\":[") == std::string::npos, "availability should not list attendees", r);

        r = request(port, "GET", "/events/tiny/attendees?verbose=1");
        expect(r.code == 200 && r.body.find("\"user_id\":\"alice\"") != std::string::npos, "attendees listing", r);
        expect(r.body.find("\"version\":1") != std::string::npos, "attendees version", r);

        r = request(port, "POST", "/events/open/register", "", alice);
        expect(r.code == 200, "alice second event", r);
        r = request(port, "GET", "/events/registered", "", alice);
        expect(r.code == 200, "registered events", r);
        expect(r.body.find("\"tiny\"") != std::string::npos && r.body.find("\"open\"") != std::string::npos, "registered list", r);
        r = request(port, "GET", "/events/registered");
        expect(r.code == 401, "registered events needs auth", r);

        r = request(port, "DELETE", "/events/tiny/register", "", alice);
        expect(r.code == 200 && json_extract_string(r.body, "message") == "Successfully unregistered from event", "unregister", r);
        expect(r.body.find("\"attendee_count\":0") != std::string::npos, "unregister should return emptied roster", r);
        r = request(port, "DELETE", "/events/tiny/register", "", alice);
        expect(r.code == 400 && json_extract_string(r.body, "error") == "not_registered", "second unregister", r);

        r = request(port, "POST", "/events/tiny/register", "", bob);
        expect(r.code == 200, "freed spot should go to bob", r);

        r = request(port, "GET", "/events/tiny/register");
        expect(r.code == 405 && r.allow == "POST, DELETE", "GET on register should be 405", r);
        r = request(port, "POST", "/events/tiny/availability", "", alice);
        expect(r.code == 405 && r.allow == "GET", "POST on availability should be 405", r);
        r = request(port, "POST", "/health");
        expect(r.code == 405 && r.allow == "GET", "POST on health should be 405", r);
        r = request(port, "GET", "/nowhere");
        expect(r.code == 404, "unknown path", r);

        r = request(port, "OPTIONS", "/events/tiny/register");
        expect(r.code == 204, "preflight", r);

        r = request(port, "GET", "/db/health");
        expect(r.code == 200 && json_extract_string(r.body, "db") == "memory", "db health without database", r);

        for (int i = 0; i < 3; ++i) {
            r = request(port, "GET", "/scan-" + std::to_string(i));
            expect(r.code == 404, "unknown path", r);
        }

        r = request(port, "GET", "/metrics");
        expect(r.code == 200, "metrics", r);
        expect(r.body.find("path=\"/events/:id/register\"") != std::string::npos, "metrics should collapse event ids", r);
        expect(r.body.find("/events/tiny/") == std::string::npos, "metrics should not carry raw event ids", r);
        expect(r.body.find("registration_ops_total{op=\"register\",outcome=\"full\"}") != std::string::npos, "registration outcomes", r);
        expect(r.body.find("/scan-") == std::string::npos && r.body.find("/nowhere") == std::string::npos, "unknown paths should not become labels", r);
        expect(r.body.find("http_requests_total{path=\"(unmatched)\",method=\"GET\",code=\"404\"}") != std::string::npos, "unknown paths share one label", r);
        expect(r.body.find("path=\"/health\"") != std::string::npos, "known static paths keep their label", r);

        auto ev = store->get_event_now("tiny");
        if (!ev || ev->attendees.size() != 1 || ev->attendees[0].user_id != "bob") fail("tiny should end with bob only");
    }

    {
        TestServer ts;
        ts.start(std::make_shared<DownStore>(ts.ioc));
        auto r = request(ts.port(), "POST", "/events/any/register", "", token_for("alice"));
        expect(r.code == 503 && json_extract_string(r.body, "error") == "unavailable", "store outage should be 503", r);
        expect(r.retry_after == "1", "503 should carry Retry-After", r);
        r = request(ts.port(), "GET", "/events/any/availability");
        expect(r.code == 503, "availability during outage", r);
    }

    {
        TestServer ts;
        auto inner = std::make_shared<InMemoryRosterStore>(ts.ioc);
        inner->put_event(event("slow", EventStatus::Published, 5));
        ts.start(std::make_shared<StalledCommitStore>(ts.ioc, inner));
        auto r = request(ts.port(), "POST", "/events/slow/register", "", token_for("alice"));
        expect(r.code == 503 && json_extract_string(r.body, "error") == "unavailable", "commit timeout should be 503", r);
        expect(r.retry_after == "1", "commit timeout should carry Retry-After", r);
        auto ev = inner->get_event_now("slow");
        if (!ev || ev->version != 0 || !ev->attendees.empty()) fail("commit timeout changed the roster");
    }

    std::cout << "http_registration_unit ok\n";
    return 0;
}
