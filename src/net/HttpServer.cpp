#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "RegistrationJson.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "../auth/Jwt.h"
#include <optional>
#include <boost/beast/http.hpp>
#include <chrono>
#include <algorithm>
#include <array>


// nullopt on a truncated or non-hex escape.
static std::optional<std::string> url_decode(std::string_view s) {
    auto hex = [](char h) -> int {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    };
    std::string out; out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c != '%') { out.push_back(c); continue; }
        if (i + 2 >= s.size()) return std::nullopt;
        int hi = hex(s[i+1]); int lo = hex(s[i+2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(char((hi << 4) | lo)); i += 2;
    }
    return out;
}

enum class EventAction { Register, Availability, Attendees };

struct EventRoute {
    std::string event_id;
    EventAction action = EventAction::Register;
};

// /events/{id}/register|availability|attendees
static std::optional<EventRoute> parse_event_route(const std::string& path) {
    static const std::string prefix = "/events/";
    if (path.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    size_t slash = path.find('/', prefix.size());
    if (slash == std::string::npos || slash == prefix.size()) return std::nullopt;
    EventRoute r;
    auto id = url_decode(std::string_view(path).substr(prefix.size(), slash - prefix.size()));
    if (!id || id->empty()) return std::nullopt;
    r.event_id = std::move(*id);
    std::string rest = path.substr(slash + 1);
    if (rest == "register") r.action = EventAction::Register;
    else if (rest == "availability") r.action = EventAction::Availability;
    else if (rest == "attendees") r.action = EventAction::Attendees;
    else return std::nullopt;
    return r;
}

// Collapses event ids and unknown paths so the metrics label set stays bounded.
// Labels in parentheses come from requests rejected before routing.
static std::string metrics_path(const std::string& path, const Router& router) {
    if (auto route = parse_event_route(path)) {
        switch (route->action) {
            case EventAction::Register: return "/events/:id/register";
            case EventAction::Availability: return "/events/:id/availability";
            case EventAction::Attendees: return "/events/:id/attendees";
        }
    }
    if (!path.empty() && path.front() == '(') return path;
    if (path == "/db/health" || path == "/events/registered") return path;
    if (!router.methods_for(path).empty()) return path;
    return "(unmatched)";
}

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using registration::RegistrationError;
using registration::RegistrationResult;

static const char* kJsonContentType = "application/json; charset=utf-8";

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::shared_ptr<registration::RegistrationService> registrations;
    std::shared_ptr<db::DbPool> db;
    std::string jwt_secret;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al,
            std::shared_ptr<registration::RegistrationService> regs, std::shared_ptr<db::DbPool> dbp, std::string secret)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al),
          registrations(std::move(regs)), db(std::move(dbp)), jwt_secret(std::move(secret)) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(8 * 1024);
        parser->body_limit(1 * 1024 * 1024);

        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            boost::system::error_code ignored_cancel; self->read_timer.cancel(ignored_cancel);

            if (ec) {
                if (ec == http::error::end_of_stream) {
                    self->close_socket();
                    return;
                }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", true, "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            auto& hdr_req = parser->get();
            self->http_version = hdr_req.version();
            std::size_t content_len = 0;
            auto it = hdr_req.find(http::field::content_length);
            if (it != hdr_req.end()) {
                try { content_len = std::stoul(std::string(it->value())); } catch (const std::exception&) { content_len = 0; }
            }

            const std::size_t MAX_PARSER_BODY = 1 * 1024 * 1024;
            if (content_len > MAX_PARSER_BODY) {
                observability::log_info("oversized_body_header", {{"path", std::string("(header)")}, {"len", int64_t(content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", true, "(body)");
                return;
            }

            if (content_len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (content_len <= 128*1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                boost::system::error_code ignored_cancel2; self->read_timer.cancel(ignored_cancel2);

                if (ec2) {
                    if (ec2 == http::error::end_of_stream) { self->close_socket(); return; }
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}", true, "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }

                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        std::string target = std::string(req.target());
        auto qpos = target.find('?');
        if (qpos != std::string::npos) target.erase(qpos);
        const std::string cleaned_target = target;
        const std::string method = std::string(req.method_string());

        if (method == "OPTIONS") {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Requested-With");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res, cleaned_target);
            return;
        }

        if (cleaned_target == "/db/health") {
            handle_db_health(cleaned_target);
            return;
        }

        if (cleaned_target == "/events/registered") {
            if (method != "GET") { reply_method_not_allowed("GET", cleaned_target); return; }
            handle_registered_events(cleaned_target);
            return;
        }

        if (auto route = parse_event_route(cleaned_target)) {
            switch (route->action) {
                case EventAction::Register:
                    if (method == "POST" || method == "DELETE") {
                        handle_registration(route->event_id, method == "POST", cleaned_target);
                        return;
                    }
                    break;
                case EventAction::Availability:
                case EventAction::Attendees:
                    if (method == "GET") {
                        handle_roster_read(route->event_id, route->action == EventAction::Availability, cleaned_target);
                        return;
                    }
                    break;
            }
            reply_method_not_allowed(route->action == EventAction::Register ? "POST, DELETE" : "GET", cleaned_target);
            return;
        }

        auto res = std::make_shared<Response>(router.route(req));
        send_response(res, cleaned_target);
    }

    void handle_db_health(const std::string& cleaned_target) {
        if (!db) {
            send_json(http::status::ok, "{\"db\":\"memory\"}", cleaned_target);
            return;
        }
        auto self = shared_from_this();
        db->async_scalar_int("SELECT 1", [self, cleaned_target](const boost::system::error_code& ec, int v) {
            if (ec || v != 1) self->send_json(http::status::internal_server_error, "{\"db\":\"down\"}", cleaned_target);
            else self->send_json(http::status::ok, "{\"db\":\"ok\"}", cleaned_target);
        });
    }

    void handle_registration(const std::string& event_id, bool registering, const std::string& cleaned_target) {
        auto claims = authenticate_bearer(req, jwt_secret);
        if (!claims) {
            send_json(http::status::unauthorized, "{\"error\":\"unauthorized\"}", cleaned_target);
            return;
        }
        auto self = shared_from_this();
        auto done = [self, registering, cleaned_target](RegistrationResult r) {
            if (!r.ok()) { self->send_registration_error(r.error, cleaned_target); return; }
            const char* msg = registering ? "Successfully registered for event" : "Successfully unregistered from event";
            self->send_json(http::status::ok, registration_success_json(msg, r.roster), cleaned_target);
        };
        if (registering) registrations->async_register(event_id, claims->sub, std::move(done));
        else registrations->async_unregister(event_id, claims->sub, std::move(done));
    }

    void handle_roster_read(const std::string& event_id, bool availability_only, const std::string& cleaned_target) {
        auto self = shared_from_this();
        registrations->async_availability(event_id, [self, availability_only, cleaned_target](RegistrationResult r) {
            if (!r.ok()) { self->send_registration_error(r.error, cleaned_target); return; }
            self->send_json(http::status::ok, availability_only ? availability_json(r.roster) : roster_view_json(r.roster), cleaned_target);
        });
    }

    void handle_registered_events(const std::string& cleaned_target) {
        auto claims = authenticate_bearer(req, jwt_secret);
        if (!claims) {
            send_json(http::status::unauthorized, "{\"error\":\"unauthorized\"}", cleaned_target);
            return;
        }
        auto self = shared_from_this();
        registrations->async_registered_events(claims->sub, [self, cleaned_target](RegistrationError err, std::vector<std::string> ids) {
            if (err != RegistrationError::None) { self->send_registration_error(err, cleaned_target); return; }
            self->send_json(http::status::ok, event_ids_json(ids), cleaned_target);
        });
    }

    void send_registration_error(RegistrationError err, const std::string& cleaned_target) {
        auto res = make_json(status_for(err), registration_error_json(err));
        if (registration::is_retryable(err)) res->set(http::field::retry_after, "1");
        send_response(res, cleaned_target);
    }

    void reply_method_not_allowed(const char* allow, const std::string& cleaned_target) {
        auto res = make_json(http::status::method_not_allowed, "{\"error\":\"method not allowed\"}");
        res->set(http::field::allow, allow);
        send_response(res, cleaned_target);
    }

    std::shared_ptr<Response> make_json(http::status st, std::string body) {
        auto res = std::make_shared<Response>(st, req.version());
        res->set(http::field::content_type, kJsonContentType);
        res->keep_alive(req.keep_alive());
        res->body() = std::move(body);
        res->prepare_payload();
        return res;
    }

    void send_json(http::status st, std::string body, const std::string& cleaned_target) {
        send_response(make_json(st, std::move(body)), cleaned_target);
    }

    void record(const Response& res, const std::string& cleaned_target) {
        const std::string method = std::string(req.method_string());
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (metrics_enabled) {
            auto path = metrics_path(cleaned_target, router);
            observability::Metrics::instance().inc(path, method, res.result_int());
            observability::Metrics::instance().observe_latency(path, method, ms);
        }
        if (access_log) {
            observability::log_info("access", {{"method", method}, {"path", cleaned_target},
                                               {"status", int64_t(res.result_int())}, {"latency_ms", ms}});
        }
    }

    void send_response(std::shared_ptr<Response> res, const std::string& cleaned_target) {
        auto self = shared_from_this();
        auto sp = std::move(res);

        if (sp->find(http::field::connection) == sp->end()) {
            sp->keep_alive(req.keep_alive());
        }
        auto it = req.find(http::field::origin);
        if (it != req.end()) sp->set(http::field::access_control_allow_origin, std::string(it->value()));
        else sp->set(http::field::access_control_allow_origin, "*");
        sp->set(http::field::access_control_allow_credentials, "true");

        record(*sp, cleaned_target);

        http::async_write(socket, *sp, [self, sp, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            observability::log_debug("drain_timer_fired", {});
            self->close_socket(false);
        });
    }

    // Reads and discards until the peer closes, so the peer sees our response
    // instead of a reset.
    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                boost::system::error_code ignored;
                self->read_timer.cancel(ignored);
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& cleaned_target) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, kJsonContentType);
        res->keep_alive(!close_conn && req.keep_alive());
        res->body() = body;
        res->prepare_payload();
        if (!close_conn) {
            send_response(res, cleaned_target);
            return;
        }
        res->set(http::field::connection, "close");
        res->set(http::field::access_control_allow_origin, "*");
        start_ts = std::chrono::steady_clock::now();
        record(*res, cleaned_target);
        http::async_write(socket, *res, [self=shared_from_this(), res, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }

    static std::optional<auth::Claims> authenticate_bearer(const Request& req, const std::string& jwt_secret) {
        auto it = req.find(http::field::authorization);
        if (it == req.end()) return std::nullopt;
        std::string v = std::string(it->value());
        const std::string prefix = "Bearer ";
        if (v.size() <= prefix.size()) return std::nullopt;
        if (v.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
        return auth::verify_jwt(v.substr(prefix.size()), jwt_secret);
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
                       std::shared_ptr<registration::RegistrationService> registrations,
                       std::shared_ptr<db::DbPool> db, const std::string& jwt_secret)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router),
      metrics_enabled_(metrics_enabled), access_log_(access_log), registrations_(std::move(registrations)),
      db_(std::move(db)), jwt_secret_(jwt_secret) {}

void HttpServer::run() { do_accept(); }

unsigned short HttpServer::port() const { return acceptor_.local_endpoint().port(); }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, registrations_, db_, jwt_secret_);
            s->run();
        } else observability::log_warn("accept_error", {{"err", int64_t(ec.value())}});

        do_accept();
    });
}
