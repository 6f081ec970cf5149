#include <boost/asio.hpp>
#include <iostream>
#include <string>
#include <memory>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "registration/InMemoryRosterStore.h"
#include "registration/PgRosterStore.h"
#include "registration/RegistrationService.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(cfg.log_level_number());

    if (cfg.jwt_secret.empty()) {
        std::cerr << "fatal: JWT_SECRET environment variable is not set\n";
        return 2;
    }

    try {
        boost::asio::io_context io;

        Router router;
        router.add_route("GET", "/health", [](const Request& req) {
            Response res{boost::beast::http::status::ok, req.version()};
            res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
            res.keep_alive(req.keep_alive());
            res.body() = "{\"status\":\"ok\"}";
            res.prepare_payload();
            return res;
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                Response res{boost::beast::http::status::ok, req.version()};
                res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
                res.keep_alive(req.keep_alive());
                res.body() = observability::Metrics::instance().scrape();
                res.prepare_payload();
                return res;
            });
        }

        std::shared_ptr<db::DbPool> dbpool;
        std::shared_ptr<registration::RosterStore> store;
        if (!cfg.database_url.empty()) {
            dbpool = std::make_shared<db::DbPool>(io, cfg.database_url, cfg.db_workers, cfg.db_statement_timeout_ms);
            store = std::make_shared<registration::PgRosterStore>(dbpool);
        } else {
            log_warn("db_not_configured", {{"store", std::string("memory")}});
            auto mem = std::make_shared<registration::InMemoryRosterStore>(io);
            for (auto& ev : registration::parse_seed_events(cfg.seed_events)) {
                log_info("seed_event", {{"event_id", ev.id}, {"max_attendees", int64_t(ev.max_attendees)}});
                mem->put_event(std::move(ev));
            }
            store = mem;
        }

        registration::RetryPolicy policy;
        policy.max_attempts = cfg.registration_max_attempts;
        policy.base_backoff_ms = cfg.registration_backoff_ms;
        policy.max_backoff_ms = cfg.registration_max_backoff_ms;
        auto registrations = std::make_shared<registration::RegistrationService>(io, store, policy);

        HttpServer server(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log, registrations, dbpool, cfg.jwt_secret);
        log_info("server_start", {{"port", int64_t(server.port())}, {"db_workers", int64_t(cfg.db_workers)},
                                  {"max_attempts", int64_t(policy.max_attempts)}});
        server.run();
        io.run();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
