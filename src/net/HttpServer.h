#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include "../db/DbPool.h"
#include "../registration/RegistrationService.h"
#include <memory>
#include <string>

// Static routes go through the Router; /events/{id}/... and /db/health are
// handled asynchronously by the session. A null db means the process runs on
// the in-memory roster store.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
               std::shared_ptr<registration::RegistrationService> registrations,
               std::shared_ptr<db::DbPool> db = nullptr, const std::string& jwt_secret = "");
    void run();
    // Bound port; differs from the requested one when that was 0.
    unsigned short port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::shared_ptr<registration::RegistrationService> registrations_;
    std::shared_ptr<db::DbPool> db_;
    std::string jwt_secret_;
};
