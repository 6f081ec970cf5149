#include "Router.h"
#include <boost/beast/http.hpp>

namespace http = boost::beast::http;

void Router::add_route(std::string method, std::string path, Handler h) {
    Key k{std::move(method), std::move(path)};
    if (routes_.find(k) == routes_.end()) order_.push_back(k);
    routes_[std::move(k)] = std::move(h);
}

std::vector<std::string> Router::methods_for(const std::string& path) const {
    std::vector<std::string> out;
    for (const auto& k : order_) if (k.path == path) out.push_back(k.method);
    return out;
}

static Response json_reply(const Request& req, http::status st, const char* body) {
    Response res{st, req.version()};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

Response Router::route(const Request& req) const {
    std::string path(req.target());
    auto q = path.find('?');
    if (q != std::string::npos) path.erase(q);

    auto it = routes_.find(Key{std::string(req.method_string()), path});
    if (it != routes_.end()) return it->second(req);

    auto methods = methods_for(path);
    if (methods.empty()) return json_reply(req, http::status::not_found, "{\"error\":\"not found\"}");
    auto res = json_reply(req, http::status::method_not_allowed, "{\"error\":\"method not allowed\"}");
    std::string allow;
    for (const auto& m : methods) {
        if (!allow.empty()) allow += ", ";
        allow += m;
    }
    res.set(http::field::allow, allow);
    return res;
}
