#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

// Exact-match routing on (method, path). The query string is ignored.
class Router {
public:
    using Handler = std::function<Response(const Request&)>;
    void add_route(std::string method, std::string path, Handler h);
    Response route(const Request& req) const;
    // Methods registered for path, in the order they were added.
    std::vector<std::string> methods_for(const std::string& path) const;
private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    std::unordered_map<Key, Handler, KeyHash, KeyEq> routes_;
    std::vector<Key> order_;
};
