#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

namespace {

std::atomic<int> g_level{2};
std::mutex g_out_mu;

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

void append_escaped(std::string& out, const std::string& s) {
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
}

struct ValueWriter {
    std::string& out;
    void operator()(const std::string& v) const { out += '"'; append_escaped(out, v); out += '"'; }
    void operator()(int64_t v) const { out += std::to_string(v); }
    void operator()(double v) const {
        std::ostringstream tmp;
        tmp << std::fixed << std::setprecision(3) << v;
        out += tmp.str();
    }
};

void write_line(int level, const std::string& msg, const Fields& fields) {
    if (level < g_level.load()) return;
    std::string line;
    line.reserve(64 + msg.size() + fields.size() * 24);
    line += "{\"ts\":";
    line += std::to_string(now_ms());
    line += ",\"level\":\"";
    line += kLevelNames[std::clamp(level, 1, 4) - 1];
    line += "\",\"msg\":\"";
    append_escaped(line, msg);
    line += '"';
    for (const auto& f : fields) {
        line += ",\"";
        append_escaped(line, f.first);
        line += "\":";
        std::visit(ValueWriter{line}, f.second);
    }
    line += "}\n";
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cout << line << std::flush;
}

}

void set_log_level(int level) { g_level = std::clamp(level, 1, 4); }
int log_level() { return g_level; }

void log_debug(const std::string& msg, const Fields& fields) { write_line(1, msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { write_line(2, msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { write_line(3, msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { write_line(4, msg, fields); }

}
