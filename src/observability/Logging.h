#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
// Emitted in the order given, after ts/level/msg.
using Fields = std::vector<std::pair<std::string, FieldValue>>;

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

// 1=DEBUG 2=INFO 3=WARN 4=ERROR
void set_log_level(int level);
int log_level();

}
