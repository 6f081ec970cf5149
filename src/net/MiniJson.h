#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <string_view>
#include <limits>
#include <utility>

// Flat-object field extraction for small payloads (JWT claims, request bodies).
// Malformed input throws std::runtime_error.

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key);
// empty string on not-found or explicit null
std::string json_extract_string(const std::string& js, const std::string& key);
std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key);

std::string json_escape_resp(const std::string& s);
std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o);

template <typename Int>
inline std::optional<Int> parse_signed_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<Int>::max()) + 1ULL) : uint64_t(std::numeric_limits<Int>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    if (!neg) return static_cast<Int>(v);
    if (v == maxAbs) return std::numeric_limits<Int>::min();
    return static_cast<Int>(-static_cast<int64_t>(v));
}

inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) { return parse_signed_strict_sv<int64_t>(s); }
inline std::optional<int> parse_int_strict_sv(std::string_view s) { return parse_signed_strict_sv<int>(s); }
