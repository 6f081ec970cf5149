#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <vector>

namespace {

// start points to the first character after the opening '"'; returns decoded text and closing index
std::pair<std::string, size_t> decode_string(const std::string& js, size_t start) {
    const size_t n = js.size();
    std::string out;
    for (size_t i = start;; ++i) {
        if (i >= n) throw std::runtime_error("unterminated json string");
        char c = js[i];
        if (c == '"') return {out, i};
        if (c != '\\') { out.push_back(c); continue; }
        if (i + 1 >= n) throw std::runtime_error("unterminated escape in json string");
        char e = js[++i];
        switch (e) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                // BMP only
                if (i + 4 >= n) throw std::runtime_error("invalid unicode escape in json string");
                int code = 0;
                for (size_t k = i + 1; k <= i + 4; ++k) {
                    char ch = js[k];
                    code <<= 4;
                    if (ch >= '0' && ch <= '9') code += ch - '0';
                    else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
                    else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
                    else throw std::runtime_error("invalid hex in unicode escape");
                }
                if (code <= 0x7f) out.push_back((char)code);
                else if (code <= 0x7ff) {
                    out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
                    out.push_back((char)(0x80 | (code & 0x3f)));
                } else {
                    out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
                    out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
                    out.push_back((char)(0x80 | (code & 0x3f)));
                }
                i += 4;
                break;
            }
            default: throw std::runtime_error("unsupported escape in json string");
        }
    }
}

// Position of the first non-space character of the value of the first object
// key equal to `key` in document order, or npos. String values never match.
size_t find_value(const std::string& js, const std::string& key) {
    const size_t n = js.size();
    std::vector<char> stack;
    for (size_t i = 0; i < n; ++i) {
        char c = js[i];
        if (c == '"') {
            auto dec = decode_string(js, i + 1);
            size_t closing = dec.second;

            size_t before = i;
            while (before > 0 && isspace((unsigned char)js[before-1])) --before;
            bool prev_obj_or_comma = (before > 0 && (js[before-1] == '{' || js[before-1] == ','));
            size_t after = closing + 1;
            while (after < n && isspace((unsigned char)js[after])) ++after;
            bool in_object = (!stack.empty() && stack.back() == '{');

            if (in_object && prev_obj_or_comma) {
                if (after >= n || js[after] != ':') throw std::runtime_error("missing ':' after string field");
                if (dec.first == key) {
                    size_t valpos = after + 1;
                    while (valpos < n && isspace((unsigned char)js[valpos])) ++valpos;
                    if (valpos >= n) throw std::runtime_error("missing value for field");
                    return valpos;
                }
            }
            i = closing;
            continue;
        }
        if (c == '{' || c == '[') stack.push_back(c);
        else if ((c == '}' || c == ']') && !stack.empty()) stack.pop_back();
    }
    return std::string::npos;
}

}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    size_t valpos = find_value(js, key);
    if (valpos == std::string::npos) return {false, std::nullopt};
    if (js.compare(valpos, 4, "null") == 0) return {true, std::nullopt};
    if (js[valpos] != '"') throw std::runtime_error("invalid type for json string field");
    return {true, decode_string(js, valpos + 1).first};
}

std::string json_extract_string(const std::string& js, const std::string& key) {
    auto pr = json_extract_string_opt_present(js, key);
    if (!pr.first || !pr.second.has_value()) return std::string();
    return *pr.second;
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    size_t valpos = find_value(js, key);
    if (valpos == std::string::npos) return std::nullopt;
    const size_t n = js.size();
    if (js.compare(valpos, 4, "null") == 0) throw std::runtime_error("null not allowed for integer field");
    size_t end = valpos;
    if (end < n && js[end] == '-') ++end;
    while (end < n && js[end] >= '0' && js[end] <= '9') ++end;
    size_t after_tok = end;
    while (after_tok < n && isspace((unsigned char)js[after_tok])) ++after_tok;
    if (after_tok >= n || (js[after_tok] != ',' && js[after_tok] != '}')) throw std::runtime_error("invalid json int terminator");
    auto parsed = parse_int64_strict_sv(std::string_view(js).substr(valpos, end - valpos));
    if (!parsed.has_value()) throw std::runtime_error("invalid json int value");
    return parsed;
}

// escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o) {
    if (!o.has_value()) return std::nullopt;
    return parse_int64_strict_sv(std::string_view(*o));
}
