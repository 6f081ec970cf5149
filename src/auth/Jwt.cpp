#include "Jwt.h"
#include "../net/MiniJson.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <cctype>
#include <ctime>
#include <sstream>
#include <string>
#include <string_view>

namespace {

const char* const kHeader = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";
const size_t kMaxTokenSize = 8 * 1024;
const int64_t kIatSkewSeconds = 60;

std::string base64url_encode(const std::string& in) {
    std::string out(4 * ((in.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

// nullopt on characters outside the url-safe alphabet or an impossible length.
std::optional<std::string> base64url_decode(std::string_view in) {
    if (in.size() % 4 == 1) return std::nullopt;
    std::string s;
    s.reserve(in.size() + 3);
    for (char c : in) {
        if (std::isalnum(static_cast<unsigned char>(c))) s.push_back(c);
        else if (c == '-') s.push_back('+');
        else if (c == '_') s.push_back('/');
        else return std::nullopt;
    }
    size_t pad = (4 - s.size() % 4) % 4;
    s.append(pad, '=');
    std::string out(s.size() / 4 * 3, '\0');
    if (s.empty()) return out;
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(s.data()), static_cast<int>(s.size()));
    if (n < 0 || static_cast<size_t>(n) < pad) return std::nullopt;
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned int len = EVP_MAX_MD_SIZE;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len);
    return std::string(reinterpret_cast<char*>(md), len);
}

}

namespace auth {

std::string create_jwt(const Claims& c, const std::string& secret) {
    std::ostringstream payload;
    payload << "{\"sub\":\"" << json_escape_resp(c.sub) << "\",\"iat\":" << c.iat << ",\"exp\":" << c.exp << "}";
    std::string signing_input = base64url_encode(kHeader) + "." + base64url_encode(payload.str());
    return signing_input + "." + base64url_encode(hmac_sha256(secret, signing_input));
}

std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret) {
    if (token.empty() || token.size() > kMaxTokenSize) return std::nullopt;
    size_t p1 = token.find('.');
    if (p1 == std::string::npos) return std::nullopt;
    size_t p2 = token.find('.', p1 + 1);
    if (p2 == std::string::npos || token.find('.', p2 + 1) != std::string::npos) return std::nullopt;

    const std::string signing_input = token.substr(0, p2);
    auto sig = base64url_decode(std::string_view(token).substr(p2 + 1));
    if (!sig) return std::nullopt;
    const std::string expected = hmac_sha256(secret, signing_input);
    if (sig->size() != expected.size()) return std::nullopt;
    if (CRYPTO_memcmp(sig->data(), expected.data(), expected.size()) != 0) return std::nullopt;

    auto header = base64url_decode(std::string_view(token).substr(0, p1));
    auto payload = base64url_decode(std::string_view(token).substr(p1 + 1, p2 - p1 - 1));
    if (!header || !payload) return std::nullopt;

    Claims cl;
    try {
        if (json_extract_string(*header, "alg") != "HS256") return std::nullopt;
        auto typ = json_extract_string(*header, "typ");
        if (!typ.empty() && typ != "JWT") return std::nullopt;
        cl.sub = json_extract_string(*payload, "sub");
        cl.iat = json_extract_int_opt(*payload, "iat").value_or(0);
        cl.exp = json_extract_int_opt(*payload, "exp").value_or(0);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (cl.sub.empty()) return std::nullopt;
    const int64_t now = static_cast<int64_t>(std::time(nullptr));
    if (cl.exp != 0 && now > cl.exp) return std::nullopt;
    if (cl.iat != 0 && cl.iat > now + kIatSkewSeconds) return std::nullopt;
    return cl;
}

}
