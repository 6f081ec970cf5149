#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace auth {

struct Claims {
    std::string sub;
    int64_t iat = 0;
    int64_t exp = 0;
};

// HS256 only.
std::string create_jwt(const Claims& c, const std::string& secret);

// nullopt on bad signature, malformed payload, missing sub, or expiry.
std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret);

}
