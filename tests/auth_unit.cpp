#include <iostream>
#include <string>
#include <optional>
#include <ctime>
#include "auth/Jwt.h"

int main() {
    auth::Claims c;
    c.sub = "u1";
    c.iat = 1700000000;
    c.exp = 4000000000;
    const std::string secret = "secret";
    std::string token;
    try {
        token = auth::create_jwt(c, secret);
    } catch (const std::exception& e) {
        std::cerr << "create_jwt threw: " << e.what() << '\n';
        return 1;
    }
    auto ok = auth::verify_jwt(token, secret);
    if (!ok.has_value()) { std::cerr << "verify_jwt(valid) failed\n"; return 1; }
    if (ok->sub != c.sub) { std::cerr << "verify_jwt: sub mismatch\n"; return 1; }
    if (ok->exp != c.exp) { std::cerr << "verify_jwt: exp mismatch\n"; return 1; }

    if (auth::verify_jwt(token, "wrongsecret").has_value()) { std::cerr << "verify_jwt(wrongsecret) unexpectedly succeeded\n"; return 1; }

    std::string corrupted = token;
    size_t last_dot = corrupted.rfind('.');
    if (last_dot == std::string::npos || last_dot + 1 >= corrupted.size()) { std::cerr << "token format unexpected\n"; return 1; }
    corrupted[last_dot + 1] = corrupted[last_dot + 1] == 'A' ? 'B' : 'A';
    if (auth::verify_jwt(corrupted, secret).has_value()) { std::cerr << "verify_jwt(corrupted sig) unexpectedly succeeded\n"; return 1; }

    auth::Claims c_exp = c;
    c_exp.exp = c_exp.iat - 10;
    if (auth::verify_jwt(auth::create_jwt(c_exp, secret), secret).has_value()) { std::cerr << "verify_jwt(expired) unexpectedly succeeded\n"; return 1; }

    // user ids with characters that need escaping survive the round trip
    auth::Claims c_odd = c;
    c_odd.sub = "user \"quoted\" \\ id";
    auto odd = auth::verify_jwt(auth::create_jwt(c_odd, secret), secret);
    if (!odd || odd->sub != c_odd.sub) { std::cerr << "verify_jwt: escaped sub mismatch\n"; return 1; }

    auth::Claims c_nosub = c;
    c_nosub.sub.clear();
    if (auth::verify_jwt(auth::create_jwt(c_nosub, secret), secret).has_value()) { std::cerr << "verify_jwt(empty sub) unexpectedly succeeded\n"; return 1; }

    if (auth::verify_jwt("abc.def", secret).has_value()) { std::cerr << "verify_jwt(malformed 2-part) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt("abc", secret).has_value()) { std::cerr << "verify_jwt(malformed 1-part) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt("", secret).has_value()) { std::cerr << "verify_jwt(empty) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt(token + ".extra", secret).has_value()) { std::cerr << "verify_jwt(4-part) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt(token + "*", secret).has_value()) { std::cerr << "verify_jwt(bad alphabet) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt(std::string(9000, 'a'), secret).has_value()) { std::cerr << "verify_jwt(oversized) unexpectedly succeeded\n"; return 1; }

    // a payload swapped in from another token keeps the old signature
    auth::Claims other = c;
    other.sub = "intruder";
    std::string other_token = auth::create_jwt(other, secret);
    size_t d1 = token.find('.'), d2 = token.rfind('.');
    size_t o1 = other_token.find('.'), o2 = other_token.rfind('.');
    std::string spliced = token.substr(0, d1 + 1) + other_token.substr(o1 + 1, o2 - o1 - 1) + token.substr(d2);
    if (auth::verify_jwt(spliced, secret).has_value()) { std::cerr << "verify_jwt(spliced payload) unexpectedly succeeded\n"; return 1; }

    auth::Claims future = c;
    future.iat = static_cast<int64_t>(std::time(nullptr)) + 3600;
    if (auth::verify_jwt(auth::create_jwt(future, secret), secret).has_value()) { std::cerr << "verify_jwt(iat in future) unexpectedly succeeded\n"; return 1; }

    std::cout << "auth_unit ok\n";
    return 0;
}
