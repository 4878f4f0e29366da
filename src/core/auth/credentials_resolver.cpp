/**
 * @file credentials_resolver.cpp
 */

#include "core/auth/credentials_resolver.h"
#include <cstdlib>

namespace tradecast::auth {

namespace {
inline std::string getenv_string(const char* key) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return {};
}

inline std::string trim_ascii(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
} // namespace

ResolvedUpstream resolve_upstream(const std::string& cli_ws_url,
                                  const std::string& cli_api_token,
                                  const std::string& default_ws_url) {
    ResolvedUpstream out{};

    // CLI takes precedence, else environment, else the built-in endpoint.
    out.ws_url = trim_ascii(cli_ws_url);
    if (out.ws_url.empty()) {
        out.ws_url = trim_ascii(getenv_string(kEnvWsUrl));
    }
    if (out.ws_url.empty()) {
        out.ws_url = default_ws_url;
    }

    std::string token = trim_ascii(cli_api_token);
    if (token.empty()) {
        token = trim_ascii(getenv_string(kEnvApiToken));
    }
    if (!token.empty()) {
        out.api_token = token;
    }

    return out;
}

} // namespace tradecast::auth
