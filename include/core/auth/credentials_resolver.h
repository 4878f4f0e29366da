/**
 * @file credentials_resolver.h
 * @brief Central resolver for the upstream endpoint and API token (CLI first, then env).
 */

#pragma once

#include <optional>
#include <string>

namespace tradecast::auth {

inline constexpr const char* kEnvApiToken = "TRADECAST_API_TOKEN";
inline constexpr const char* kEnvWsUrl = "TRADECAST_WS_URL";

struct ResolvedUpstream {
    std::string ws_url;
    std::optional<std::string> api_token;   // unset when neither CLI nor env provide one
};

// Resolve upstream settings. Empty CLI values fall back to the environment, then to default_ws_url.
ResolvedUpstream resolve_upstream(const std::string& cli_ws_url,
                                  const std::string& cli_api_token,
                                  const std::string& default_ws_url);

} // namespace tradecast::auth
