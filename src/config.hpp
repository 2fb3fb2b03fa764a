#pragma once

#include <string>

namespace apicore {

inline constexpr const char* kVersion = "0.1.0";

inline constexpr const char* kDefaultOauthUrl = "https://oauth.reddit.com";
inline constexpr double      kDefaultTimeoutSeconds = 16.0;
inline constexpr int         kDefaultRetries = 3;

/// Settings shared by the CLI and by callers wiring a Session by hand.
struct ClientConfig {
    std::string oauthUrl    = kDefaultOauthUrl;
    std::string userAgent;
    std::string accessToken;
    double      timeout     = kDefaultTimeoutSeconds;   // seconds, per transport call
    int         retries     = kDefaultRetries;          // total attempts per logical request
    bool        verbose     = false;
};

/// Overlay APICORE_OAUTH_URL, APICORE_USER_AGENT, APICORE_ACCESS_TOKEN,
/// APICORE_TIMEOUT and APICORE_RETRIES on top of @p base.
/// Throws std::invalid_argument when a numeric variable does not parse
/// or is out of range.
ClientConfig loadConfigFromEnv(ClientConfig base = ClientConfig());

} // namespace apicore
