#pragma once

#include "models.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace apicore {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;     // "http" or "https"
    std::string host;
    std::string port;       // "80", "443", "4000", etc.
    std::string authority;  // host[:port] exactly as written
    std::string target;     // path plus query (e.g. "/api/v1/me?raw_json=1")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Resolve @p reference against @p base the way a browser resolves a link:
/// absolute references win, "/x" replaces the path, "x" replaces the last
/// path segment, and dot segments are collapsed.
std::string resolveUrl(const std::string& base, const std::string& reference);

/// Path component of @p url (no query or fragment). Accepts relative URLs.
std::string urlPath(const std::string& url);

/// application/x-www-form-urlencoded escaping of a single key or value.
std::string formEscape(const std::string& text);

/// Text form of a JSON value as sent in a query string or form body.
std::string jsonToParam(const nlohmann::json& value);

/// Encode key/value pairs as "k1=v1&k2=v2" preserving order.
std::string encodeForm(const std::vector<std::pair<std::string, std::string>>& fields);

/// Encode a JSON object's members as a query string.
std::string encodeQuery(const nlohmann::json& params);

/// Blocking wait used for retry backoff and rate limiting.
using Sleeper = std::function<void(std::chrono::duration<double>)>;

/// Default Sleeper: std::this_thread::sleep_for.
void sleepFor(std::chrono::duration<double> duration);

/// Uniform random value in [0, max), thread-local engine.
double randomUniform(double max);

} // namespace apicore
