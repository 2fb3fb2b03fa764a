#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace apicore {

namespace {

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return nullptr;
    }
    return value;
}

double parsePositiveDouble(const char* name, const std::string& text) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + text);
    }
    if (consumed != text.size() || value <= 0.0) {
        throw std::invalid_argument(std::string(name) + " must be a positive number: " + text);
    }
    return value;
}

int parsePositiveInt(const char* name, const std::string& text) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + text);
    }
    if (consumed != text.size() || value < 1) {
        throw std::invalid_argument(std::string(name) + " must be at least 1: " + text);
    }
    return value;
}

} // namespace

ClientConfig loadConfigFromEnv(ClientConfig base) {
    if (const char* v = envValue("APICORE_OAUTH_URL")) {
        base.oauthUrl = v;
    }
    if (const char* v = envValue("APICORE_USER_AGENT")) {
        base.userAgent = v;
    }
    if (const char* v = envValue("APICORE_ACCESS_TOKEN")) {
        base.accessToken = v;
    }
    if (const char* v = envValue("APICORE_TIMEOUT")) {
        base.timeout = parsePositiveDouble("APICORE_TIMEOUT", v);
    }
    if (const char* v = envValue("APICORE_RETRIES")) {
        base.retries = parsePositiveInt("APICORE_RETRIES", v);
    }
    return base;
}

} // namespace apicore
