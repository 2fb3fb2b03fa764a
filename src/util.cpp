#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <stdexcept>
#include <thread>

namespace apicore {

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    if (pathStart == std::string::npos) {
        parts.authority = url.substr(hostStart);
        parts.target    = "/";
    } else {
        parts.authority = url.substr(hostStart, pathStart - hostStart);
        parts.target    = url.substr(pathStart);
        if (parts.target[0] != '/') {
            parts.target.insert(0, "/");
        }
    }

    // Fragments never go on the wire.
    auto fragment = parts.target.find('#');
    if (fragment != std::string::npos) {
        parts.target.erase(fragment);
    }

    // --- host / port ---
    auto colon = parts.authority.find(':');
    if (colon == std::string::npos) {
        parts.host = parts.authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = parts.authority.substr(0, colon);
        parts.port = parts.authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

// ---------------------------------------------------------------------------
// URL joining
// ---------------------------------------------------------------------------

namespace {

bool hasScheme(const std::string& reference) {
    auto schemeEnd = reference.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return false;
    }
    return reference.find_first_of("/?#") > schemeEnd;
}

std::string removeDotSegments(const std::string& path) {
    std::vector<std::string> output;
    std::size_t start = 1;  // path always begins with '/'

    while (start <= path.size()) {
        auto slash = path.find('/', start);
        bool last = (slash == std::string::npos);
        std::string segment = path.substr(start, last ? std::string::npos : slash - start);

        if (segment == ".") {
            if (last) output.emplace_back();
        } else if (segment == "..") {
            if (!output.empty()) output.pop_back();
            if (last) output.emplace_back();
        } else {
            output.push_back(segment);
        }

        if (last) break;
        start = slash + 1;
    }

    std::string result;
    for (const auto& segment : output) {
        result += '/';
        result += segment;
    }
    return result.empty() ? "/" : result;
}

} // namespace

std::string resolveUrl(const std::string& base, const std::string& reference) {
    if (reference.empty()) {
        return base;
    }
    if (hasScheme(reference)) {
        return reference;
    }

    const UrlParts parts = parseUrl(base);
    if (reference.compare(0, 2, "//") == 0) {
        return parts.scheme + ":" + reference;
    }

    const std::string origin = parts.scheme + "://" + parts.authority;
    const std::string basePath = parts.target.substr(0, parts.target.find('?'));

    if (reference[0] == '?') {
        return origin + basePath + reference;
    }
    if (reference[0] == '#') {
        return origin + parts.target + reference;
    }

    auto suffixStart = reference.find_first_of("?#");
    std::string refPath = reference.substr(0, suffixStart);
    std::string suffix  = suffixStart == std::string::npos ? "" : reference.substr(suffixStart);

    if (refPath[0] != '/') {
        refPath = basePath.substr(0, basePath.rfind('/') + 1) + refPath;
    }
    return origin + removeDotSegments(refPath) + suffix;
}

std::string urlPath(const std::string& url) {
    std::string rest = url;
    if (hasScheme(url)) {
        auto hostStart = url.find("://") + 3;
        auto pathStart = url.find_first_of("/?#", hostStart);
        rest = pathStart == std::string::npos ? "" : url.substr(pathStart);
    }
    return rest.substr(0, rest.find_first_of("?#"));
}

// ---------------------------------------------------------------------------
// Form / query encoding
// ---------------------------------------------------------------------------

std::string formEscape(const std::string& text) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string jsonToParam(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string encodeForm(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out += '&';
        out += formEscape(key);
        out += '=';
        out += formEscape(value);
    }
    return out;
}

std::string encodeQuery(const nlohmann::json& params) {
    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& item : params.items()) {
        if (item.value().is_null()) {
            continue;
        }
        if (item.value().is_array()) {
            for (const auto& element : item.value()) {
                fields.emplace_back(item.key(), jsonToParam(element));
            }
        } else {
            fields.emplace_back(item.key(), jsonToParam(item.value()));
        }
    }
    return encodeForm(fields);
}

// ---------------------------------------------------------------------------
// Timing helpers
// ---------------------------------------------------------------------------

void sleepFor(std::chrono::duration<double> duration) {
    if (duration.count() > 0.0) {
        std::this_thread::sleep_for(
            std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
    }
}

double randomUniform(double max) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, max);
    return dist(rng);
}

} // namespace apicore
