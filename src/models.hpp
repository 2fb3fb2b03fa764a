#pragma once

#include "config.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace apicore {

/// Orders header names without regard to ASCII case.
struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

/// Raw HTTP response as handed back by a Requestor.
struct HttpResponse {
    unsigned int status = 0;
    Headers      headers;
    std::string  body;
    std::string  url;       // absolute URL of the request this answers
};

/// One part of a multipart upload.
struct FileUpload {
    std::string filename;
    std::string contentType = "application/octet-stream";
    std::string content;
};

using FileMap    = std::map<std::string, FileUpload>;
using FormFields = std::vector<std::pair<std::string, nlohmann::json>>;

/// Caller-facing inputs of Session::request. Taken by const reference and
/// never modified.
struct RequestOptions {
    /// Object: form-encoded after normalization. String: raw body, sent as-is.
    std::optional<nlohmann::json> data;
    FileMap                       files;
    std::optional<nlohmann::json> json;
    nlohmann::json                params = nlohmann::json::object();
    std::chrono::duration<double> timeout{kDefaultTimeoutSeconds};
};

/// Normalized request, built once per logical request and reused by every
/// attempt.
struct PreparedRequest {
    std::string                   method;
    std::string                   url;
    nlohmann::json                params = nlohmann::json::object();
    std::optional<FormFields>     data;       // sorted by key
    std::optional<std::string>    rawData;
    FileMap                       files;
    std::optional<nlohmann::json> json;
    std::chrono::duration<double> timeout{kDefaultTimeoutSeconds};
};

} // namespace apicore
