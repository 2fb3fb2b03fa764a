#pragma once

#include "models.hpp"

#include <string>

namespace apicore {

/// Performs one HTTP exchange. Implementations never follow redirects and
/// report network failures as RequestException.
class Requestor {
public:
    virtual ~Requestor() = default;

    /// Send @p request with @p headers added and return whatever the server
    /// answered, whatever the status.
    virtual HttpResponse request(const PreparedRequest& request, const Headers& headers) = 0;

    /// Base URL request paths are resolved against.
    virtual const std::string& oauthUrl() const = 0;

    /// Release connection resources.
    virtual void close() = 0;
};

} // namespace apicore
