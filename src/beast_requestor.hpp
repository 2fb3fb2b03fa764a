#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "requestor.hpp"
#include "util.hpp"

#include <memory>
#include <mutex>
#include <string>

#include <boost/system/error_code.hpp>

#ifdef APICORE_HAS_SSL
#include <boost/asio/ssl/context.hpp>
#endif

namespace apicore {

/// Blocking HTTP/HTTPS requestor built on Boost.Beast. Opens one connection
/// per request and never follows redirects.
class BeastRequestor : public Requestor {
public:
    /// Wire-ready body and the content type that goes with it.
    struct EncodedBody {
        std::string contentType;    // empty when no header should be sent
        std::string payload;
    };

    /// @param userAgent  Descriptive client name; "apicore/<version>" is appended.
    /// @param oauthUrl   Base URL for request paths.
    /// @throws InvalidInvocation if @p userAgent is shorter than 7 characters.
    explicit BeastRequestor(const std::string& userAgent,
                            const std::string& oauthUrl = kDefaultOauthUrl);

    HttpResponse request(const PreparedRequest& request, const Headers& headers) override;

    const std::string& oauthUrl() const override { return mOauthUrl; }

    void close() override;

    const std::string& userAgent() const { return mUserAgent; }

    void setVerbose(bool v) { mVerbose = v; }

    /// Body for @p request: multipart when files are present, otherwise
    /// form fields, raw data, or JSON in that order of precedence.
    /// @throws InvalidInvocation when raw data is combined with files.
    static EncodedBody encodeBody(const PreparedRequest& request);

    /// Map a Beast/Asio error to a transport fault. @p connecting is true
    /// while resolving, connecting or handshaking.
    static TransportFault classifyError(const boost::system::error_code& ec, bool connecting);

private:
    std::string mUserAgent;
    std::string mOauthUrl;
    bool        mVerbose = false;

#ifdef APICORE_HAS_SSL
    std::mutex                                 mSslMutex;
    std::shared_ptr<boost::asio::ssl::context> mSslContext;

    std::shared_ptr<boost::asio::ssl::context> sslContext();
#endif

    HttpResponse doHttpRequest(const UrlParts& parts,
                               const PreparedRequest& request,
                               const Headers& headers);
    HttpResponse doHttpsRequest(const UrlParts& parts,
                                const PreparedRequest& request,
                                const Headers& headers);
};

} // namespace apicore
