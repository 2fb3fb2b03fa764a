#include "beast_requestor.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#ifdef APICORE_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <random>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace apicore {

namespace {

using RequestMessage = http::request<http::string_body>;

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string toStdString(beast::string_view view) {
    return std::string(view.data(), view.size());
}

std::string makeBoundary() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    static const char* kHex = "0123456789abcdef";
    std::uniform_int_distribution<int> digit(0, 15);

    std::string boundary = "apicore-";
    for (int i = 0; i < 24; ++i) {
        boundary += kHex[digit(rng)];
    }
    return boundary;
}

// Multipart part headers are built by concatenation; a quote or line break
// would end the quoted value or the header early.
void checkPartHeaderValue(const char* what, const std::string& value) {
    if (value.find_first_of("\"\r\n") != std::string::npos) {
        throw InvalidInvocation(std::string("multipart ") + what
                                + " must not contain quotes or line breaks: " + value);
    }
}

RequestMessage buildRequest(const UrlParts& parts,
                            const PreparedRequest& request,
                            const Headers& headers,
                            const std::string& userAgent) {
    std::string target = parts.target;
    const std::string query = encodeQuery(request.params);
    if (!query.empty()) {
        target += (target.find('?') == std::string::npos) ? '?' : '&';
        target += query;
    }

    RequestMessage req;
    req.method_string(toUpper(request.method));
    req.target(target);
    req.version(11);
    req.set(http::field::host, parts.authority);
    req.set(http::field::user_agent, userAgent);
    req.set(http::field::accept, "*/*");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }

    auto body = BeastRequestor::encodeBody(request);
    if (!body.contentType.empty()) {
        req.set(http::field::content_type, body.contentType);
    }
    req.body() = std::move(body.payload);
    req.prepare_payload();
    return req;
}

HttpResponse toHttpResponse(const http::response<http::string_body>& res,
                            const std::string& url) {
    HttpResponse response;
    response.status = res.result_int();
    response.url    = url;
    for (const auto& field : res) {
        auto inserted = response.headers.emplace(toStdString(field.name_string()),
                                                 toStdString(field.value()));
        if (!inserted.second) {
            inserted.first->second += ", " + toStdString(field.value());
        }
    }
    response.body = res.body();
    return response;
}

void setDeadline(beast::tcp_stream& stream, std::chrono::duration<double> timeout) {
    if (timeout.count() > 0.0) {
        stream.expires_after(std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    } else {
        stream.expires_never();
    }
}

// tcp_stream deadlines only apply to asynchronous operations, so each step
// is queued and driven to completion here.
void runQueued(net::io_context& ioc, const beast::error_code& ec) {
    ioc.run();
    ioc.restart();
    if (ec) {
        throw beast::system_error(ec);
    }
}

// The resolver has no deadline of its own; a timer cancels it instead.
tcp::resolver::results_type resolve(net::io_context& ioc,
                                    tcp::resolver& resolver,
                                    const UrlParts& parts,
                                    std::chrono::duration<double> timeout) {
    beast::error_code ec;
    tcp::resolver::results_type results;
    bool timedOut = false;

    net::steady_timer timer(ioc);
    if (timeout.count() > 0.0) {
        timer.expires_after(std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
        timer.async_wait([&](beast::error_code e) {
            if (!e) {
                timedOut = true;
                resolver.cancel();
            }
        });
    }
    resolver.async_resolve(parts.host, parts.port,
                           [&](beast::error_code e, tcp::resolver::results_type r) {
                               ec      = e;
                               results = std::move(r);
                               timer.cancel();
                           });
    ioc.run();
    ioc.restart();
    if (timedOut) {
        ec = beast::error::timeout;
    }
    if (ec) {
        throw beast::system_error(ec);
    }
    return results;
}

template <class Stream>
HttpResponse exchange(net::io_context& ioc,
                      Stream& stream,
                      RequestMessage& req,
                      const PreparedRequest& request) {
    auto& lowest = beast::get_lowest_layer(stream);
    beast::error_code ec;

    setDeadline(lowest, request.timeout);
    http::async_write(stream, req,
                      [&ec](beast::error_code e, std::size_t) { ec = e; });
    runQueued(ioc, ec);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }

    setDeadline(lowest, request.timeout);
    http::async_read(stream, buffer, parser,
                     [&ec](beast::error_code e, std::size_t) { ec = e; });
    runQueued(ioc, ec);

    return toHttpResponse(parser.get(), request.url);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastRequestor::BeastRequestor(const std::string& userAgent, const std::string& oauthUrl)
    : mOauthUrl(oauthUrl)
{
    if (userAgent.size() < 7) {
        throw InvalidInvocation("user_agent is not descriptive");
    }
    mUserAgent = userAgent + " apicore/" + kVersion;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastRequestor::request(const PreparedRequest& request, const Headers& headers) {
    UrlParts parts;
    try {
        parts = parseUrl(request.url);
    } catch (const std::invalid_argument&) {
        throw RequestException(
            TransportFault::Other,
            boost::system::errc::make_error_code(boost::system::errc::invalid_argument),
            request.method, request.url);
    }

    if (mVerbose) {
        std::cerr << "[Requestor] " << toUpper(request.method) << " " << parts.host
                  << ":" << parts.port << parts.target << "\n";
    }

    if (parts.scheme == "https") {
        return doHttpsRequest(parts, request, headers);
    }
    if (parts.scheme == "http") {
        return doHttpRequest(parts, request, headers);
    }
    throw RequestException(
        TransportFault::Other,
        boost::system::errc::make_error_code(boost::system::errc::protocol_not_supported),
        request.method, request.url);
}

void BeastRequestor::close() {
#ifdef APICORE_HAS_SSL
    std::lock_guard<std::mutex> lock(mSslMutex);
    mSslContext.reset();
#endif
    if (mVerbose) {
        std::cerr << "[Requestor] Closed\n";
    }
}

BeastRequestor::EncodedBody BeastRequestor::encodeBody(const PreparedRequest& request) {
    EncodedBody body;

    if (!request.files.empty()) {
        if (request.rawData) {
            throw InvalidInvocation("raw data cannot be sent together with files");
        }
        const std::string boundary = makeBoundary();
        if (request.data) {
            for (const auto& [name, value] : *request.data) {
                checkPartHeaderValue("field name", name);
                body.payload += "--" + boundary + "\r\n";
                body.payload += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
                body.payload += jsonToParam(value) + "\r\n";
            }
        }
        for (const auto& [field, file] : request.files) {
            checkPartHeaderValue("field name", field);
            checkPartHeaderValue("filename", file.filename);
            checkPartHeaderValue("content type", file.contentType);
            body.payload += "--" + boundary + "\r\n";
            body.payload += "Content-Disposition: form-data; name=\"" + field
                          + "\"; filename=\"" + file.filename + "\"\r\n";
            body.payload += "Content-Type: " + file.contentType + "\r\n\r\n";
            body.payload += file.content + "\r\n";
        }
        body.payload += "--" + boundary + "--\r\n";
        body.contentType = "multipart/form-data; boundary=" + boundary;
        return body;
    }

    if (request.data) {
        std::vector<std::pair<std::string, std::string>> fields;
        fields.reserve(request.data->size());
        for (const auto& [name, value] : *request.data) {
            fields.emplace_back(name, jsonToParam(value));
        }
        body.contentType = "application/x-www-form-urlencoded";
        body.payload     = encodeForm(fields);
        return body;
    }

    if (request.rawData) {
        body.payload = *request.rawData;
        return body;
    }

    if (request.json) {
        body.contentType = "application/json";
        body.payload     = request.json->dump();
    }
    return body;
}

TransportFault BeastRequestor::classifyError(const boost::system::error_code& ec, bool connecting) {
    if (ec == beast::error::timeout || ec == net::error::timed_out) {
        return connecting ? TransportFault::ConnectTimeout : TransportFault::ReadTimeout;
    }

    if (ec == http::error::partial_message ||
        ec == http::error::bad_chunk ||
        ec == http::error::bad_chunk_extension) {
        return TransportFault::ChunkedEncoding;
    }

    if (ec == http::error::end_of_stream ||
        ec == net::error::eof ||
        ec == net::error::connection_refused ||
        ec == net::error::connection_reset ||
        ec == net::error::connection_aborted ||
        ec == net::error::broken_pipe ||
        ec == net::error::host_unreachable ||
        ec == net::error::network_unreachable ||
        ec == net::error::network_down ||
        ec == net::error::network_reset ||
        ec == net::error::host_not_found ||
        ec == net::error::host_not_found_try_again ||
        ec == net::error::service_not_found) {
        return TransportFault::ConnectionError;
    }

#ifdef APICORE_HAS_SSL
    if (ec.category() == net::error::get_ssl_category() ||
        ec == net::ssl::error::stream_truncated) {
        return TransportFault::ConnectionError;
    }
#endif

    return TransportFault::Other;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastRequestor::doHttpRequest(const UrlParts& parts,
                                           const PreparedRequest& request,
                                           const Headers& headers)
{
    auto req = buildRequest(parts, request, headers, mUserAgent);

    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    bool connecting = true;
    try {
        auto const results = resolve(ioc, resolver, parts, request.timeout);

        beast::error_code ec;
        setDeadline(stream, request.timeout);
        stream.async_connect(results,
                             [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        runQueued(ioc, ec);
        connecting = false;

        HttpResponse response = exchange(ioc, stream, req, request);

        // Graceful shutdown (non-critical errors are swallowed).
        beast::error_code shutdownEc;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);

        if (mVerbose) {
            std::cerr << "[Requestor] HTTP " << response.status << "\n";
        }
        return response;

    } catch (const beast::system_error& e) {
        throw RequestException(classifyError(e.code(), connecting), e.code(),
                               request.method, request.url);
    }
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

#ifdef APICORE_HAS_SSL
std::shared_ptr<net::ssl::context> BeastRequestor::sslContext() {
    std::lock_guard<std::mutex> lock(mSslMutex);
    if (!mSslContext) {
        auto ctx = std::make_shared<net::ssl::context>(net::ssl::context::tlsv12_client);
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(net::ssl::verify_peer);
        mSslContext = std::move(ctx);
    }
    return mSslContext;
}
#endif

HttpResponse BeastRequestor::doHttpsRequest(const UrlParts& parts,
                                            const PreparedRequest& request,
                                            const Headers& headers)
{
#ifdef APICORE_HAS_SSL
    namespace ssl = net::ssl;

    auto req = buildRequest(parts, request, headers, mUserAgent);
    auto ctx = sslContext();

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, *ctx);

    bool connecting = true;
    try {
        // SNI hostname.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
            beast::error_code sniEc{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
            throw beast::system_error(sniEc);
        }
        stream.set_verify_callback(ssl::host_name_verification(parts.host));

        auto const results = resolve(ioc, resolver, parts, request.timeout);

        beast::error_code ec;
        setDeadline(beast::get_lowest_layer(stream), request.timeout);
        beast::get_lowest_layer(stream).async_connect(
            results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        runQueued(ioc, ec);

        setDeadline(beast::get_lowest_layer(stream), request.timeout);
        stream.async_handshake(ssl::stream_base::client,
                               [&ec](beast::error_code e) { ec = e; });
        runQueued(ioc, ec);
        connecting = false;

        HttpResponse response = exchange(ioc, stream, req, request);

        // Graceful shutdown (non-critical errors are swallowed).
        beast::error_code shutdownEc;
        setDeadline(beast::get_lowest_layer(stream), request.timeout);
        stream.async_shutdown([&shutdownEc](beast::error_code e) { shutdownEc = e; });
        ioc.run();

        if (mVerbose) {
            std::cerr << "[Requestor] HTTPS " << response.status << "\n";
        }
        return response;

    } catch (const beast::system_error& e) {
        throw RequestException(classifyError(e.code(), connecting), e.code(),
                               request.method, request.url);
    }
#else
    (void)parts;
    (void)request;
    (void)headers;
    throw InvalidInvocation("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace apicore
