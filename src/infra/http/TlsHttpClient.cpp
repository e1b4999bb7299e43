#include "infra/http/TlsHttpClient.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "MarketCore/1.0";

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << host << target << " failed: " << message;
    return std::runtime_error(oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }

    ParsedLocation result{};

    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw std::runtime_error("Redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw std::runtime_error("Redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }

    return result;
}

http::response<http::string_body> performRequest(const std::string& host,
                                                 const std::string& target,
                                                 std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw makeError(host, target, "timeout must be positive");
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    beast::error_code ec;
    sslContext.set_default_verify_paths(ec);
    if (ec) {
        throw makeError(host, target, "Unable to load system CA certificates: " + ec.message());
    }
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::host_name_verification(host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(host, target, oss.str());
    }

    // Name resolution has no per-operation timer in Beast; resolve
    // asynchronously and bound it by running the context for the timeout.
    net::ip::tcp::resolver resolver(ioc);
    net::ip::tcp::resolver::results_type results;
    bool resolved = false;
    resolver.async_resolve(host, "443", [&](const beast::error_code& resolveEc,
                                            net::ip::tcp::resolver::results_type resolveResults) {
        ec = resolveEc;
        results = std::move(resolveResults);
        resolved = true;
    });
    ioc.run_for(timeout);
    if (!resolved) {
        resolver.cancel();
        throw makeError(host, target, "DNS resolution timed out");
    }
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }
    ioc.restart();

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(timeout);
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(host, target, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(timeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(host, target, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");

    lowestLayer.expires_after(timeout);
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(host, target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(32U * 1024U * 1024U);
    lowestLayer.expires_after(timeout);
    http::read(stream, buffer, parser, ec);
    if (ec) {
        throw makeError(host, target, "Read error: " + ec.message());
    }

    lowestLayer.expires_after(timeout);
    stream.shutdown(ec);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated || ec == beast::error::timeout) {
        // The response is complete; a sloppy TLS close from the server is not a failure.
        ec = {};
    }
    if (ec) {
        throw makeError(host, target, "TLS shutdown error: " + ec.message());
    }

    return parser.release();
}

}  // namespace

JsonResponse https_get_json_response(const std::string& host,
                                     const std::string& target,
                                     std::chrono::milliseconds timeout) {
    if (host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(currentHost, currentTarget, timeout);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto locationHeader = response.base()[http::field::location];
                const auto parsed = parseRedirectLocation(std::string(locationHeader), currentHost);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const std::exception& redirectError) {
                throw makeError(currentHost, currentTarget, redirectError.what());
            }
        }

        JsonResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        if (auto it = response.base().find(http::field::retry_after); it != response.base().end()) {
            result.retry_after_header = std::string{it->value()};
        }
        return result;
    }

    throw makeError(currentHost, currentTarget, "Too many redirects");
}

HttpsGetter default_getter() {
    return [](const std::string& host, const std::string& target, std::chrono::milliseconds timeout) {
        return https_get_json_response(host, target, timeout);
    };
}

std::string url_encode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (const unsigned char ch : value) {
        if (std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            encoded << static_cast<char>(ch);
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(ch);
        }
    }
    return encoded.str();
}

}  // namespace infra::http
