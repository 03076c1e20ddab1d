#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
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

namespace vpb::infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "ViewportBars/1.0";

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET https://" << host << target << " failed: " << message;
    return std::runtime_error(oss.str());
}

struct Location {
    std::string host;
    std::string target;
};

Location parseRedirect(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }
    if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    }

    Location result{};
    if (location.rfind("https://", 0) != 0) {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
        return result;
    }

    const std::string rest = location.substr(std::string{"https://"}.size());
    const auto slash = rest.find('/');
    std::string hostPart = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (const auto colon = hostPart.find(':'); colon != std::string::npos) {
        if (hostPart.substr(colon + 1) != "443") {
            throw std::runtime_error("Redirect to unsupported HTTPS port: " + hostPart.substr(colon + 1));
        }
        hostPart.erase(colon);
    }
    if (hostPart.empty()) {
        throw std::runtime_error("Redirect URL missing host");
    }
    result.host = hostPart;
    result.target = slash == std::string::npos ? std::string{"/"} : rest.substr(slash);
    return result;
}

bhttp::response<bhttp::string_body> performRequest(const std::string& host,
                                                   const std::string& target,
                                                   const HttpsGetRequest& options) {
    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    if (options.verifyPeer) {
        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(ssl::verify_peer);
        sslContext.set_verify_callback(ssl::host_name_verification(host));
    } else {
        sslContext.set_verify_mode(ssl::verify_none);
    }

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        throw makeError(host, target, std::string{"cannot set SNI hostname"} + (reason ? ": " : "") + (reason ? reason : ""));
    }

    beast::error_code ec;
    net::ip::tcp::resolver resolver(ioc);
    const auto results = resolver.resolve(host, "443", ec);
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }

    const auto timeout = std::chrono::seconds(options.timeoutSec);
    auto& lowest = beast::get_lowest_layer(stream);
    lowest.expires_after(timeout);
    lowest.connect(results, ec);
    if (ec) {
        throw makeError(host, target, "Connection error: " + ec.message());
    }

    lowest.expires_after(timeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(host, target, "TLS handshake error: " + ec.message());
    }

    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, target, 11};
    req.set(bhttp::field::host, host);
    req.set(bhttp::field::user_agent, kUserAgent);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");

    lowest.expires_after(timeout);
    bhttp::write(stream, req, ec);
    if (ec) {
        throw makeError(host, target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    lowest.expires_after(timeout);
    bhttp::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(host, target, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    // Servers often close without a TLS close_notify; the response is already complete.
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        throw makeError(host, target, "TLS shutdown error: " + ec.message());
    }
    return response;
}

}  // namespace

HttpsResponse httpsGet(const HttpsGetRequest& request) {
    if (request.host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }
    if (request.timeoutSec <= 0) {
        throw makeError(request.host, request.target, "timeout must be positive");
    }

    std::string host = request.host;
    std::string target = request.target.empty() ? std::string{"/"} : request.target;
    if (target.front() != '/') {
        target.insert(target.begin(), '/');
    }

    for (int redirects = 0; redirects <= kMaxRedirects; ++redirects) {
        auto response = performRequest(host, target, request);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto next = parseRedirect(std::string(response.base()[bhttp::field::location]), host);
                host = next.host;
                target = next.target;
                continue;
            } catch (const std::exception& redirectError) {
                throw makeError(host, target, redirectError.what());
            }
        }

        HttpsResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.finalHost = host;
        result.finalTarget = target;
        if (!request.captureHeader.empty()) {
            if (auto it = response.base().find(request.captureHeader); it != response.base().end()) {
                result.capturedHeader = std::string{it->value()};
            }
        }
        return result;
    }

    throw makeError(host, target, "Too many redirects");
}

}  // namespace vpb::infra::http
