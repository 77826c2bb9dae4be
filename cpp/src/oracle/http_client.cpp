#include "dreamgroup/oracle/http_client.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace dreamgroup::oracle {

namespace {

using TlsStream = beast::ssl_stream<beast::tcp_stream>;

struct ExchangeFailure {
    const char* step = nullptr;
    beast::error_code ec;
};

// Runs connect (+ handshake) + write + read as one async chain on the given io_context.
// tcp_stream deadlines only apply to async operations, so the blocking API is built from these.
template<typename Stream>
HttpResponse exchange(asio::io_context& ioc, Stream& stream,
                      const tcp::resolver::results_type& endpoints,
                      http::request<http::string_body>& req,
                      std::chrono::milliseconds timeout,
                      const std::string& where) {
    ExchangeFailure failure;
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    auto& lowest = beast::get_lowest_layer(stream);

    auto fail = [&](const char* step, beast::error_code ec) {
        failure.step = step;
        failure.ec = ec;
    };

    auto on_read = [&](beast::error_code ec, std::size_t) {
        if (ec) fail("read", ec);
    };

    auto on_write = [&](beast::error_code ec, std::size_t) {
        if (ec) return fail("write", ec);
        lowest.expires_after(timeout);
        http::async_read(stream, buffer, res, on_read);
    };

    auto send = [&]() {
        lowest.expires_after(timeout);
        http::async_write(stream, req, on_write);
    };

    auto on_connect = [&](beast::error_code ec, const tcp::endpoint&) {
        if (ec) return fail("connect", ec);
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            lowest.expires_after(timeout);
            stream.async_handshake(ssl::stream_base::client, [&](beast::error_code hec) {
                if (hec) return fail("handshake", hec);
                send();
            });
        } else {
            send();
        }
    };

    lowest.expires_after(timeout);
    lowest.async_connect(endpoints, on_connect);
    ioc.run();

    if (failure.step) {
        std::string message = std::string("HTTP ") + failure.step + " failed: " + failure.ec.message();
        if (failure.ec == beast::error::timeout) {
            throw OracleError(message, where, ErrorCode::ORACLE_TIMEOUT);
        }
        throw OracleError(message, where);
    }

    return HttpResponse{res.result_int(), std::move(res.body())};
}

} // namespace

HttpClient::HttpClient()
    : ssl_context_(std::make_unique<ssl::context>(ssl::context::tls_client)) {
    ssl_context_->set_default_verify_paths();
    ssl_context_->set_verify_mode(ssl::verify_peer);
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::post_json(const ServiceConfig& service, const std::string& body,
                                   const HttpHeaders& extra_headers) {
    const std::string where = service.host + ":" + std::to_string(service.port) + service.target;
    const auto timeout = std::chrono::milliseconds(service.timeout_ms);

    LOG_DEBUG("POST ", where, " (", body.size(), " bytes)");

    http::request<http::string_body> req{http::verb::post, service.target, 11};
    req.set(http::field::host, service.host);
    req.set(http::field::user_agent, "dreamgroup/" BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    if (!service.api_key.empty()) {
        req.set(http::field::authorization, "Bearer " + service.api_key);
    }
    for (const auto& [name, value] : extra_headers) {
        req.set(name, value);
    }
    req.body() = body;
    req.prepare_payload();

    asio::io_context ioc;
    tcp::resolver::results_type endpoints;
    try {
        tcp::resolver resolver(ioc);
        endpoints = resolver.resolve(service.host, std::to_string(service.port));
    } catch (const beast::system_error& e) {
        throw OracleError("Cannot resolve host: " + std::string(e.what()), where);
    }

    HttpResponse response;
    if (service.use_ssl) {
        TlsStream stream(ioc, *ssl_context_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), service.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
            throw OracleError("Cannot set TLS server name: " + ec.message(), where);
        }
        stream.set_verify_callback(ssl::host_name_verification(service.host));
        response = exchange(ioc, stream, endpoints, req, timeout, where);

        // No TLS close_notify: the response is complete and many servers skip it anyway
        beast::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    } else {
        beast::tcp_stream stream(ioc);
        response = exchange(ioc, stream, endpoints, req, timeout, where);
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    LOG_DEBUG("POST ", where, " -> ", response.status);
    return response;
}

} // namespace dreamgroup::oracle
