#include "HttpsRequest.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/version.hpp>

#include "spdlog/spdlog.h"

namespace voxbridge {

// Calendar responses are small; anything bigger is a bug on one side.
static constexpr uint64_t MAX_BODY_LIMIT = 8ULL * 1024 * 1024;

asio::awaitable<http::response<http::string_body>> HttpsRequest(ssl::context& tls, const std::string& host,
                                                                const std::string& port,
                                                                http::request<http::string_body> req,
                                                                std::chrono::seconds timeout) {
    auto executor = co_await asio::this_coro::executor;

    tcp::resolver resolver(executor);
    beast::ssl_stream<beast::tcp_stream> stream(executor, tls);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
            "Failed to set SNI host name");
    }
    stream.set_verify_mode(ssl::verify_peer);
    stream.set_verify_callback(ssl::host_name_verification(host));

    auto results = co_await resolver.async_resolve(host, port, asio::use_awaitable);

    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await beast::get_lowest_layer(stream).async_connect(results, asio::use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);

    if (req.find(http::field::host) == req.end()) req.set(http::field::host, host);
    if (req.find(http::field::user_agent) == req.end()) {
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    }
    req.prepare_payload();

    spdlog::debug("[HTTPS] {} {}{}", std::string(req.method_string()), host, std::string(req.target()));
    co_await http::async_write(stream, req, asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_LIMIT);
    co_await http::async_read(stream, buffer, parser, asio::use_awaitable);

    // Best-effort TLS shutdown; many servers just drop the connection.
    auto [ec] = co_await stream.async_shutdown(asio::as_tuple(asio::use_awaitable));
    if (ec && ec != asio::ssl::error::stream_truncated) {
        spdlog::debug("[HTTPS] Shutdown of {}: {}", host, ec.message());
    }

    co_return parser.release();
}

}  // namespace voxbridge
