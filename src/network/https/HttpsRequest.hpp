#pragma once
#include <chrono>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "Types.hpp"

namespace voxbridge {

/**
 * @brief Sends one request over a fresh TLS connection and returns the full
 * response. Runs on the calling coroutine's executor.
 * @details The Host and User-Agent fields are filled in when missing. Any status
 * code is returned as-is; only transport and TLS failures throw
 * (boost::system::system_error).
 */
asio::awaitable<http::response<http::string_body>> HttpsRequest(
    ssl::context& tls, const std::string& host, const std::string& port,
    http::request<http::string_body> req, std::chrono::seconds timeout = std::chrono::seconds(20));

}  // namespace voxbridge
