#pragma once

#include <memory>
#include <boost/beast.hpp>
#include <boost/url/url_view.hpp>

#include "ActiveSessions.hpp"
#include "config.hpp"
#include "response_builder.hpp"
#include "Types.hpp"

namespace voxbridge {

using ResponseBuilder = models::ResponseBuilder;
using req_t = http::request<http::string_body>;
using res_t = http::response<http::string_body>;

/**
 * @brief Maps requests to handlers.
 * @details
 * - `POST /incoming-call`   provider webhook, answers with stream TwiML
 * - `GET  <stream_path>`    telephony media-stream WebSocket upgrade
 * - `GET  /`, `GET /api`     readiness
 * - `GET  /api/sessions`    ids of calls in progress
 */
class Router {
public:
    Router(std::shared_ptr<ActiveSessions> active, TelephonyConfig cfg);

    void RouteQuery(const req_t& req, res_t& res, beast::tcp_stream& stream);

    // wss:// URL the provider should stream the call audio to.
    std::string StreamUrl(const req_t& req) const;

private:
    // Handlers
    void handle_incoming_call(const req_t& req, res_t& res);
    void handle_media_stream(const req_t& req, beast::tcp_stream& stream);
    void handle_status(const req_t& req, res_t& res);
    void handle_sessions(const req_t& req, res_t& res);

    std::shared_ptr<ActiveSessions> active_;
    TelephonyConfig cfg_;
};

}  // namespace voxbridge
