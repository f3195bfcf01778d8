#include "Router.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace voxbridge {

namespace {

// Thrown by handlers to pick the status code of the error response.
struct RouteError : std::runtime_error {
    http::status status;
    RouteError(http::status s, const std::string& msg) : std::runtime_error(msg), status(s) {}
};

}  // namespace

Router::Router(std::shared_ptr<ActiveSessions> active, TelephonyConfig cfg)
    : active_(std::move(active)), cfg_(std::move(cfg)) {}

void Router::RouteQuery(const req_t& req, res_t& res, beast::tcp_stream& stream) {
    try {
        boost::urls::url_view url{req.target()};
        std::string path{url.path()};

        if (req.method() == http::verb::post && path == "/incoming-call") {
            handle_incoming_call(req, res);
        } else if (req.method() == http::verb::get && path == cfg_.stream_path) {
            handle_media_stream(req, stream);
        } else if (req.method() == http::verb::get && (path == "/" || path == "/api")) {
            handle_status(req, res);
        } else if (req.method() == http::verb::get && path == "/api/sessions") {
            handle_sessions(req, res);
        } else {
            throw RouteError(http::status::not_found, "Route not found");
        }
    } catch (const RouteError& e) {
        spdlog::warn("Routing: {} {} -> {}", std::string(req.method_string()), std::string(req.target()),
                     e.what());
        ResponseBuilder::build_error_response(res, e.what(), req.version(), req.keep_alive(), e.status);
    } catch (const std::exception& e) {
        spdlog::error("Routing Error: {}", e.what());
        ResponseBuilder::build_error_response(res, e.what(), req.version(), req.keep_alive(),
                                              http::status::internal_server_error);
    }
}

std::string Router::StreamUrl(const req_t& req) const {
    std::string host = cfg_.public_host;
    if (host.empty()) {
        auto it = req.find(http::field::host);
        if (it == req.end() || it->value().empty()) {
            throw RouteError(http::status::bad_request, "Missing Host header");
        }
        host = std::string(it->value());
    }
    return "wss://" + host + cfg_.stream_path;
}

void Router::handle_incoming_call(const req_t& req, res_t& res) {
    const auto url = StreamUrl(req);
    spdlog::info("Incoming call, streaming to {}", url);
    ResponseBuilder::build_stream_twiml_response(res, url, req.version(), req.keep_alive());
}

void Router::handle_media_stream(const req_t& req, beast::tcp_stream& stream) {
    if (!beast::websocket::is_upgrade(req)) {
        throw RouteError(http::status::bad_request, "Request is not a WebSocket upgrade");
    }

    auto id = active_->create_call_session(req, stream);
    spdlog::info("Media stream attached to call {}", id);
}

void Router::handle_status(const req_t& req, res_t& res) {
    ResponseBuilder::build_status_response(res, "voxbridge is running", req.version(), req.keep_alive());
}

void Router::handle_sessions(const req_t& req, res_t& res) {
    ResponseBuilder::build_sessions_response(res, active_->list_ids(), req.version(), req.keep_alive());
}

}  // namespace voxbridge
