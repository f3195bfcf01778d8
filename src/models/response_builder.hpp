#pragma once

#include "boost/beast/http/message.hpp"
#include "boost/beast/http/status.hpp"
#include "boost/beast/http/string_body.hpp"
#include "boost/beast/version.hpp"
#include "boost/json.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace voxbridge::models {
namespace json = boost::json;
namespace http = boost::beast::http;

using res_t = http::response<http::string_body>;

// Canned responses for the webhook and API routes. Every response carries the
// CORS headers so the dashboard can poll /api from another origin.
class ResponseBuilder {
public:
  static void build_stream_twiml_response(res_t &res,
                                          const std::string &stream_url,
                                          unsigned int version,
                                          bool keep_alive = false) {
    std::string twiml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Response><Connect>";
    twiml += "<Stream url=\"" + xml_escape(stream_url) + "\"/>";
    twiml += "</Connect></Response>";
    fill(res, http::status::ok, "text/xml", std::move(twiml), version, keep_alive);
  }

  static void build_sessions_response(res_t &res,
                                      const std::vector<std::string> &ids,
                                      unsigned int version,
                                      bool keep_alive = false) {
    json::array calls(ids.begin(), ids.end());
    fill_json(res, http::status::ok,
              {{"status", "success"}, {"count", ids.size()}, {"sessions", std::move(calls)}},
              version, keep_alive);
  }

  static void build_status_response(res_t &res,
                                    const std::string &message,
                                    unsigned int version,
                                    bool keep_alive = false) {
    fill_json(res, http::status::ok, {{"status", "success"}, {"message", message}},
              version, keep_alive);
  }

  static void build_error_response(res_t &res,
                                   const std::string &error_message,
                                   unsigned int version, bool keep_alive = false,
                                   http::status status = http::status::bad_request) {
    fill_json(res, status, {{"status", "error"}, {"message", error_message}},
              version, keep_alive);
  }

  // CORS preflight.
  static void build_options_response(res_t &res,
                                     unsigned int version,
                                     bool keep_alive = true) {
    fill(res, http::status::no_content, {}, {}, version, keep_alive);
    res.set(http::field::access_control_max_age, "86400");
  }

private:
  static void fill(res_t &res, http::status status, std::string_view content_type,
                   std::string body, unsigned int version, bool keep_alive) {
    res.version(version);
    res.result(status);
    res.keep_alive(keep_alive);
    res.set(http::field::server, "voxbridge (" BOOST_BEAST_VERSION_STRING ")");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
    if (!content_type.empty()) {
      res.set(http::field::content_type, content_type);
    }
    res.body() = std::move(body);
    res.prepare_payload();
  }

  static void fill_json(res_t &res, http::status status, const json::object &body,
                        unsigned int version, bool keep_alive) {
    fill(res, status, "application/json", json::serialize(body), version, keep_alive);
  }

  static std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
      switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default: out += c;
      }
    }
    return out;
  }
};

} // namespace voxbridge::models
