#pragma once
#include <spdlog/spdlog.h>

#include <boost/json.hpp>

#include "ISessionObserver.hpp"

namespace voxbridge {

// Default observer: every session event ends up in the server log.
class LoggingSessionObserver : public ISessionObserver {
   public:
    void OnStateChanged(const std::string& call_id, CallState from, CallState to) override {
        spdlog::info("[{}] {} -> {}", call_id, to_string(from), to_string(to));
    }

    void OnTranscript(const std::string& call_id, Speaker speaker, const std::string& text) override {
        spdlog::info("[{}] {}: {}", call_id, speaker == Speaker::Assistant ? "ai" : "caller", text);
    }

    void OnToolCall(const std::string& call_id, const std::string& tool,
                    const boost::json::object& args) override {
        spdlog::info("[{}] Calling tool {} {}", call_id, tool, boost::json::serialize(args));
    }

    void OnToolResult(const std::string& call_id, const std::string& tool,
                      const boost::json::object& result) override {
        spdlog::info("[{}] Tool {} returned {}", call_id, tool, boost::json::serialize(result));
    }

    void OnScheduleChanged(const std::string& call_id) override {
        spdlog::info("[{}] Booking created", call_id);
    }

    void OnError(const std::string& call_id, const std::string& error_message) override {
        spdlog::error("[{}] {}", call_id, error_message);
    }
};

}  // namespace voxbridge
