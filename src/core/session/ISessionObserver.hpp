#pragma once
#include <string>

#include <boost/json.hpp>

namespace voxbridge {

enum class CallState { Idle, Connecting, Active, Closing, Closed };

const char* to_string(CallState state);

enum class Speaker { Caller, Assistant };

/**
 * @brief Contract for receiving call session events.
 * @details
 * **Pattern:** Observer / Listener. Replaces ad-hoc callbacks so the relay does
 * not know how (or whether) events reach a dashboard.
 * **Thread Safety:** Methods are called on the session's io_context thread.
 * Implementations must be fast and non-blocking; post elsewhere for heavy work.
 */
struct ISessionObserver {
    virtual ~ISessionObserver() = default;

    virtual void OnStateChanged(const std::string& call_id, CallState from, CallState to) = 0;

    // Text produced by the AI (or a caller transcript if the model sends one).
    virtual void OnTranscript(const std::string& call_id, Speaker speaker, const std::string& text) = 0;

    virtual void OnToolCall(const std::string& call_id, const std::string& tool,
                            const boost::json::object& args) = 0;

    virtual void OnToolResult(const std::string& call_id, const std::string& tool,
                              const boost::json::object& result) = 0;

    // A booking was created; listings shown elsewhere are stale.
    virtual void OnScheduleChanged(const std::string& call_id) = 0;

    virtual void OnError(const std::string& call_id, const std::string& error_message) = 0;
};

}  // namespace voxbridge
