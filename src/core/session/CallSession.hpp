#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "Channels.hpp"
#include "ISessionObserver.hpp"
#include "config.hpp"

namespace voxbridge {

class ToolDispatcher;

struct CallSessionConfig {
    LiveConfig live;
    AudioConfig audio;
    size_t pending_audio_frames = 50;
};

/**
 * @brief Relays one phone call between the telephony stream and the AI session.
 * @details
 * **Lifecycle:** Idle -> Connecting (telephony "start") -> Active (AI
 * connection open) -> Closing -> Closed (stop, either socket closing, or AI
 * goAway). Input after Closed is dropped.
 *
 * **Threading:** every callback of a session runs on its executor (one
 * io_context thread), so the state needs no locking. Tool calls run as detached
 * coroutines on the same executor and keep the session alive until they finish.
 */
class CallSession : public ITelephonyListener,
                    public ILiveListener,
                    public std::enable_shared_from_this<CallSession> {
   public:
    CallSession(boost::asio::any_io_executor executor, std::string call_id,
                std::shared_ptr<ITelephonyChannel> telephony, std::shared_ptr<ILiveChannel> live,
                std::shared_ptr<const ToolDispatcher> tools, CallSessionConfig cfg);
    ~CallSession() override;

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    // Begins reading the telephony socket.
    void Start();

    // Thread-safe: posts the teardown onto the session executor.
    void Stop();

    void AttachObserver(std::shared_ptr<ISessionObserver> observer);

    // Called once, on the session executor, when the session reaches Closed.
    void SetCloseHandler(std::function<void(const std::string& call_id)> handler);

    const std::string& id() const noexcept;
    const std::string& stream_sid() const noexcept;
    CallState state() const noexcept;
    std::size_t pending_audio_frames() const noexcept;
    std::size_t tool_calls_in_flight() const noexcept;

    // ITelephonyListener
    void OnTelephonyMessage(std::string_view text) override;
    void OnTelephonyClosed(const std::string& reason) override;

    // ILiveListener
    void OnLiveOpen() override;
    void OnLiveMessage(std::string_view text) override;
    void OnLiveClosed(const std::string& reason) override;

   private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace voxbridge
