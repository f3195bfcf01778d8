#pragma once
#include <memory>
#include <string>
#include <string_view>

namespace voxbridge {

// Events from the telephony media-stream socket.
struct ITelephonyListener {
    virtual ~ITelephonyListener() = default;
    virtual void OnTelephonyMessage(std::string_view text) = 0;
    virtual void OnTelephonyClosed(const std::string& reason) = 0;
};

// Events from the AI live-session socket.
struct ILiveListener {
    virtual ~ILiveListener() = default;
    virtual void OnLiveOpen() = 0;
    virtual void OnLiveMessage(std::string_view text) = 0;
    virtual void OnLiveClosed(const std::string& reason) = 0;
};

/**
 * @brief Outgoing side of the telephony connection (server-accepted WebSocket).
 * Sends are queued and written in order. Close is idempotent.
 */
struct ITelephonyChannel {
    virtual ~ITelephonyChannel() = default;
    virtual void Start(std::weak_ptr<ITelephonyListener> listener) = 0;
    virtual void Send(std::string message) = 0;
    virtual void Close() = 0;
};

/**
 * @brief Outgoing side of the AI live-session connection (client WebSocket).
 * Messages sent before the handshake completes are held and flushed in order
 * once the connection is open. Close is idempotent.
 */
struct ILiveChannel {
    virtual ~ILiveChannel() = default;
    virtual void Open(std::weak_ptr<ILiveListener> listener) = 0;
    virtual void Send(std::string message) = 0;
    virtual void Close() = 0;
};

}  // namespace voxbridge
