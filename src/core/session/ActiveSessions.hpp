#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include "CallSession.hpp"
#include "Channels.hpp"
#include "ISessionObserver.hpp"
#include "Types.hpp"

namespace voxbridge {

class ToolDispatcher;

/**
 * @brief Registry of the calls currently in progress.
 * @details
 * Sessions register on creation and remove themselves when they reach Closed.
 * Lookups may come from any thread (the HTTP workers and the main thread on
 * shutdown), so the map is mutex-guarded; the sessions themselves are not touched
 * under the lock.
 */
class ActiveSessions : public std::enable_shared_from_this<ActiveSessions> {
public:
    using req_t = http::request<http::string_body>;
    // Creates the AI-side channel for a call running on `executor`.
    using LiveChannelFactory = std::function<std::shared_ptr<ILiveChannel>(asio::any_io_executor)>;

    ActiveSessions(LiveChannelFactory live_factory, std::shared_ptr<const ToolDispatcher> tools,
                   std::shared_ptr<ISessionObserver> observer, CallSessionConfig cfg);

    /**
     * @brief Takes over an upgraded telephony connection and starts its call
     * session on the connection's io_context.
     * @return The call id.
     */
    std::string create_call_session(const req_t& req, beast::tcp_stream& stream);

    /**
     * @brief Wires an already-built session into the registry (observer, removal
     * on close) and starts it.
     */
    void start_session(const std::shared_ptr<CallSession>& session);

    bool remove_session(const std::string& id);

    // Lookups
    std::shared_ptr<CallSession> get(const std::string& id) const;
    std::vector<std::string> list_ids() const;
    std::size_t size() const noexcept;

    // Management
    void stop_all();

    ActiveSessions(const ActiveSessions&) = delete;
    ActiveSessions& operator=(const ActiveSessions&) = delete;

private:
    mutable std::mutex mutex_;

    LiveChannelFactory live_factory_;
    std::shared_ptr<const ToolDispatcher> tools_;
    std::shared_ptr<ISessionObserver> observer_;
    CallSessionConfig cfg_;

    std::unordered_map<std::string, std::shared_ptr<CallSession>> sessions_;
};

}  // namespace voxbridge
