#include "ActiveSessions.hpp"

#include <spdlog/spdlog.h>

#include <boost/uuid/uuid.hpp>             // Core UUID class
#include <boost/uuid/uuid_generators.hpp>  // Generators (Random, Name-based)
#include <boost/uuid/uuid_io.hpp>          // Streaming operators (to_string)
#include <stdexcept>

#include "TelephonyWebSocket.hpp"
#include "ToolDispatcher.hpp"

namespace voxbridge {

ActiveSessions::ActiveSessions(LiveChannelFactory live_factory, std::shared_ptr<const ToolDispatcher> tools,
                               std::shared_ptr<ISessionObserver> observer, CallSessionConfig cfg)
    : live_factory_(std::move(live_factory)),
      tools_(std::move(tools)),
      observer_(std::move(observer)),
      cfg_(std::move(cfg)) {
    if (!live_factory_) {
        throw std::invalid_argument("ActiveSessions: live channel factory is empty");
    }
}

std::string ActiveSessions::create_call_session(const req_t& req, beast::tcp_stream& stream) {
    boost::uuids::random_generator generator;
    std::string call_id = boost::uuids::to_string(generator());
    spdlog::debug("Creating call session {}", call_id);

    // Handover socket to the telephony channel; the call lives on its io_context.
    auto telephony = std::make_shared<TelephonyWebSocket>(stream.release_socket(), req);
    auto executor = telephony->get_executor();

    auto session = std::make_shared<CallSession>(executor, call_id, telephony, live_factory_(executor),
                                                 tools_, cfg_);
    start_session(session);
    return call_id;
}

void ActiveSessions::start_session(const std::shared_ptr<CallSession>& session) {
    if (observer_) {
        session->AttachObserver(observer_);
    }

    // Weak: the registry must not keep itself alive through its own sessions.
    std::weak_ptr<ActiveSessions> weak = weak_from_this();
    session->SetCloseHandler([weak](const std::string& id) {
        if (auto self = weak.lock()) {
            self->remove_session(id);
        }
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session->id()] = session;
        spdlog::debug("Call session {} registered ({} active)", session->id(), sessions_.size());
    }

    session->Start();
}

bool ActiveSessions::remove_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool removed = sessions_.erase(id) > 0;
    if (removed) {
        spdlog::debug("[{}] Call session removed ({} active)", id, sessions_.size());
    }
    return removed;
}

std::shared_ptr<CallSession> ActiveSessions::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return (it != sessions_.end()) ? it->second : nullptr;
}

std::vector<std::string> ActiveSessions::list_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t ActiveSessions::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void ActiveSessions::stop_all() {
    std::vector<std::shared_ptr<CallSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    spdlog::info("Stopping {} active call(s)", sessions.size());
    for (const auto& session : sessions) {
        session->Stop();
    }
}

}  // namespace voxbridge
