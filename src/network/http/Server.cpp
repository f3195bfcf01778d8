#include "Server.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <spdlog/spdlog.h>

#include "ActiveSessions.hpp"
#include "GoogleCalendarClient.hpp"
#include "IoContextPool.hpp"
#include "Listener.hpp"
#include "LiveSessionClient.hpp"
#include "LoggingSessionObserver.hpp"
#include "Router.hpp"
#include "SchedulingTools.hpp"
#include "ToolDispatcher.hpp"
#include "Types.hpp"

namespace voxbridge {

// Time given to open calls to say goodbye before the io_contexts stop.
static constexpr auto SHUTDOWN_GRACE = std::chrono::milliseconds(500);

struct Server::Impl {
    asio::io_context& main_io_;
    AppConfig cfg_;

    // Components
    std::shared_ptr<IoContextPool> pool_;
    std::shared_ptr<ssl::context> tls_;
    std::shared_ptr<GoogleCalendarClient> calendar_;
    std::shared_ptr<ToolDispatcher> tools_;
    std::shared_ptr<ActiveSessions> active_sessions_;
    std::shared_ptr<Router> router_;
    std::shared_ptr<Listener> listener_;
    asio::steady_timer shutdown_timer_;

    Impl(asio::io_context& io, AppConfig cfg) : main_io_(io), cfg_(std::move(cfg)), shutdown_timer_(io) {
        // 1. Thread Pool
        pool_ = std::make_shared<IoContextPool>(cfg_.server.threads);

        // 2. Outbound TLS (AI session and calendar)
        tls_ = std::make_shared<ssl::context>(ssl::context::tls_client);
        tls_->set_default_verify_paths();
        tls_->set_verify_mode(ssl::verify_peer);

        // 3. Scheduling backend and the tools the AI may call
        calendar_ = std::make_shared<GoogleCalendarClient>(tls_, cfg_.calendar);
        tools_ = std::make_shared<ToolDispatcher>();
        RegisterSchedulingTools(*tools_, calendar_);

        // 4. Call Management
        CallSessionConfig call_cfg{cfg_.live, cfg_.audio, cfg_.telephony.pending_audio_frames};
        auto live_factory = [tls = tls_, live = cfg_.live](asio::any_io_executor executor) {
            return std::shared_ptr<ILiveChannel>(std::make_shared<LiveSessionClient>(executor, tls, live));
        };
        active_sessions_ = std::make_shared<ActiveSessions>(std::move(live_factory), tools_,
                                                            std::make_shared<LoggingSessionObserver>(),
                                                            std::move(call_cfg));

        // 5. Request Routing
        router_ = std::make_shared<Router>(active_sessions_, cfg_.telephony);

        // 6. HTTP Listener
        tcp::endpoint endpoint{asio::ip::make_address(cfg_.server.address), cfg_.server.port};
        listener_ = std::make_shared<Listener>(main_io_, *pool_, endpoint, router_);

        spdlog::info("Server initialized on {}:{} (Threads: {})", cfg_.server.address, cfg_.server.port,
                     pool_->size());
        spdlog::info("Audio: 8->16 kHz upsampling '{}', output gain {:.2f}", to_string(cfg_.audio.upsample),
                     cfg_.audio.output_gain);
    }

    void Start() {
        pool_->run();      // Start worker threads
        listener_->run();  // Start accepting connections
        main_io_.run();    // Start main thread loop
    }

    void Stop() {
        spdlog::info("Stopping server components...");
        listener_->stop();
        active_sessions_->stop_all();

        shutdown_timer_.expires_after(SHUTDOWN_GRACE);
        shutdown_timer_.async_wait([this](const boost::system::error_code&) {
            if (active_sessions_->size() > 0) {
                spdlog::warn("{} call(s) still open at shutdown", active_sessions_->size());
            }
            pool_->stop();
            main_io_.stop();
        });
    }
};

Server::Server(asio::io_context& io, AppConfig cfg) : pImpl_(std::make_unique<Impl>(io, std::move(cfg))) {}

Server::~Server() = default;

void Server::Start() { pImpl_->Start(); }
void Server::Stop() { pImpl_->Stop(); }

}  // namespace voxbridge
