#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "Server.hpp"
#include "config.hpp"

namespace asio = boost::asio;

namespace {

constexpr const char* DEFAULT_CONFIG = "config.toml";

// Console gets the configured level, the rotating file (when set) everything.
void init_logger(const voxbridge::LoggingConfig& cfg) {
    const auto level = spdlog::level::from_str(cfg.level);

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    sinks.back()->set_level(level);
    if (!cfg.file.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, cfg.max_file_size, cfg.max_files));
        sinks.back()->set_level(spdlog::level::trace);
    }

    auto logger = std::make_shared<spdlog::logger>("voxbridge", sinks.begin(), sinks.end());
    logger->set_level(cfg.file.empty() ? level : spdlog::level::trace);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%-5l%$ [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

int run(const std::string& config_path) {
    const auto cfg = voxbridge::LoadConfig(config_path);
    init_logger(cfg.logging);
    spdlog::info("voxbridge starting (config {})", config_path);

    asio::io_context control;
    auto server = std::make_shared<voxbridge::Server>(control, cfg);

    asio::signal_set signals(control, SIGINT, SIGTERM);
    signals.async_wait([server](const boost::system::error_code& ec, int signo) {
        if (ec == asio::error::operation_aborted) return;
        spdlog::warn("Caught signal {}, hanging up active calls", signo);
        server->Stop();
    });

    server->Start();
    spdlog::info("voxbridge stopped");
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        spdlog::error("usage: {} [config.toml]", argv[0]);
        return EXIT_FAILURE;
    }

    try {
        return run(argc == 2 ? argv[1] : DEFAULT_CONFIG);
    } catch (const voxbridge::ConfigError& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::critical("Unrecoverable error: {}", e.what());
    }
    return EXIT_FAILURE;
}
