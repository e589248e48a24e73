#include <pincer/config/bridge_config.h>
#include <pincer/config/config_helpers.h>
#include <pincer/server/bridge_host.h>
#include <pincer/server/inbound_router.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr auto kShutdownGrace = std::chrono::seconds(5);
constexpr auto kDrainPoll = std::chrono::milliseconds(100);

void setup_logging(const pincer::config::LogConfig& log) {
    if (!log.file.empty()) {
        try {
            std::filesystem::path p(log.file);
            if (p.has_parent_path())
                std::filesystem::create_directories(p.parent_path());
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log.file, max_size, max_files);
            auto logger = std::make_shared<spdlog::logger>("pincerd", rotating_sink);
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::info);
            spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", log.file,
                         max_size / (1024 * 1024), max_files);
        } catch (const std::exception& e) {
            spdlog::warn("File logging unavailable ({}); using console", e.what());
        }
    }

    if (log.level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log.level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log.level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log.level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log.level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::warn("Unknown log level '{}', keeping info", log.level);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"pincerd - browser tab bridge host"};

    std::string configPath;
    std::string bindAddress;
    uint16_t port = 0;
    std::string wsPath;
    std::string token;
    std::string logLevel;
    std::string logFile;
    uint64_t requestTimeoutMs = 0;

    app.add_option("--config", configPath, "Configuration file path");
    auto* bindOpt = app.add_option("--bind", bindAddress, "Listen address");
    auto* portOpt = app.add_option("--port", port, "Listen port");
    auto* pathOpt = app.add_option("--path", wsPath, "WebSocket upgrade path");
    auto* tokenOpt = app.add_option("--token", token, "Token required on upgrade (?token=)");
    auto* levelOpt =
        app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");
    auto* fileOpt = app.add_option("--log-file", logFile, "Rotating log file path");
    const auto maxTimeoutMs = static_cast<uint64_t>(pincer::config::kMaxMillisSetting.count());
    auto* timeoutOpt = app.add_option("--request-timeout-ms", requestTimeoutMs,
                                      "Command timeout in milliseconds")
                           ->check(CLI::Range(uint64_t{1}, maxTimeoutMs));

    CLI11_PARSE(app, argc, argv);

    auto path = pincer::config::get_config_path(configPath);
    auto loaded = pincer::config::loadBridgeConfig(path);
    if (!loaded) {
        std::fprintf(stderr, "pincerd: %s\n", loaded.error().message.c_str());
        return 2;
    }
    auto cfg = std::move(loaded).value();

    // CLI overrides file
    if (*bindOpt)
        cfg.server.bindAddress = bindAddress;
    if (*portOpt)
        cfg.server.port = port;
    if (*pathOpt) {
        if (!wsPath.starts_with('/')) {
            std::fprintf(stderr, "pincerd: --path must start with '/'\n");
            return 2;
        }
        cfg.server.wsPath = wsPath;
    }
    if (*tokenOpt && !token.empty())
        cfg.server.authToken = token;
    if (*levelOpt)
        cfg.log.level = logLevel;
    if (*fileOpt)
        cfg.log.file = logFile;
    if (*timeoutOpt)
        cfg.server.requestTimeout = std::chrono::milliseconds(requestTimeoutMs);

    setup_logging(cfg.log);
    spdlog::info("pincerd starting (config: {})", path.string());

    boost::asio::io_context ioc;
    pincer::server::BridgeHost host(ioc, cfg.server);

    if (cfg.server.pushContextOnSwitch) {
        host.registry().onContextUpdate(
            [](const pincer::bridge::TabConnection& conn, const pincer::bridge::PageContext& ctx) {
                spdlog::info("[{}] {}", conn.id, pincer::server::formatContextSummary(ctx));
            });
    }

    if (auto r = host.start(); !r) {
        spdlog::error("Failed to start bridge: {}", r.error().message);
        return 1;
    }

    // Shutdown timers share a strand; the drain poll cancels the grace timer.
    auto shutdownStrand = boost::asio::make_strand(ioc);
    boost::asio::steady_timer graceTimer(shutdownStrand);
    boost::asio::steady_timer drainTimer(shutdownStrand);
    std::function<void()> waitForDrain = [&] {
        if (host.sessionCount() == 0) {
            graceTimer.cancel();
            return;
        }
        drainTimer.expires_after(kDrainPoll);
        drainTimer.async_wait([&](const boost::system::error_code& dec) {
            if (!dec)
                waitForDrain();
        });
    };

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec)
            return;
        spdlog::info("Received signal {}, shutting down", signo);
        host.stop();
        boost::asio::post(shutdownStrand, [&] {
            graceTimer.expires_after(kShutdownGrace);
            graceTimer.async_wait([&](const boost::system::error_code& tec) {
                if (tec)
                    return;
                spdlog::warn("Sessions did not drain within {}s; stopping",
                             std::chrono::duration_cast<std::chrono::seconds>(kShutdownGrace)
                                 .count());
                drainTimer.cancel();
                ioc.stop();
            });
            waitForDrain();
        });
    });

    const unsigned threads = std::clamp(std::thread::hardware_concurrency(), 2u, 4u);
    std::vector<std::thread> pool;
    pool.reserve(threads - 1);
    for (unsigned i = 1; i < threads; ++i)
        pool.emplace_back([&ioc] { ioc.run(); });
    ioc.run();
    for (auto& t : pool)
        t.join();

    spdlog::info("pincerd stopped");
    spdlog::shutdown();
    return 0;
}
