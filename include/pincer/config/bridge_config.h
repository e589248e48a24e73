#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <pincer/core/types.h>

namespace pincer::config {

inline constexpr int kDefaultMaxReconnectAttempts = 5;
inline constexpr std::chrono::milliseconds kDefaultReconnectBaseDelay{1000};
inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{30000};
// Ceiling for a computed backoff delay.
inline constexpr std::chrono::milliseconds kMaxReconnectDelay{std::chrono::hours(24)};
inline constexpr const char* kDefaultWsPath = "/pincer";
inline constexpr uint16_t kDefaultPort = 18789;

struct ServerConfig {
    bool enabled = true;
    std::string bindAddress = "127.0.0.1";
    uint16_t port = kDefaultPort;
    std::string wsPath = kDefaultWsPath;
    std::optional<std::string> authToken;
    std::chrono::milliseconds requestTimeout = kDefaultRequestTimeout;
    bool pushContextOnSwitch = true;
    std::vector<std::string> allowedOrigins; // empty: any origin
};

struct ReconnectPolicy {
    int maxAttempts = kDefaultMaxReconnectAttempts;
    std::chrono::milliseconds baseDelay = kDefaultReconnectBaseDelay;

    // base * 2^attempt, saturating at kMaxReconnectDelay
    std::chrono::milliseconds delayFor(int attempt) const {
        auto delay = std::min(baseDelay, kMaxReconnectDelay);
        for (int i = 0; i < attempt && delay < kMaxReconnectDelay; ++i)
            delay *= 2;
        return std::min(delay, kMaxReconnectDelay);
    }
};

struct ClientConfig {
    std::string gatewayUrl = "ws://localhost:18789/pincer";
    std::optional<std::string> token;
    bool autoConnect = true;
    bool sendOnTabSwitch = true;
    std::vector<std::string> allowedDomains;
    std::vector<std::string> blockedDomains;
    ReconnectPolicy reconnect;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
};

struct BridgeConfig {
    ServerConfig server;
    ClientConfig client;
    LogConfig log;
};

// Missing file yields defaults; a present key with an unparsable value is an InvalidArgument
// error naming the key.
Result<BridgeConfig> loadBridgeConfig(const std::filesystem::path& path);

} // namespace pincer::config
