#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http.hpp>

#include <pincer/config/bridge_config.h>

namespace pincer::server {

namespace http = boost::beast::http;

std::optional<std::string> getQueryParam(std::string_view target, std::string_view key);
std::string_view targetPath(std::string_view target);

struct UpgradeDecision {
    http::status status{http::status::switching_protocols};
    std::string reason;

    bool accepted() const { return status == http::status::switching_protocols; }
};

// Gatekeeper for the upgrade-only endpoint: path, upgrade headers, optional token, origin list.
class UpgradePolicy {
public:
    explicit UpgradePolicy(const config::ServerConfig& cfg);

    UpgradeDecision evaluate(const http::request<http::string_body>& req) const;

private:
    std::string wsPath_;
    std::optional<std::string> authToken_;
    std::vector<std::string> allowedOrigins_;
};

} // namespace pincer::server
