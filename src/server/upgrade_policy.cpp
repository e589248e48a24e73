#include <pincer/core/text_utils.h>
#include <pincer/server/upgrade_policy.h>

#include <boost/algorithm/string.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

namespace pincer::server {

std::optional<std::string> getQueryParam(std::string_view target, std::string_view key) {
    auto pos = target.find('?');
    if (pos == std::string_view::npos)
        return std::nullopt;
    std::string q(target.substr(pos + 1));
    if (auto frag = q.find('#'); frag != std::string::npos)
        q.resize(frag);
    std::vector<std::string> parts;
    boost::split(parts, q, boost::is_any_of("&"));
    for (auto& p : parts) {
        auto eq = p.find('=');
        if (eq == std::string::npos)
            continue;
        if (std::string_view(p).substr(0, eq) == key)
            return percentDecode(std::string_view(p).substr(eq + 1));
    }
    return std::nullopt;
}

std::string_view targetPath(std::string_view target) {
    return target.substr(0, target.find_first_of("?#"));
}

UpgradePolicy::UpgradePolicy(const config::ServerConfig& cfg)
    : wsPath_(cfg.wsPath), authToken_(cfg.authToken), allowedOrigins_(cfg.allowedOrigins) {}

UpgradeDecision UpgradePolicy::evaluate(const http::request<http::string_body>& req) const {
    std::string_view target(req.target().data(), req.target().size());
    if (targetPath(target) != wsPath_)
        return {http::status::not_found, "not found"};
    if (!boost::beast::websocket::is_upgrade(req))
        return {http::status::upgrade_required, "websocket upgrade required"};
    if (authToken_) {
        auto token = getQueryParam(target, "token");
        if (!token || *token != *authToken_)
            return {http::status::unauthorized, "invalid token"};
    }
    if (!allowedOrigins_.empty()) {
        auto it = req.find(http::field::origin);
        // Non-browser clients send no Origin header; only browser origins are filtered.
        if (it != req.end()) {
            std::string origin(it->value().data(), it->value().size());
            bool ok = false;
            for (const auto& pattern : allowedOrigins_) {
                if (matchGlob(origin, pattern)) {
                    ok = true;
                    break;
                }
            }
            if (!ok)
                return {http::status::forbidden, "origin not allowed"};
        }
    }
    return {};
}

} // namespace pincer::server
