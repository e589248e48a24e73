#include <pincer/client/domain_policy.h>
#include <pincer/core/text_utils.h>

#include <algorithm>
#include <cctype>

namespace pincer::client {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> normalize(std::vector<std::string> patterns) {
    std::vector<std::string> out;
    out.reserve(patterns.size());
    for (auto& p : patterns) {
        auto t = lower(p);
        if (!t.empty())
            out.push_back(std::move(t));
    }
    return out;
}

bool matchesAny(const std::string& host, const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (matchGlob(host, p))
            return true;
        if (p.size() > 2 && p.compare(0, 2, "*.") == 0 && host == p.substr(2))
            return true;
    }
    return false;
}

} // namespace

DomainPolicy::DomainPolicy(std::vector<std::string> allowed, std::vector<std::string> blocked)
    : allowed_(normalize(std::move(allowed))), blocked_(normalize(std::move(blocked))) {}

DomainPolicy DomainPolicy::fromConfig(const config::ClientConfig& cfg) {
    return DomainPolicy(cfg.allowedDomains, cfg.blockedDomains);
}

bool DomainPolicy::allowsHost(std::string_view host) const {
    auto h = lower(host);
    if (matchesAny(h, blocked_))
        return false;
    return allowed_.empty() || matchesAny(h, allowed_);
}

bool DomainPolicy::allowsUrl(std::string_view url) const {
    auto host = hostFromUrl(url);
    if (host.empty())
        return allowed_.empty();
    return allowsHost(host);
}

} // namespace pincer::client
