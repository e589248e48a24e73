#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <pincer/config/bridge_config.h>

namespace pincer::client {

// Host-glob allow/deny lists. Deny wins; an empty allow list allows every host. A pattern of the
// form "*.example.com" also covers "example.com" itself.
class DomainPolicy {
public:
    DomainPolicy() = default;
    DomainPolicy(std::vector<std::string> allowed, std::vector<std::string> blocked);

    static DomainPolicy fromConfig(const config::ClientConfig& cfg);

    bool allowsHost(std::string_view host) const;
    // URLs without a host are allowed only when the allow list is empty.
    bool allowsUrl(std::string_view url) const;

private:
    std::vector<std::string> allowed_;
    std::vector<std::string> blocked_;
};

} // namespace pincer::client
