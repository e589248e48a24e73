#include <pincer/config/bridge_config.h>
#include <pincer/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace pincer::config {

namespace {

const std::string* lookup(const ConfigTable& t, const std::string& section,
                          const std::string& key) {
    auto s = t.find(section);
    if (s == t.end())
        return nullptr;
    auto k = s->second.find(key);
    return k == s->second.end() ? nullptr : &k->second;
}

Error badValue(const std::string& section, const std::string& key, const std::string& raw) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for " + section + "." + key + ": '" + raw + "'"};
}

} // namespace

Result<BridgeConfig> loadBridgeConfig(const std::filesystem::path& path) {
    BridgeConfig cfg;
    if (path.empty() || !std::filesystem::exists(path)) {
        spdlog::debug("No config at '{}', using defaults", path.string());
        return cfg;
    }
    auto t = parse_config_file(path);

    // [server]
    if (auto v = lookup(t, "server", "enabled")) {
        auto b = parse_bool(*v);
        if (!b)
            return badValue("server", "enabled", *v);
        cfg.server.enabled = *b;
    }
    if (auto v = lookup(t, "server", "bind_address"); v && !v->empty())
        cfg.server.bindAddress = *v;
    if (auto v = lookup(t, "server", "port")) {
        auto p = parse_port(*v);
        if (!p)
            return badValue("server", "port", *v);
        cfg.server.port = *p;
    }
    if (auto v = lookup(t, "server", "ws_path"); v && !v->empty()) {
        if (v->front() != '/')
            return badValue("server", "ws_path", *v);
        cfg.server.wsPath = *v;
    }
    if (auto v = lookup(t, "server", "auth_token"); v && !v->empty())
        cfg.server.authToken = *v;
    if (auto v = lookup(t, "server", "request_timeout_ms")) {
        auto ms = parse_ms(*v);
        if (!ms || ms->count() == 0)
            return badValue("server", "request_timeout_ms", *v);
        cfg.server.requestTimeout = *ms;
    }
    if (auto v = lookup(t, "server", "push_context_on_switch")) {
        auto b = parse_bool(*v);
        if (!b)
            return badValue("server", "push_context_on_switch", *v);
        cfg.server.pushContextOnSwitch = *b;
    }
    if (auto v = lookup(t, "server", "allowed_origins"))
        cfg.server.allowedOrigins = parse_list(*v);

    // [client]
    if (auto v = lookup(t, "client", "gateway_url"); v && !v->empty())
        cfg.client.gatewayUrl = *v;
    if (auto v = lookup(t, "client", "token"); v && !v->empty())
        cfg.client.token = *v;
    if (auto v = lookup(t, "client", "auto_connect")) {
        auto b = parse_bool(*v);
        if (!b)
            return badValue("client", "auto_connect", *v);
        cfg.client.autoConnect = *b;
    }
    if (auto v = lookup(t, "client", "send_on_tab_switch")) {
        auto b = parse_bool(*v);
        if (!b)
            return badValue("client", "send_on_tab_switch", *v);
        cfg.client.sendOnTabSwitch = *b;
    }
    if (auto v = lookup(t, "client", "allowed_domains"))
        cfg.client.allowedDomains = parse_list(*v);
    if (auto v = lookup(t, "client", "blocked_domains"))
        cfg.client.blockedDomains = parse_list(*v);
    if (auto v = lookup(t, "client", "max_reconnect_attempts")) {
        auto n = parse_uint(*v);
        if (!n || *n > 30)
            return badValue("client", "max_reconnect_attempts", *v);
        cfg.client.reconnect.maxAttempts = static_cast<int>(*n);
    }
    if (auto v = lookup(t, "client", "reconnect_base_delay_ms")) {
        auto ms = parse_ms(*v);
        if (!ms)
            return badValue("client", "reconnect_base_delay_ms", *v);
        cfg.client.reconnect.baseDelay = *ms;
    }

    // [log]
    if (auto v = lookup(t, "log", "level"); v && !v->empty())
        cfg.log.level = *v;
    if (auto v = lookup(t, "log", "file"))
        cfg.log.file = expand_tilde(*v).string();

    return cfg;
}

} // namespace pincer::config
