#include <pincer/config/config_helpers.h>

#include <charconv>
#include <fstream>
#include <limits>

namespace pincer::config {

std::optional<uint64_t> parse_uint(std::string_view s) {
    std::string v(s);
    trim(v);
    uint64_t n = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (v.empty() || ec != std::errc() || ptr != v.data() + v.size())
        return std::nullopt;
    return n;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s,
                                                  std::chrono::milliseconds max) {
    std::string v(s);
    trim(v);
    if (v.size() > 2 && v.compare(v.size() - 2, 2, "ms") == 0)
        v.resize(v.size() - 2);
    auto n = parse_uint(v);
    if (!n || max.count() < 0 || *n > static_cast<uint64_t>(max.count()))
        return std::nullopt;
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*n));
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "on" || v == "yes")
        return true;
    if (v == "0" || v == "false" || v == "off" || v == "no")
        return false;
    return std::nullopt;
}

std::optional<uint16_t> parse_port(std::string_view s) {
    std::string v(s);
    trim(v);
    unsigned long n = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (ec != std::errc() || ptr != v.data() + v.size() || n == 0 ||
        n > std::numeric_limits<uint16_t>::max())
        return std::nullopt;
    return static_cast<uint16_t>(n);
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']')
        s = s.substr(1, s.size() - 2);

    std::vector<std::string> out;
    std::string item;
    bool quoted = false;
    char quote = 0;
    for (char c : s) {
        if ((c == '"' || c == '\'') && (!quoted || c == quote)) {
            quoted = !quoted;
            quote = quoted ? c : 0;
            item.push_back(c);
            continue;
        }
        if (c == ',' && !quoted) {
            auto v = unquote(item);
            if (!v.empty())
                out.push_back(std::move(v));
            item.clear();
            continue;
        }
        item.push_back(c);
    }
    auto v = unquote(item);
    if (!v.empty())
        out.push_back(std::move(v));
    return out;
}

ConfigTable parse_config_file(const std::filesystem::path& config_path) {
    ConfigTable table;
    std::ifstream file(config_path);
    if (!file)
        return table;

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments, unless the value is a quoted string containing '#'
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        std::string section = currentSection;
        if (section.empty()) {
            auto dot = k.find('.');
            if (dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        // Arrays keep their brackets for parse_list; scalars are unquoted.
        table[section][k] = (!v.empty() && v.front() == '[') ? v : unquote(v);
    }
    return table;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty())
        return expand_tilde(override_path);

    if (const char* env = std::getenv("PINCER_CONFIG"); env && *env)
        return std::filesystem::path(env);

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "pincer" / "config.toml";
    }
    return configHome / "pincer" / "config.toml";
}

} // namespace pincer::config
