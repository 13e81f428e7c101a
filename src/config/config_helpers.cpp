#include <cairn/config/config_helpers.h>

#include <fstream>

namespace cairn::config {

namespace {

std::string env(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

// Strip a trailing "# comment" that is not inside quotes
std::string stripInlineComment(const std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

} // namespace

ConfigTable parse_config_file(const std::filesystem::path& config_path) {
    ConfigTable table;
    std::ifstream file(config_path);
    if (!file) {
        return table;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = stripInlineComment(line.substr(eq + 1));
        trim(k);

        // Dotted keys ("storage.db_path") are accepted at top level
        std::string section = currentSection;
        if (section.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        table[section][k] = unquote(v);
    }
    return table;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto table = parse_config_file(config_path);
    auto sit = table.find(section);
    if (sit == table.end()) {
        return "";
    }
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? "" : kit->second;
}

std::filesystem::path get_config_dir() {
    if (auto xdg = env("XDG_CONFIG_HOME"); !xdg.empty()) {
        return std::filesystem::path(xdg) / "cairn";
    }
    if (auto home = env("HOME"); !home.empty()) {
        return std::filesystem::path(home) / ".config" / "cairn";
    }
    return std::filesystem::current_path() / ".cairn";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto fromEnv = env("CAIRN_CONFIG"); !fromEnv.empty()) {
        return expand_tilde(fromEnv);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (auto fromEnv = env("CAIRN_DATA_DIR"); !fromEnv.empty()) {
        return expand_tilde(fromEnv);
    }
    if (auto xdg = env("XDG_DATA_HOME"); !xdg.empty()) {
        return std::filesystem::path(xdg) / "cairn";
    }
    if (auto home = env("HOME"); !home.empty()) {
        return std::filesystem::path(home) / ".local" / "share" / "cairn";
    }
    return std::filesystem::current_path() / "cairn_data";
}

} // namespace cairn::config
