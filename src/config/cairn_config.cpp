#include <cairn/config/cairn_config.h>

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cstdlib>

namespace cairn::config {

namespace {

const std::string* lookup(const ConfigTable& table, const std::string& section,
                          const std::string& key) {
    auto sit = table.find(section);
    if (sit == table.end())
        return nullptr;
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? nullptr : &kit->second;
}

template <typename T>
Result<void> readNumber(const ConfigTable& table, const std::string& section,
                        const std::string& key, T& out) {
    const auto* raw = lookup(table, section, key);
    if (!raw || raw->empty())
        return {};
    T value{};
    const char* first = raw->data();
    const char* last = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     "[" + section + "] " + key + ": not a number: " + *raw};
    }
    out = value;
    return {};
}

void readString(const ConfigTable& table, const std::string& section, const std::string& key,
                std::string& out) {
    if (const auto* raw = lookup(table, section, key); raw && !raw->empty())
        out = *raw;
}

std::string envKey(const std::string& name) {
    if (name.empty())
        return {};
    const char* v = std::getenv(name.c_str());
    return v ? std::string(v) : std::string();
}

Result<void> checkUnit(const char* key, double v) {
    if (v < 0.0 || v > 1.0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("[ingestion] {} must be within [0, 1], got {}", key, v)};
    }
    return {};
}

} // namespace

bool isValidLogLevel(const std::string& level) {
    static constexpr std::array<const char*, 7> kLevels = {"trace", "debug", "info", "warn",
                                                           "error", "critical", "off"};
    return std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end();
}

Result<CairnConfig> configFromTable(const ConfigTable& table,
                                    const std::filesystem::path& dataDir) {
    CairnConfig cfg;
    cfg.dbPath = dataDir / "cairn.db";
    if (const auto* db = lookup(table, "storage", "db_path"); db && !db->empty())
        cfg.dbPath = expand_tilde(*db);

    long long timeoutMs = cfg.extraction.timeout.count();
    readString(table, "extraction", "provider", cfg.extraction.provider);
    readString(table, "extraction", "endpoint", cfg.extraction.endpoint);
    readString(table, "extraction", "model", cfg.extraction.model);
    readString(table, "extraction", "api_key_env", cfg.extractionKeyEnv);
    if (auto r = readNumber(table, "extraction", "max_tokens", cfg.extraction.maxTokens); !r)
        return r.error();
    if (auto r = readNumber(table, "extraction", "timeout_ms", timeoutMs); !r)
        return r.error();
    cfg.extraction.timeout = std::chrono::milliseconds(timeoutMs);
    cfg.extraction.apiKey = envKey(cfg.extractionKeyEnv);

    timeoutMs = cfg.embedding.timeout.count();
    readString(table, "embedding", "provider", cfg.embedding.provider);
    readString(table, "embedding", "endpoint", cfg.embedding.endpoint);
    readString(table, "embedding", "model", cfg.embedding.model);
    readString(table, "embedding", "api_key_env", cfg.embeddingKeyEnv);
    if (auto r = readNumber(table, "embedding", "dimensions", cfg.embedding.dimensions); !r)
        return r.error();
    if (auto r = readNumber(table, "embedding", "timeout_ms", timeoutMs); !r)
        return r.error();
    cfg.embedding.timeout = std::chrono::milliseconds(timeoutMs);
    cfg.embedding.apiKey = envKey(cfg.embeddingKeyEnv);

    auto& ing = cfg.ingestion;
    if (auto r = readNumber(table, "ingestion", "dedup_threshold", ing.dedupThreshold); !r)
        return r.error();
    if (auto r = readNumber(table, "ingestion", "related_threshold", ing.relatedThreshold); !r)
        return r.error();
    if (auto r = readNumber(table, "ingestion", "max_links", ing.maxLinksPerNode); !r)
        return r.error();
    if (auto r = readNumber(table, "ingestion", "title_words", ing.titleWords); !r)
        return r.error();
    readString(table, "ingestion", "source", ing.source);

    if (auto r = checkUnit("dedup_threshold", ing.dedupThreshold); !r)
        return r.error();
    if (auto r = checkUnit("related_threshold", ing.relatedThreshold); !r)
        return r.error();
    if (ing.relatedThreshold > ing.dedupThreshold) {
        return Error{ErrorCode::InvalidArgument,
                     "[ingestion] related_threshold must not exceed dedup_threshold"};
    }

    readString(table, "logging", "level", cfg.logLevel);
    if (!isValidLogLevel(cfg.logLevel)) {
        return Error{ErrorCode::InvalidArgument, "[logging] unknown level: " + cfg.logLevel};
    }
    return cfg;
}

Result<CairnConfig> loadConfig(const std::string& overridePath) {
    const auto path = get_config_path(overridePath);
    std::error_code ec;
    if (!overridePath.empty() && !std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::IoError, "Config file not found: " + path.string()};
    }

    auto table = parse_config_file(path);
    auto cfg = configFromTable(table, get_data_dir());
    if (!cfg)
        return cfg;

    auto& value = cfg.value();
    value.configPath = path;
    if (const char* level = std::getenv("CAIRN_LOG_LEVEL"); level && *level) {
        if (!isValidLogLevel(level)) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("CAIRN_LOG_LEVEL: unknown level: ") + level};
        }
        value.logLevel = level;
    }
    spdlog::debug("Config {} (db {})", path.string(), value.dbPath.string());
    return cfg;
}

} // namespace cairn::config
