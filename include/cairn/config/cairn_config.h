#pragma once

#include <cairn/config/config_helpers.h>
#include <cairn/core/types.h>
#include <cairn/ingest/ingestion_service.h>
#include <cairn/ml/provider.h>

#include <filesystem>
#include <string>

namespace cairn::config {

/**
 * Effective settings after file, environment and defaults are merged.
 *
 *   [storage]    db_path
 *   [extraction] provider endpoint model api_key_env max_tokens timeout_ms
 *   [embedding]  provider endpoint model dimensions api_key_env timeout_ms
 *   [ingestion]  dedup_threshold related_threshold max_links title_words source
 *   [logging]    level
 */
struct CairnConfig {
    std::filesystem::path configPath; // file that was read (may not exist)
    std::filesystem::path dbPath;

    ml::CompletionProviderConfig extraction;
    std::string extractionKeyEnv = "GROQ_API_KEY";

    ml::EmbeddingProviderConfig embedding;
    std::string embeddingKeyEnv;

    ingest::IngestionConfig ingestion;

    std::string logLevel = "warn";
};

/**
 * Build a config from an already parsed table. Environment variables are not consulted
 * except for the API keys named by *_key_env.
 * InvalidArgument on malformed numbers, thresholds outside [0,1], dedup below related,
 * or an unknown log level.
 */
Result<CairnConfig> configFromTable(const ConfigTable& table,
                                    const std::filesystem::path& dataDir);

// get_config_path(overridePath) + configFromTable + CAIRN_LOG_LEVEL
Result<CairnConfig> loadConfig(const std::string& overridePath = "");

bool isValidLogLevel(const std::string& level);

} // namespace cairn::config
