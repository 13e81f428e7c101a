#include <cairn/cli/cairn_cli.h>
#include <cairn/cli/command_registry.h>
#include <cairn/extraction/extraction_provider.h>
#include <cairn/ml/provider.h>
#include <cairn/storage/knowledge_base.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace cairn::cli {

namespace fs = std::filesystem;

CairnCLI::CairnCLI() {
    app_ = std::make_unique<CLI::App>("cairn - leaf-first personal knowledge graph", "cairn");
    app_->require_subcommand(1);

    app_->add_option("-c,--config", configPath_, "Config file (default: $CAIRN_CONFIG or XDG)");
    app_->add_option("--db", dbPath_, "SQLite knowledge base (overrides [storage] db_path)");
    app_->add_option("--log-level", logLevel_, "trace, debug, info, warn, error, critical, off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app_->add_flag("-v,--verbose", verbose_, "Debug logging");
    app_->add_flag("--compact", compact_, "Single-line JSON output");
}

CairnCLI::~CairnCLI() {
    if (embedder_)
        embedder_->shutdown();
}

int CairnCLI::run(int argc, char* argv[]) {
    commands_ = CommandRegistry::createAllCommands();
    for (auto& cmd : commands_) {
        cmd->registerCommand(*app_, this);
    }

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (auto loaded = loadConfiguration(); !loaded) {
        spdlog::error("Configuration error: {}", loaded.error().message);
        return 1;
    }
    applyLogLevel();

    if (!pendingCommand_) {
        std::cerr << app_->help() << std::endl;
        return 1;
    }

    auto result = pendingCommand_->execute();
    if (!result) {
        spdlog::error("{} failed: {} ({})", pendingCommand_->getName(), result.error().message,
                      result.error().code);
        return 1;
    }
    return 0;
}

Result<void> CairnCLI::loadConfiguration() {
    auto cfg = config::loadConfig(configPath_);
    if (!cfg)
        return cfg.error();
    config_ = std::move(cfg).value();
    if (!dbPath_.empty())
        config_.dbPath = config::expand_tilde(dbPath_);
    return {};
}

// Precedence: --log-level > -v > CAIRN_LOG_LEVEL / [logging] level
void CairnCLI::applyLogLevel() {
    std::string level = config_.logLevel;
    if (verbose_)
        level = "debug";
    if (!logLevel_.empty())
        level = logLevel_;
    spdlog::set_level(spdlog::level::from_str(level));
}

Result<storage::KnowledgeBase*> CairnCLI::getKnowledgeBase(bool verify) {
    if (kb_)
        return kb_.get();

    storage::KnowledgeBaseConfig kbConfig;
    kbConfig.dbPath = config_.dbPath.string();
    kbConfig.verifyOnOpen = verify;

    if (kbConfig.dbPath != ":memory:") {
        std::error_code ec;
        const auto parent = config_.dbPath.parent_path();
        if (!parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::IoError,
                             "Cannot create " + parent.string() + ": " + ec.message()};
            }
        }
    }

    auto kb = storage::KnowledgeBase::open(kbConfig);
    if (!kb) {
        if (kb.error().code == ErrorCode::CorruptedData) {
            spdlog::warn("Run `cairn reindex` to backfill missing embeddings");
        }
        return kb.error();
    }
    kb_ = std::move(kb).value();
    return kb_.get();
}

Result<std::shared_ptr<ml::IEmbeddingProvider>> CairnCLI::getEmbeddingProvider() {
    if (embedder_)
        return embedder_;

    auto provider = ml::createEmbeddingProvider(config_.embedding);
    if (!provider)
        return provider.error();
    std::shared_ptr<ml::IEmbeddingProvider> shared = std::move(provider).value();
    if (auto init = shared->initialize(); !init)
        return init.error();

    spdlog::debug("Embedding provider {} ({}, {} dims)", shared->getProviderName(),
                  shared->getModelName(), shared->getEmbeddingDimension());
    embedder_ = std::move(shared);
    return embedder_;
}

Result<std::shared_ptr<extraction::IExtractionProvider>> CairnCLI::getExtractionProvider() {
    if (extractor_)
        return extractor_;

    if (config_.extraction.provider != "ollama" && config_.extraction.apiKey.empty()) {
        spdlog::warn("{} is not set; extraction requests will likely be rejected",
                     config_.extractionKeyEnv);
    }
    auto completion = ml::createCompletionProvider(config_.extraction);
    if (!completion)
        return completion.error();

    std::shared_ptr<ml::ICompletionProvider> shared = std::move(completion).value();
    extractor_ = std::make_shared<extraction::LlmExtractionProvider>(std::move(shared));
    return extractor_;
}

void CairnCLI::printJson(const nlohmann::json& j) const {
    std::cout << (compact_ ? j.dump() : j.dump(2)) << std::endl;
}

} // namespace cairn::cli
