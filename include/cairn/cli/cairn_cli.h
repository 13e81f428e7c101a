#pragma once

#include <cairn/cli/command.h>
#include <cairn/config/cairn_config.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cairn::extraction {
class IExtractionProvider;
}
namespace cairn::ml {
class IEmbeddingProvider;
}
namespace cairn::storage {
class KnowledgeBase;
}

namespace cairn::cli {

/**
 * Main CLI application class. Owns the config and, lazily, the knowledge base and the
 * model collaborators that commands ask for.
 */
class CairnCLI {
public:
    CairnCLI();
    ~CairnCLI();

    int run(int argc, char* argv[]);

    const config::CairnConfig& getConfig() const { return config_; }

    /**
     * Open the knowledge base on first use.
     * @param verify refuse to open when leaves lack embeddings (reindex passes false)
     */
    Result<storage::KnowledgeBase*> getKnowledgeBase(bool verify = true);

    Result<std::shared_ptr<ml::IEmbeddingProvider>> getEmbeddingProvider();

    Result<std::shared_ptr<extraction::IExtractionProvider>> getExtractionProvider();

    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    // Writes json to stdout (indented unless --compact)
    void printJson(const nlohmann::json& j) const;

private:
    Result<void> loadConfiguration();
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string configPath_;
    std::string dbPath_;
    std::string logLevel_;
    bool verbose_ = false;
    bool compact_ = false;

    config::CairnConfig config_;
    std::unique_ptr<storage::KnowledgeBase> kb_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    std::shared_ptr<extraction::IExtractionProvider> extractor_;
};

} // namespace cairn::cli
