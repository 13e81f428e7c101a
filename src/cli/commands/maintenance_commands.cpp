#include <cairn/cli/cairn_cli.h>
#include <cairn/cli/command_registry.h>
#include <cairn/metadata/graph_store.h>
#include <cairn/ml/provider.h>
#include <cairn/storage/knowledge_base.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cairn::cli {

using json = nlohmann::json;
using namespace cairn::metadata;

namespace {

class SimilarCommand : public ICommand {
public:
    std::string getName() const override { return "similar"; }
    std::string getDescription() const override {
        return "Rank stored leaves by cosine similarity to a text";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("text", text_, "Query text")->required();
        cmd->add_option("--threshold", threshold_, "Minimum similarity")
            ->default_val(0.5)
            ->check(CLI::Range(-1.0, 1.0));
        cmd->add_option("-n,--limit", limit_, "Maximum results (0: all)")->default_val(10);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto kb = cli_->getKnowledgeBase();
        if (!kb)
            return kb.error();
        auto embedder = cli_->getEmbeddingProvider();
        if (!embedder)
            return embedder.error();

        auto query = embedder.value()->generateEmbedding(text_);
        if (!query)
            return query.error();
        auto matches =
            kb.value()->findSimilar(query.value(), EmbeddingType::Content, threshold_, limit_);
        if (!matches)
            return matches.error();

        json out = json::array();
        for (const auto& m : matches.value()) {
            json entry = {{"node_id", m.nodeId}, {"score", m.score}};
            auto node = kb.value()->store().getNode(m.nodeId);
            if (node && node.value()) {
                entry["title"] = node.value()->title;
                entry["content"] = node.value()->content;
            }
            out.push_back(std::move(entry));
        }
        cli_->printJson(out);
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::string text_;
    double threshold_ = 0.5;
    std::size_t limit_ = 10;
};

class ReindexCommand : public ICommand {
public:
    std::string getName() const override { return "reindex"; }
    std::string getDescription() const override {
        return "Backfill missing leaf embeddings and rebuild the similarity index";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto kb = cli_->getKnowledgeBase(false);
        if (!kb)
            return kb.error();
        auto embedder = cli_->getEmbeddingProvider();
        if (!embedder)
            return embedder.error();

        auto writer = kb.value()->acquireWriter();
        auto repaired = kb.value()->backfillEmbeddings(*embedder.value());
        if (!repaired)
            return repaired.error();
        if (auto rebuilt = kb.value()->rebuildIndex(); !rebuilt)
            return rebuilt.error();
        if (auto verified = kb.value()->verifyInvariants(); !verified)
            return verified.error();

        cli_->printJson({{"repaired", repaired.value()},
                         {"indexed", kb.value()->index().size(EmbeddingType::Content)}});
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
};

class StatsCommand : public ICommand {
public:
    std::string getName() const override { return "stats"; }
    std::string getDescription() const override {
        return "Node, edge and embedding counts plus a health check";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto kb = cli_->getKnowledgeBase();
        if (!kb)
            return kb.error();
        auto& store = kb.value()->store();

        json nodes = json::object();
        for (auto v : {NodeVariant::Module, NodeVariant::Internal, NodeVariant::Leaf,
                       NodeVariant::Organization}) {
            auto n = store.countNodes(v);
            if (!n)
                return n.error();
            nodes[toString(v)] = n.value();
        }

        json edges = json::object();
        for (auto t : {EdgeType::Contains, EdgeType::Supports, EdgeType::Contradicts,
                       EdgeType::Enables, EdgeType::Supersedes, EdgeType::References,
                       EdgeType::SimilarTo}) {
            auto n = store.countEdges(t);
            if (!n)
                return n.error();
            edges[toString(t)] = n.value();
        }

        auto embeddings = store.countEmbeddings(EmbeddingType::Content);
        if (!embeddings)
            return embeddings.error();
        auto version = store.schemaVersion();
        if (!version)
            return version.error();
        auto health = store.healthCheck();

        const auto& index = kb.value()->index();
        json out = {{"db_path", kb.value()->config().dbPath},
                    {"schema_version", version.value()},
                    {"nodes", nodes},
                    {"edges", edges},
                    {"content_embeddings", embeddings.value()},
                    {"indexed", index.size(EmbeddingType::Content)},
                    {"healthy", static_cast<bool>(health)}};
        if (auto dim = index.dimension(EmbeddingType::Content))
            out["dimension"] = *dim;
        if (!health)
            out["health_error"] = health.error().message;
        cli_->printJson(out);
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
};

} // namespace

std::unique_ptr<ICommand> CommandRegistry::createSimilarCommand() {
    return std::make_unique<SimilarCommand>();
}

std::unique_ptr<ICommand> CommandRegistry::createReindexCommand() {
    return std::make_unique<ReindexCommand>();
}

std::unique_ptr<ICommand> CommandRegistry::createStatsCommand() {
    return std::make_unique<StatsCommand>();
}

} // namespace cairn::cli
