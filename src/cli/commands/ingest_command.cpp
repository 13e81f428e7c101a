#include <cairn/cli/cairn_cli.h>
#include <cairn/cli/command_registry.h>
#include <cairn/ingest/ingestion_service.h>
#include <cairn/storage/knowledge_base.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <iterator>

namespace cairn::cli {

using json = nlohmann::json;

namespace {

json toJson(const ingest::IngestionResult& r) {
    json props = json::array();
    for (std::size_t i = 0; i < r.propositions.size(); ++i) {
        auto p = extraction::toJson(r.propositions[i]);
        if (i < r.nodeIds.size())
            p["node_id"] = r.nodeIds[i];
        props.push_back(std::move(p));
    }
    json j = {{"propositions_extracted", r.propositionsExtracted},
              {"propositions_stored", r.propositionsStored},
              {"duplicates_found", r.duplicatesFound},
              {"edges_created", r.edgesCreated},
              {"node_ids", r.nodeIds},
              {"propositions", std::move(props)}};
    if (r.sessionId)
        j["session_id"] = *r.sessionId;
    return j;
}

json toJson(const ingest::BatchIngestionResult& b) {
    json errors = json::array();
    for (const auto& e : b.errors) {
        json je = {{"code", errorToString(e.code)}, {"message", e.message}};
        je["message_index"] = e.messageIndex ? json(*e.messageIndex) : json(nullptr);
        je["source_file"] = e.sourceFile ? json(*e.sourceFile) : json(nullptr);
        errors.push_back(std::move(je));
    }
    return {{"total_messages", b.totalMessages},
            {"total_extracted", b.totalExtracted},
            {"total_stored", b.totalStored},
            {"total_duplicates", b.totalDuplicates},
            {"total_edges", b.totalEdges},
            {"sessions_processed", b.sessionsProcessed},
            {"errors", std::move(errors)}};
}

Result<std::unique_ptr<ingest::IngestionService>> makeService(CairnCLI& cli) {
    auto kb = cli.getKnowledgeBase();
    if (!kb)
        return kb.error();
    auto extractor = cli.getExtractionProvider();
    if (!extractor)
        return extractor.error();
    auto embedder = cli.getEmbeddingProvider();
    if (!embedder)
        return embedder.error();
    return std::make_unique<ingest::IngestionService>(*kb.value(), extractor.value(),
                                                      embedder.value(),
                                                      cli.getConfig().ingestion);
}

class IngestCommand : public ICommand {
public:
    std::string getName() const override { return "ingest"; }

    std::string getDescription() const override {
        return "Extract propositions from one message and store them as leaves";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("text", text_, "Message text, or - to read stdin")->required();
        cmd->add_option("--session", sessionId_, "Session id recorded as provenance");
        cmd->add_option("--source", source_, "Source label (default from config)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        std::string text = text_;
        if (text == "-") {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }

        auto service = makeService(*cli_);
        if (!service)
            return service.error();

        ingest::SessionMetadata meta;
        if (!sessionId_.empty())
            meta.sessionId = sessionId_;
        if (!source_.empty())
            meta.source = source_;

        auto result = service.value()->ingestMessage(text, meta);
        if (!result)
            return result.error();
        cli_->printJson(toJson(result.value()));
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::string text_;
    std::string sessionId_;
    std::string source_;
};

class ImportCommand : public ICommand {
public:
    std::string getName() const override { return "import"; }

    std::string getDescription() const override {
        return "Ingest the user turns of a conversation export (file or directory of *.md)";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("path", path_, "Export file or directory")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto service = makeService(*cli_);
        if (!service)
            return service.error();

        std::error_code ec;
        ingest::BatchIngestionResult batch;
        if (std::filesystem::is_directory(path_, ec)) {
            auto r = service.value()->ingestDirectory(path_);
            if (!r)
                return r.error();
            batch = std::move(r).value();
        } else {
            ingest::ConversationParser parser;
            auto messages = parser.parseFile(path_);
            if (!messages)
                return messages.error();
            batch = service.value()->ingestBatch(messages.value());
        }

        cli_->printJson(toJson(batch));
        if (!batch.errors.empty()) {
            spdlog::warn("{} message(s) or file(s) failed", batch.errors.size());
        }
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::filesystem::path path_;
};

} // namespace

std::unique_ptr<ICommand> CommandRegistry::createIngestCommand() {
    return std::make_unique<IngestCommand>();
}

std::unique_ptr<ICommand> CommandRegistry::createImportCommand() {
    return std::make_unique<ImportCommand>();
}

} // namespace cairn::cli
