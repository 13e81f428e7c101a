#include <cairn/cli/cairn_cli.h>
#include <cairn/cli/command_registry.h>
#include <cairn/metadata/graph_store.h>
#include <cairn/storage/knowledge_base.h>

#include <nlohmann/json.hpp>

namespace cairn::cli {

using json = nlohmann::json;
using namespace cairn::metadata;

namespace {

Result<GraphStore*> openStore(CairnCLI& cli) {
    auto kb = cli.getKnowledgeBase();
    if (!kb)
        return kb.error();
    return &kb.value()->store();
}

Result<Node> requireNode(GraphStore& store, const NodeId& id) {
    auto node = store.getNode(id);
    if (!node)
        return node.error();
    if (!node.value())
        return Error{ErrorCode::NotFound, "No node with id " + id};
    return *node.value();
}

class NodeCommand : public ICommand {
public:
    std::string getName() const override { return "node"; }
    std::string getDescription() const override { return "Show one node and its embeddings"; }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("id", id_, "Node id")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto store = openStore(*cli_);
        if (!store)
            return store.error();
        auto node = requireNode(*store.value(), id_);
        if (!node)
            return node.error();

        auto embeddings = store.value()->getEmbeddings(id_);
        if (!embeddings)
            return embeddings.error();

        json out = toJson(node.value());
        out["embeddings"] = json::array();
        for (const auto& e : embeddings.value()) {
            out["embeddings"].push_back(
                {{"type", toString(e.type)}, {"dim", e.dim()}, {"model", e.model}});
        }
        cli_->printJson(out);
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::string id_;
};

class ChildrenCommand : public ICommand {
public:
    std::string getName() const override { return "children"; }
    std::string getDescription() const override {
        return "List CONTAINS children, or the module tree with --tree";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("id", id_, "Parent node id")->required();
        cmd->add_flag("--tree", tree_, "Walk the hierarchy");
        cmd->add_option("--depth", depth_, "Tree depth")->default_val(3)->check(CLI::PositiveNumber);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto store = openStore(*cli_);
        if (!store)
            return store.error();

        if (tree_) {
            auto tree = store.value()->getModuleTree(id_, depth_);
            if (!tree)
                return tree.error();
            cli_->printJson(toJson(tree.value()));
            return {};
        }

        auto children = store.value()->getChildren(id_);
        if (!children)
            return children.error();
        json out = json::array();
        for (const auto& child : children.value())
            out.push_back(toJson(child));
        cli_->printJson(out);
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::string id_;
    bool tree_ = false;
    int depth_ = 3;
};

class RelatedCommand : public ICommand {
public:
    std::string getName() const override { return "related"; }
    std::string getDescription() const override {
        return "List nodes connected by semantic edges, in both directions";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("id", id_, "Node id")->required();
        cmd->add_option("-t,--type", type_, "Only this edge type (e.g. SUPPORTS)");
        cmd->add_flag("--contradictions", contradictions_, "Only CONTRADICTS neighbours");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto store = openStore(*cli_);
        if (!store)
            return store.error();

        Result<std::vector<RelatedNode>> related = std::vector<RelatedNode>{};
        if (contradictions_) {
            related = store.value()->findContradictions(id_);
        } else {
            std::optional<EdgeType> type;
            if (!type_.empty()) {
                auto parsed = parseEdgeType(type_);
                if (!parsed)
                    return parsed.error();
                type = parsed.value();
            }
            related = store.value()->getRelated(id_, type);
        }
        if (!related)
            return related.error();

        json out = json::array();
        for (const auto& r : related.value())
            out.push_back(toJson(r));
        cli_->printJson(out);
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::string id_;
    std::string type_;
    bool contradictions_ = false;
};

class LinkCommand : public ICommand {
public:
    std::string getName() const override { return "link"; }
    std::string getDescription() const override { return "Create a typed edge between two nodes"; }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("from", from_, "Source node id")->required();
        cmd->add_option("to", to_, "Target node id")->required();
        cmd->add_option("type", type_, "Edge type (CONTAINS, SUPPORTS, ...)")->required();
        cmd->add_option("--confidence", confidence_, "Edge confidence in [0,1]");
        cmd->add_option("--status", status_, "confirmed, suggested, faded or rejected");
        cmd->add_option("--rationale", rationale_, "Why the edge exists (SUPPORTS, CONTRADICTS)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto type = parseEdgeType(type_);
        if (!type)
            return type.error();

        EdgeProperties props;
        props.confidence = confidence_;
        if (status_) {
            auto status = parseNodeStatus(*status_);
            if (!status)
                return Error{ErrorCode::InvalidArgument, "Unknown status: " + *status_};
            props.status = *status;
        }
        props.rationale = rationale_;

        auto kb = cli_->getKnowledgeBase();
        if (!kb)
            return kb.error();
        auto writer = kb.value()->acquireWriter();
        auto edge = kb.value()->store().createEdge(from_, to_, type.value(), props);
        if (!edge)
            return edge.error();
        cli_->printJson(toJson(edge.value()));
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::string from_;
    std::string to_;
    std::string type_;
    std::optional<double> confidence_;
    std::optional<std::string> status_;
    std::optional<std::string> rationale_;
};

class ModuleCommand : public ICommand {
public:
    std::string getName() const override { return "module"; }
    std::string getDescription() const override {
        return "Declare a module (a goal that leaves can be organised under)";
    }

    void registerCommand(CLI::App& app, CairnCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("title", title_, "Module title")->required();
        cmd->add_option("-g,--goal", goal_, "Primary intention")->required();
        cmd->add_option("--secondary", secondary_, "Secondary intentions");
        cmd->add_option("--done", done_, "Definition of done");
        cmd->add_option("--priority", priority_, "Declared priority in [0,1]")
            ->check(CLI::Range(0.0, 1.0));
        cmd->add_option("--depth", depth_, "Research depth")->default_val(5);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        ModulePayload module;
        module.intentions.primary = goal_;
        module.intentions.secondary = secondary_;
        module.intentions.definitionOfDone = done_;
        module.intentions.declaredPriority = priority_;
        module.priority = priority_.value_or(0.0);
        module.researchDepth = depth_;

        NodeDraft draft;
        draft.title = title_;
        draft.content = goal_;
        draft.payload = std::move(module);

        auto kb = cli_->getKnowledgeBase();
        if (!kb)
            return kb.error();
        auto writer = kb.value()->acquireWriter();
        auto node = kb.value()->store().createNode(draft);
        if (!node)
            return node.error();
        cli_->printJson(toJson(node.value()));
        return {};
    }

private:
    CairnCLI* cli_ = nullptr;
    std::string title_;
    std::string goal_;
    std::vector<std::string> secondary_;
    std::string done_;
    std::optional<double> priority_;
    int depth_ = 5;
};

} // namespace

std::unique_ptr<ICommand> CommandRegistry::createNodeCommand() {
    return std::make_unique<NodeCommand>();
}

std::unique_ptr<ICommand> CommandRegistry::createChildrenCommand() {
    return std::make_unique<ChildrenCommand>();
}

std::unique_ptr<ICommand> CommandRegistry::createRelatedCommand() {
    return std::make_unique<RelatedCommand>();
}

std::unique_ptr<ICommand> CommandRegistry::createLinkCommand() {
    return std::make_unique<LinkCommand>();
}

std::unique_ptr<ICommand> CommandRegistry::createModuleCommand() {
    return std::make_unique<ModuleCommand>();
}

} // namespace cairn::cli
