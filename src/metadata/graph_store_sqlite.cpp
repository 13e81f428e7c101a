#include <cairn/core/time_util.h>
#include <cairn/core/types.h>
#include <cairn/core/uuid.h>
#include <cairn/metadata/database.h>
#include <cairn/metadata/graph_store.h>
#include <cairn/metadata/migration.h>

#include <spdlog/spdlog.h>

#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cairn::metadata {

namespace {

constexpr const char* kNodeSelect =
    "SELECT n.id, n.variant, n.title, n.content, n.created_at, n.updated_at, "
    "m.intentions, m.priority, m.research_depth, m.active, m.declared_at, "
    "b.status, b.source, b.confidence, b.purpose, b.source_type, b.valence, "
    "b.valid_from, b.valid_to, b.recorded_at, b.suggested_at, b.structured_data, "
    "b.session_id, b.message_index, b.source_char_start, b.source_char_end, b.source_file, "
    "o.kind, o.confidence, o.valid_from, o.valid_to "
    "FROM nodes n "
    "LEFT JOIN module_nodes m ON m.node_id = n.id "
    "LEFT JOIN belief_nodes b ON b.node_id = n.id "
    "LEFT JOIN organization_nodes o ON o.node_id = n.id ";

constexpr const char* kEdgeSelect =
    "SELECT e.id, e.from_id, e.to_id, e.edge_type, e.status, e.confidence, e.rationale, "
    "e.created_at FROM edges e ";

std::optional<std::int64_t> optMillis(const std::optional<TimePoint>& tp) {
    if (!tp)
        return std::nullopt;
    return core::toUnixMillis(*tp);
}

std::optional<TimePoint> readOptTime(const Statement& stmt, int column) {
    auto ms = stmt.getOptionalInt64(column);
    if (!ms)
        return std::nullopt;
    return core::fromUnixMillis(*ms);
}

Result<void> checkConfidence(double confidence, const char* what) {
    if (confidence < 0.0 || confidence > 1.0) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("{} confidence {} outside [0,1]", what, confidence)};
    }
    return {};
}

std::string intentionsToJson(const ModuleIntentions& in) {
    nlohmann::json j;
    j["primary"] = in.primary;
    j["secondary"] = in.secondary;
    j["definition_of_done"] = in.definitionOfDone;
    j["declared_priority"] =
        in.declaredPriority ? nlohmann::json(*in.declaredPriority) : nlohmann::json(nullptr);
    return j.dump();
}

Result<ModuleIntentions> intentionsFromJson(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::CorruptedData, "Module intentions are not a JSON object"};
    }
    ModuleIntentions in;
    in.primary = j.value("primary", std::string{});
    if (auto it = j.find("secondary"); it != j.end() && it->is_array()) {
        for (const auto& s : *it) {
            if (s.is_string())
                in.secondary.push_back(s.get<std::string>());
        }
    }
    in.definitionOfDone = j.value("definition_of_done", std::string{});
    if (auto it = j.find("declared_priority"); it != j.end() && it->is_number()) {
        in.declaredPriority = it->get<double>();
    }
    return in;
}

Result<BeliefFields> readBelief(const Statement& stmt) {
    BeliefFields b;
    auto status = parseNodeStatus(stmt.getString(11));
    auto sourceType = parseSourceType(stmt.getString(15));
    if (!status || !sourceType) {
        return Error{ErrorCode::CorruptedData,
                     "Unreadable belief row for node " + stmt.getString(0)};
    }
    b.status = *status;
    b.source = stmt.getString(12);
    b.confidence = stmt.getDouble(13);
    b.purpose = coercePurpose(stmt.getString(14));
    b.sourceType = *sourceType;
    if (auto valence = stmt.getOptionalString(16))
        b.valence = parseValence(*valence);
    b.validFrom = readOptTime(stmt, 17);
    b.validTo = readOptTime(stmt, 18);
    b.recordedAt = core::fromUnixMillis(stmt.getInt64(19));
    b.suggestedAt = readOptTime(stmt, 20);
    if (auto data = stmt.getOptionalString(21)) {
        auto j = nlohmann::json::parse(*data, nullptr, false);
        if (j.is_discarded()) {
            return Error{ErrorCode::CorruptedData,
                         "structured_data is not valid JSON for node " + stmt.getString(0)};
        }
        b.structuredData = std::move(j);
    }
    b.provenance.sessionId = stmt.getOptionalString(22);
    b.provenance.messageIndex = stmt.getOptionalInt64(23);
    b.provenance.charStart = stmt.getOptionalInt64(24);
    b.provenance.charEnd = stmt.getOptionalInt64(25);
    b.provenance.sourceFile = stmt.getOptionalString(26);
    return b;
}

// Reads one row produced by kNodeSelect
Result<Node> readNode(const Statement& stmt) {
    Node node;
    node.id = stmt.getString(0);
    auto variant = parseNodeVariant(stmt.getString(1));
    if (!variant) {
        return Error{ErrorCode::CorruptedData, "Unknown node variant '" + stmt.getString(1) +
                                                   "' for node " + node.id};
    }
    node.title = stmt.getString(2);
    node.content = stmt.getString(3);
    node.createdAt = core::fromUnixMillis(stmt.getInt64(4));
    node.updatedAt = core::fromUnixMillis(stmt.getInt64(5));

    switch (*variant) {
        case NodeVariant::Module: {
            if (stmt.isNull(6)) {
                return Error{ErrorCode::CorruptedData, "Module payload missing for " + node.id};
            }
            auto intentions = intentionsFromJson(stmt.getString(6));
            if (!intentions)
                return intentions.error();
            ModulePayload m;
            m.intentions = std::move(intentions).value();
            m.priority = stmt.getDouble(7);
            m.researchDepth = stmt.getInt(8);
            m.active = stmt.getInt(9) != 0;
            m.declaredAt = core::fromUnixMillis(stmt.getInt64(10));
            node.payload = std::move(m);
            break;
        }
        case NodeVariant::Internal:
        case NodeVariant::Leaf: {
            if (stmt.isNull(11)) {
                return Error{ErrorCode::CorruptedData, "Belief payload missing for " + node.id};
            }
            auto belief = readBelief(stmt);
            if (!belief)
                return belief.error();
            if (*variant == NodeVariant::Internal) {
                node.payload = InternalPayload{std::move(belief).value()};
            } else {
                node.payload = LeafPayload{std::move(belief).value()};
            }
            break;
        }
        case NodeVariant::Organization: {
            if (stmt.isNull(27)) {
                return Error{ErrorCode::CorruptedData,
                             "Organization payload missing for " + node.id};
            }
            auto kind = parseOrganizationKind(stmt.getString(27));
            if (!kind) {
                return Error{ErrorCode::CorruptedData,
                             "Unknown organization kind for node " + node.id};
            }
            OrganizationPayload o;
            o.kind = *kind;
            o.confidence = stmt.getDouble(28);
            o.validFrom = readOptTime(stmt, 29);
            o.validTo = readOptTime(stmt, 30);
            node.payload = o;
            break;
        }
    }
    return node;
}

Result<Edge> readEdge(const Statement& stmt) {
    Edge edge;
    edge.id = stmt.getString(0);
    edge.fromId = stmt.getString(1);
    edge.toId = stmt.getString(2);
    auto type = parseEdgeType(stmt.getString(3));
    if (!type) {
        return Error{ErrorCode::CorruptedData, type.error().message};
    }
    edge.type = type.value();
    if (auto status = stmt.getOptionalString(4))
        edge.props.status = parseNodeStatus(*status);
    if (!stmt.isNull(5))
        edge.props.confidence = stmt.getDouble(5);
    edge.props.rationale = stmt.getOptionalString(6);
    edge.createdAt = core::fromUnixMillis(stmt.getInt64(7));
    return edge;
}

Result<NodeEmbedding> readEmbedding(const Statement& stmt) {
    NodeEmbedding e;
    e.nodeId = stmt.getString(0);
    auto type = parseEmbeddingType(stmt.getString(1));
    if (!type) {
        return Error{ErrorCode::CorruptedData, "Unknown embedding type for node " + e.nodeId};
    }
    e.type = *type;
    const auto dim = stmt.getInt64(2);
    auto blob = stmt.getBlob(3);
    if (dim <= 0 || blob.size() != static_cast<std::size_t>(dim) * sizeof(float)) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("Embedding blob for node {} has {} bytes, expected {} floats",
                                 e.nodeId, blob.size(), dim)};
    }
    e.vector.resize(static_cast<std::size_t>(dim));
    std::memcpy(e.vector.data(), blob.data(), blob.size());
    e.model = stmt.getString(4);
    e.createdAt = core::fromUnixMillis(stmt.getInt64(5));
    return e;
}

// Collects rows of a prepared node query
Result<std::vector<Node>> collectNodes(Statement& stmt) {
    std::vector<Node> nodes;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        auto node = readNode(stmt);
        if (!node)
            return node.error();
        nodes.push_back(std::move(node).value());
    }
    return nodes;
}

} // namespace

class SqliteGraphStore final : public GraphStore {
public:
    static Result<std::unique_ptr<SqliteGraphStore>> createWithPath(const std::string& dbPath,
                                                                    const GraphStoreConfig& cfg) {
        auto store = std::unique_ptr<SqliteGraphStore>(new SqliteGraphStore(cfg));
        auto& db = store->db_;

        auto rOpen = db.open(dbPath);
        if (!rOpen)
            return rOpen.error();

        if (cfg.enable_wal && dbPath != ":memory:") {
            auto rWal = db.enableWAL();
            if (!rWal)
                spdlog::warn("enableWAL failed during graph store init: {}", rWal.error().message);
        }
        auto rFK = db.enableForeignKeys();
        if (!rFK)
            return rFK.error();
        auto rBusy = db.setBusyTimeout(cfg.busy_timeout);
        if (!rBusy)
            return rBusy.error();

        MigrationManager mm(db);
        auto rInit = mm.initialize();
        if (!rInit)
            return rInit.error();
        mm.registerMigrations(GraphSchemaMigrations::getAllMigrations());
        auto rMig = mm.migrate();
        if (!rMig)
            return rMig.error();

        spdlog::debug("Graph store ready at {} (schema v{})", dbPath, mm.getLatestVersion());
        return store;
    }

    const GraphStoreConfig& getConfig() const override { return cfg_; }

    // Nodes

    Result<Node> createNode(const NodeDraft& draft) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<Node> created;
        auto tx = db_.transaction([&]() -> Result<void> {
            auto node = insertNodeLocked(draft);
            if (!node)
                return node.error();
            created = std::move(node).value();
            return {};
        });
        if (!tx)
            return tx.error();
        return std::move(*created);
    }

    Result<Node> createNodeWithEmbedding(const NodeDraft& draft, EmbeddingType type,
                                         const std::vector<float>& vector,
                                         const std::string& model) override {
        if (vector.empty()) {
            return Error{ErrorCode::InvalidArgument, "Embedding vector is empty"};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<Node> created;
        auto tx = db_.transaction([&]() -> Result<void> {
            auto node = insertNodeLocked(draft);
            if (!node)
                return node.error();

            NodeEmbedding embedding;
            embedding.nodeId = node.value().id;
            embedding.type = type;
            embedding.vector = vector;
            embedding.model = model;
            embedding.createdAt = node.value().createdAt;
            auto stored = insertEmbeddingLocked(embedding);
            if (!stored)
                return stored;

            created = std::move(node).value();
            return {};
        });
        if (!tx)
            return tx.error();
        return std::move(*created);
    }

    Result<std::optional<Node>> getNode(const NodeId& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return getNodeLocked(id);
    }

    Result<std::vector<Node>> listNodes(std::optional<NodeVariant> variant, std::size_t limit,
                                        std::size_t offset) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string sql = kNodeSelect;
        sql += variant ? "WHERE n.variant = ? " : "WHERE n.variant != 'organization' ";
        sql += "ORDER BY n.created_at, n.id LIMIT ? OFFSET ?";

        auto stmtR = db_.prepare(sql);
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();

        int idx = 1;
        if (variant) {
            auto br = stmt.bind(idx++, toString(*variant));
            if (!br)
                return br.error();
        }
        const auto effectiveLimit = limit == 0 ? cfg_.default_limit : limit;
        auto br = stmt.bind(idx++, static_cast<int64_t>(effectiveLimit));
        if (!br)
            return br.error();
        br = stmt.bind(idx, static_cast<int64_t>(offset));
        if (!br)
            return br.error();
        return collectNodes(stmt);
    }

    Result<std::vector<Node>> findNodesBySession(std::string_view sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare(std::string(kNodeSelect) +
                                 "WHERE b.session_id = ? "
                                 "ORDER BY b.message_index, b.recorded_at, n.created_at");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, sessionId);
        if (!br)
            return br.error();
        return collectNodes(stmt);
    }

    Result<std::vector<Node>> findNodesByRecordedRange(TimePoint from, TimePoint to) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare(std::string(kNodeSelect) +
                                 "WHERE b.recorded_at >= ? AND b.recorded_at < ? "
                                 "ORDER BY b.recorded_at, n.created_at");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(core::toUnixMillis(from), core::toUnixMillis(to));
        if (!br)
            return br.error();
        return collectNodes(stmt);
    }

    Result<void> updateNodeStatus(const NodeId& id, NodeStatus status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = getNodeLocked(id);
        if (!existing)
            return existing.error();
        if (!existing.value()) {
            return Error{ErrorCode::NotFound, "Node not found: " + id};
        }
        const Node& node = *existing.value();
        const BeliefFields* belief = node.belief();
        if (!belief) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Status does not apply to ") + toString(node.variant()) +
                             " nodes"};
        }

        const auto now = core::toUnixMillis(core::nowMillis());
        std::optional<std::int64_t> suggestedAt = optMillis(belief->suggestedAt);
        if (status == NodeStatus::Suggested && !suggestedAt)
            suggestedAt = now;

        return db_.transaction([&]() -> Result<void> {
            auto stmtR =
                db_.prepare("UPDATE belief_nodes SET status = ?, suggested_at = ? WHERE node_id = ?");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bindAll(toString(status), suggestedAt, id);
            if (!br)
                return br;
            auto er = stmt.execute();
            if (!er)
                return er;

            auto touchR = db_.prepare("UPDATE nodes SET updated_at = ? WHERE id = ?");
            if (!touchR)
                return touchR.error();
            auto touch = std::move(touchR).value();
            br = touch.bindAll(now, id);
            if (!br)
                return br;
            return touch.execute();
        });
    }

    Result<std::int64_t> countNodes(std::optional<NodeVariant> variant) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare(variant ? "SELECT COUNT(*) FROM nodes WHERE variant = ?"
                                         : "SELECT COUNT(*) FROM nodes");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        if (variant) {
            auto br = stmt.bind(1, toString(*variant));
            if (!br)
                return br.error();
        }
        auto step = stmt.step();
        if (!step)
            return step.error();
        return stmt.getInt64(0);
    }

    // Edges

    Result<Edge> createEdge(const NodeId& fromId, const NodeId& toId, EdgeType type,
                            const EdgeProperties& props) override {
        if (!findEdgeRule(type)) {
            return Error{ErrorCode::ValidationError,
                         "Unknown edge type " + std::to_string(static_cast<int>(type))};
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto from = getNodeLocked(fromId);
        if (!from)
            return from.error();
        if (!from.value()) {
            return Error{ErrorCode::NotFound, "Edge source node not found: " + fromId};
        }
        auto to = getNodeLocked(toId);
        if (!to)
            return to.error();
        if (!to.value()) {
            return Error{ErrorCode::NotFound, "Edge target node not found: " + toId};
        }

        auto valid = validateEdge(type, from.value()->variant(), to.value()->variant(), props);
        if (!valid)
            return valid.error();

        auto exists = edgeExistsLocked(fromId, toId, type);
        if (!exists)
            return exists.error();
        if (exists.value()) {
            return Error{ErrorCode::ValidationError, fmt::format("{} edge {} -> {} already exists",
                                                                 toString(type), fromId, toId)};
        }

        Edge edge;
        edge.id = core::generateUUID();
        edge.fromId = fromId;
        edge.toId = toId;
        edge.type = type;
        edge.props = withEdgeDefaults(type, props);
        edge.createdAt = core::nowMillis();

        auto tx = db_.transaction([&]() -> Result<void> {
            auto stmtR = db_.prepare("INSERT INTO edges (id, from_id, to_id, edge_type, status, "
                                     "confidence, rationale, created_at) "
                                     "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            std::optional<std::string> status;
            if (edge.props.status)
                status = toString(*edge.props.status);
            auto br = stmt.bindAll(edge.id, edge.fromId, edge.toId, toString(edge.type), status,
                                   edge.props.confidence, edge.props.rationale,
                                   core::toUnixMillis(edge.createdAt));
            if (!br)
                return br;
            return stmt.execute();
        });
        if (!tx)
            return tx.error();

        spdlog::debug("Created {} edge {} -> {}", toString(type), fromId, toId);
        return edge;
    }

    Result<std::vector<Node>> getChildren(const NodeId& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return getChildrenLocked(id);
    }

    Result<std::vector<RelatedNode>> getRelated(const NodeId& id,
                                                std::optional<EdgeType> type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return getRelatedLocked(id, type);
    }

    Result<std::vector<RelatedNode>> findContradictions(const NodeId& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return getRelatedLocked(id, EdgeType::Contradicts);
    }

    Result<ModuleTree> getModuleTree(const NodeId& rootId, int maxDepth) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto root = getNodeLocked(rootId);
        if (!root)
            return root.error();
        if (!root.value()) {
            return Error{ErrorCode::NotFound, "Node not found: " + rootId};
        }
        ModuleTree tree{std::move(*root.value()), {}};
        std::unordered_set<NodeId> visited{rootId};
        auto built = expandTreeLocked(tree, maxDepth, visited);
        if (!built)
            return built.error();
        return tree;
    }

    Result<bool> edgeExists(const NodeId& fromId, const NodeId& toId, EdgeType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return edgeExistsLocked(fromId, toId, type);
    }

    Result<std::int64_t> countEdges(std::optional<EdgeType> type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare(type ? "SELECT COUNT(*) FROM edges WHERE edge_type = ?"
                                      : "SELECT COUNT(*) FROM edges");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        if (type) {
            auto br = stmt.bind(1, toString(*type));
            if (!br)
                return br.error();
        }
        auto step = stmt.step();
        if (!step)
            return step.error();
        return stmt.getInt64(0);
    }

    // Embeddings

    Result<void> storeEmbedding(const NodeEmbedding& embedding) override {
        if (embedding.vector.empty()) {
            return Error{ErrorCode::InvalidArgument, "Embedding vector is empty"};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto node = getNodeLocked(embedding.nodeId);
        if (!node)
            return node.error();
        if (!node.value()) {
            return Error{ErrorCode::NotFound, "Node not found: " + embedding.nodeId};
        }
        return insertEmbeddingLocked(embedding);
    }

    Result<std::vector<NodeEmbedding>> getEmbeddings(const NodeId& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare("SELECT node_id, embedding_type, dim, vector, model, created_at "
                                 "FROM node_embeddings WHERE node_id = ? ORDER BY rowid");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, id);
        if (!br)
            return br.error();
        return collectEmbeddings(stmt);
    }

    Result<std::vector<NodeEmbedding>> loadEmbeddings(EmbeddingType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare("SELECT node_id, embedding_type, dim, vector, model, created_at "
                                 "FROM node_embeddings WHERE embedding_type = ? ORDER BY rowid");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, toString(type));
        if (!br)
            return br.error();
        return collectEmbeddings(stmt);
    }

    Result<std::vector<NodeId>> findLeavesMissingEmbedding(EmbeddingType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare(
            "SELECT n.id FROM nodes n WHERE n.variant = 'leaf' AND NOT EXISTS ("
            "SELECT 1 FROM node_embeddings ne WHERE ne.node_id = n.id AND ne.embedding_type = ?) "
            "ORDER BY n.created_at");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, toString(type));
        if (!br)
            return br.error();

        std::vector<NodeId> ids;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            ids.push_back(stmt.getString(0));
        }
        return ids;
    }

    Result<std::int64_t> countEmbeddings(EmbeddingType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare("SELECT COUNT(*) FROM node_embeddings WHERE embedding_type = ?");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, toString(type));
        if (!br)
            return br.error();
        auto step = stmt.step();
        if (!step)
            return step.error();
        return stmt.getInt64(0);
    }

    // Maintenance

    Result<void> healthCheck() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtR = db_.prepare("PRAGMA integrity_check");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto step = stmt.step();
        if (!step)
            return step.error();
        const auto verdict = step.value() ? stmt.getString(0) : std::string("no result");
        if (verdict != "ok") {
            spdlog::warn("Graph store healthCheck failed: {}", verdict);
            return Error{ErrorCode::CorruptedData, "integrity_check: " + verdict};
        }
        return {};
    }

    Result<int> schemaVersion() override {
        std::lock_guard<std::mutex> lock(mutex_);
        MigrationManager mm(db_);
        return mm.getCurrentVersion();
    }

private:
    explicit SqliteGraphStore(GraphStoreConfig cfg) : cfg_(std::move(cfg)) {}

    Result<std::optional<Node>> getNodeLocked(const NodeId& id) {
        auto stmtR = db_.prepare(std::string(kNodeSelect) + "WHERE n.id = ?");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, id);
        if (!br)
            return br.error();
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            return std::optional<Node>{};
        auto node = readNode(stmt);
        if (!node)
            return node.error();
        return std::optional<Node>{std::move(node).value()};
    }

    Result<Node> insertNodeLocked(const NodeDraft& draft) {
        Node node;
        node.id = core::generateUUID();
        node.title = draft.title;
        node.content = draft.content;
        node.createdAt = core::nowMillis();
        node.updatedAt = node.createdAt;
        node.payload = draft.payload;

        if (auto* module = std::get_if<ModulePayload>(&node.payload)) {
            if (module->declaredAt == TimePoint{})
                module->declaredAt = node.createdAt;
        } else if (auto* org = std::get_if<OrganizationPayload>(&node.payload)) {
            auto ok = checkConfidence(org->confidence, "Node");
            if (!ok)
                return ok.error();
        } else if (auto* belief = node.belief()) {
            auto ok = checkConfidence(belief->confidence, "Node");
            if (!ok)
                return ok.error();
            if (!belief->structuredData.is_null() && !belief->structuredData.is_object()) {
                return Error{ErrorCode::ValidationError, "structured_data must be a JSON object"};
            }
            if (belief->recordedAt == TimePoint{})
                belief->recordedAt = node.createdAt;
        }

        auto stmtR = db_.prepare("INSERT INTO nodes (id, variant, title, content, created_at, "
                                 "updated_at) VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(node.id, toString(node.variant()), node.title, node.content,
                               core::toUnixMillis(node.createdAt),
                               core::toUnixMillis(node.updatedAt));
        if (!br)
            return br.error();
        auto er = stmt.execute();
        if (!er)
            return er.error();

        auto payload = insertPayloadLocked(node);
        if (!payload)
            return payload.error();
        return node;
    }

    Result<void> insertPayloadLocked(const Node& node) {
        if (const auto* module = std::get_if<ModulePayload>(&node.payload)) {
            auto stmtR = db_.prepare("INSERT INTO module_nodes (node_id, intentions, priority, "
                                     "research_depth, active, declared_at) "
                                     "VALUES (?, ?, ?, ?, ?, ?)");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bindAll(node.id, intentionsToJson(module->intentions), module->priority,
                                   module->researchDepth, module->active ? 1 : 0,
                                   core::toUnixMillis(module->declaredAt));
            if (!br)
                return br;
            return stmt.execute();
        }

        if (const auto* org = std::get_if<OrganizationPayload>(&node.payload)) {
            auto stmtR = db_.prepare("INSERT INTO organization_nodes (node_id, kind, confidence, "
                                     "valid_from, valid_to) VALUES (?, ?, ?, ?, ?)");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bindAll(node.id, toString(org->kind), org->confidence,
                                   optMillis(org->validFrom), optMillis(org->validTo));
            if (!br)
                return br;
            return stmt.execute();
        }

        const BeliefFields* b = node.belief();
        auto stmtR = db_.prepare(
            "INSERT INTO belief_nodes (node_id, status, source, confidence, purpose, source_type, "
            "valence, valid_from, valid_to, recorded_at, suggested_at, structured_data, "
            "session_id, message_index, source_char_start, source_char_end, source_file) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();

        std::optional<std::string> valence;
        if (b->valence)
            valence = toString(*b->valence);
        std::optional<std::string> structured;
        if (!b->structuredData.is_null())
            structured = b->structuredData.dump();

        const auto& p = b->provenance;
        auto br = stmt.bindAll(node.id, toString(b->status), b->source, b->confidence,
                               toString(b->purpose), toString(b->sourceType), valence,
                               optMillis(b->validFrom), optMillis(b->validTo),
                               core::toUnixMillis(b->recordedAt), optMillis(b->suggestedAt),
                               structured, p.sessionId, p.messageIndex, p.charStart, p.charEnd,
                               p.sourceFile);
        if (!br)
            return br;
        return stmt.execute();
    }

    Result<void> insertEmbeddingLocked(const NodeEmbedding& embedding) {
        auto existsR = db_.prepare(
            "SELECT 1 FROM node_embeddings WHERE node_id = ? AND embedding_type = ?");
        if (!existsR)
            return existsR.error();
        auto exists = std::move(existsR).value();
        auto br = exists.bindAll(embedding.nodeId, toString(embedding.type));
        if (!br)
            return br;
        auto step = exists.step();
        if (!step)
            return step.error();
        if (step.value()) {
            return Error{ErrorCode::ValidationError,
                         fmt::format("{} embedding for node {} already exists",
                                     toString(embedding.type), embedding.nodeId)};
        }

        auto stmtR = db_.prepare("INSERT INTO node_embeddings (node_id, embedding_type, dim, "
                                 "vector, model, created_at) VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        const auto createdAt =
            embedding.createdAt == TimePoint{} ? core::nowMillis() : embedding.createdAt;
        br = stmt.bindAll(embedding.nodeId, toString(embedding.type),
                          static_cast<int64_t>(embedding.vector.size()),
                          std::as_bytes(std::span<const float>(embedding.vector)), embedding.model,
                          core::toUnixMillis(createdAt));
        if (!br)
            return br;
        return stmt.execute();
    }

    Result<bool> edgeExistsLocked(const NodeId& fromId, const NodeId& toId, EdgeType type) {
        auto stmtR =
            db_.prepare("SELECT 1 FROM edges WHERE from_id = ? AND to_id = ? AND edge_type = ?");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(fromId, toId, toString(type));
        if (!br)
            return br.error();
        auto step = stmt.step();
        if (!step)
            return step.error();
        return step.value();
    }

    Result<std::vector<Node>> getChildrenLocked(const NodeId& id) {
        auto parent = getNodeLocked(id);
        if (!parent)
            return parent.error();
        if (!parent.value()) {
            return Error{ErrorCode::NotFound, "Node not found: " + id};
        }
        const auto variant = parent.value()->variant();
        if (variant == NodeVariant::Leaf || variant == NodeVariant::Organization) {
            return std::vector<Node>{};
        }

        auto stmtR = db_.prepare(std::string(kNodeSelect) +
                                 "JOIN edges e ON e.to_id = n.id "
                                 "WHERE e.from_id = ? AND e.edge_type = 'CONTAINS' "
                                 "AND n.variant != 'organization' "
                                 "ORDER BY e.created_at, n.created_at");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, id);
        if (!br)
            return br.error();
        return collectNodes(stmt);
    }

    Result<std::vector<RelatedNode>> getRelatedLocked(const NodeId& id,
                                                      std::optional<EdgeType> type) {
        auto self = getNodeLocked(id);
        if (!self)
            return self.error();
        if (!self.value()) {
            return Error{ErrorCode::NotFound, "Node not found: " + id};
        }

        const std::vector<EdgeType> types =
            type ? std::vector<EdgeType>{*type} : semanticEdgeTypes();
        std::string placeholders;
        for (std::size_t i = 0; i < types.size(); ++i)
            placeholders += i == 0 ? "?" : ", ?";

        auto stmtR = db_.prepare(std::string(kEdgeSelect) +
                                 "WHERE (e.from_id = ? OR e.to_id = ?) AND e.edge_type IN (" +
                                 placeholders + ") ORDER BY e.created_at, e.id");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(id, id);
        if (!br)
            return br.error();
        int idx = 3;
        for (EdgeType t : types) {
            br = stmt.bind(idx++, toString(t));
            if (!br)
                return br.error();
        }

        std::vector<Edge> edges;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            auto edge = readEdge(stmt);
            if (!edge)
                return edge.error();
            edges.push_back(std::move(edge).value());
        }

        std::vector<RelatedNode> related;
        related.reserve(edges.size());
        for (auto& edge : edges) {
            const bool outgoing = edge.fromId == id;
            const NodeId& otherId = outgoing ? edge.toId : edge.fromId;
            auto other = getNodeLocked(otherId);
            if (!other)
                return other.error();
            if (!other.value()) {
                return Error{ErrorCode::CorruptedData,
                             "Edge " + edge.id + " points at missing node " + otherId};
            }
            if (!type && other.value()->variant() == NodeVariant::Organization)
                continue;
            related.push_back(RelatedNode{std::move(*other.value()), std::move(edge),
                                          outgoing ? EdgeDirection::Outgoing
                                                   : EdgeDirection::Incoming});
        }
        return related;
    }

    Result<void> expandTreeLocked(ModuleTree& tree, int depthLeft,
                                  std::unordered_set<NodeId>& visited) {
        if (depthLeft <= 0)
            return {};
        auto children = getChildrenLocked(tree.node.id);
        if (!children)
            return children.error();
        for (auto& child : children.value()) {
            if (!visited.insert(child.id).second)
                continue;
            ModuleTree subtree{std::move(child), {}};
            auto r = expandTreeLocked(subtree, depthLeft - 1, visited);
            if (!r)
                return r;
            tree.children.push_back(std::move(subtree));
        }
        return {};
    }

    Result<std::vector<NodeEmbedding>> collectEmbeddings(Statement& stmt) {
        std::vector<NodeEmbedding> out;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            auto e = readEmbedding(stmt);
            if (!e)
                return e.error();
            out.push_back(std::move(e).value());
        }
        return out;
    }

    GraphStoreConfig cfg_{};
    Database db_;
    std::mutex mutex_;
};

Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg) {
    auto s = SqliteGraphStore::createWithPath(dbPath, cfg);
    if (!s)
        return s.error();
    return std::unique_ptr<GraphStore>(std::move(s).value().release());
}

} // namespace cairn::metadata
