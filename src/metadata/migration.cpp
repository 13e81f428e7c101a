#include <spdlog/spdlog.h>
#include <cairn/metadata/migration.h>

namespace cairn::metadata {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    const int targetVersion = getLatestVersion();

    if (currentVersion > targetVersion) {
        return Error{ErrorCode::InvalidState,
                     "Database schema version " + std::to_string(currentVersion) +
                         " is newer than this build supports (" + std::to_string(targetVersion) +
                         ")"};
    }
    if (currentVersion == targetVersion) {
        spdlog::debug("Schema already at version {}", targetVersion);
        return {};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion)
            continue;

        spdlog::debug("Applying migration {} '{}'", version, migration.name);
        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            spdlog::error("Migration {} '{}' failed: {}", version, migration.name,
                          result.error().message);
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Could not record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;

        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM migration_history ORDER BY id ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);

        history.push_back(entry);
    }

    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();

    auto bindResult = stmt.bindAll(version, name, seconds, static_cast<int64_t>(duration.count()),
                                   success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

// GraphSchemaMigrations implementation
std::vector<Migration> GraphSchemaMigrations::getAllMigrations() {
    return {createNodeTables(), createEdgeTables(), createEmbeddingTables(),
            createProvenanceIndexes()};
}

Migration GraphSchemaMigrations::createNodeTables() {
    Migration m;
    m.version = 1;
    m.name = "Create node tables";
    m.upSQL = R"(
        CREATE TABLE nodes (
            id TEXT PRIMARY KEY,
            variant TEXT NOT NULL
                CHECK (variant IN ('module', 'internal', 'leaf', 'organization')),
            title TEXT NOT NULL,
            content TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE module_nodes (
            node_id TEXT PRIMARY KEY,
            intentions TEXT NOT NULL,
            priority REAL NOT NULL DEFAULT 0,
            research_depth INTEGER NOT NULL DEFAULT 5,
            active INTEGER NOT NULL DEFAULT 1,
            declared_at INTEGER NOT NULL,
            FOREIGN KEY (node_id) REFERENCES nodes(id)
        );

        -- Internal and Leaf nodes share one payload shape
        CREATE TABLE belief_nodes (
            node_id TEXT PRIMARY KEY,
            status TEXT NOT NULL DEFAULT 'confirmed',
            source TEXT NOT NULL,
            confidence REAL NOT NULL DEFAULT 1.0
                CHECK (confidence >= 0.0 AND confidence <= 1.0),
            purpose TEXT NOT NULL DEFAULT 'observation',
            source_type TEXT NOT NULL DEFAULT 'explicit',
            valence TEXT,
            valid_from INTEGER,
            valid_to INTEGER,
            recorded_at INTEGER NOT NULL,
            suggested_at INTEGER,
            structured_data TEXT,
            FOREIGN KEY (node_id) REFERENCES nodes(id)
        );

        CREATE TABLE organization_nodes (
            node_id TEXT PRIMARY KEY,
            kind TEXT NOT NULL,
            confidence REAL NOT NULL DEFAULT 1.0
                CHECK (confidence >= 0.0 AND confidence <= 1.0),
            valid_from INTEGER,
            valid_to INTEGER,
            FOREIGN KEY (node_id) REFERENCES nodes(id)
        );
    )";
    return m;
}

Migration GraphSchemaMigrations::createEdgeTables() {
    Migration m;
    m.version = 2;
    m.name = "Create edge tables";
    m.upSQL = R"(
        CREATE TABLE edges (
            id TEXT PRIMARY KEY,
            from_id TEXT NOT NULL,
            to_id TEXT NOT NULL,
            edge_type TEXT NOT NULL,
            status TEXT,
            confidence REAL CHECK (confidence IS NULL OR (confidence >= 0.0 AND confidence <= 1.0)),
            rationale TEXT,
            created_at INTEGER NOT NULL,
            UNIQUE (from_id, to_id, edge_type),
            FOREIGN KEY (from_id) REFERENCES nodes(id),
            FOREIGN KEY (to_id) REFERENCES nodes(id)
        );
        CREATE INDEX idx_edges_from ON edges(from_id, edge_type);
        CREATE INDEX idx_edges_to ON edges(to_id, edge_type);
    )";
    return m;
}

Migration GraphSchemaMigrations::createEmbeddingTables() {
    Migration m;
    m.version = 3;
    m.name = "Create embedding tables";
    m.upSQL = R"(
        CREATE TABLE node_embeddings (
            node_id TEXT NOT NULL,
            embedding_type TEXT NOT NULL
                CHECK (embedding_type IN ('content', 'title', 'context', 'query')),
            dim INTEGER NOT NULL,
            vector BLOB NOT NULL,
            model TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            PRIMARY KEY (node_id, embedding_type),
            FOREIGN KEY (node_id) REFERENCES nodes(id)
        );
        CREATE INDEX idx_node_embeddings_type ON node_embeddings(embedding_type);
    )";
    return m;
}

Migration GraphSchemaMigrations::createProvenanceIndexes() {
    Migration m;
    m.version = 4;
    m.name = "Add provenance columns and lookup indexes";
    m.upSQL = R"(
        ALTER TABLE belief_nodes ADD COLUMN session_id TEXT;
        ALTER TABLE belief_nodes ADD COLUMN message_index INTEGER;
        ALTER TABLE belief_nodes ADD COLUMN source_char_start INTEGER;
        ALTER TABLE belief_nodes ADD COLUMN source_char_end INTEGER;
        ALTER TABLE belief_nodes ADD COLUMN source_file TEXT;

        CREATE INDEX idx_nodes_variant ON nodes(variant, created_at);
        CREATE INDEX idx_belief_session ON belief_nodes(session_id, message_index);
        CREATE INDEX idx_belief_recorded ON belief_nodes(recorded_at);
        CREATE INDEX idx_belief_status ON belief_nodes(status);
    )";
    return m;
}

} // namespace cairn::metadata
