#pragma once

#include <cairn/metadata/database.h>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace cairn::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for migrations that need to inspect the schema)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration;
    bool success;
    std::string error;
};

/**
 * @brief Forward-only schema migration manager
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create history table)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations, each in its own transaction
     */
    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

/**
 * @brief Built-in migrations for the knowledge graph schema
 */
class GraphSchemaMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: nodes + per-variant payload tables
    static Migration createNodeTables();

    // Version 2: typed edges
    static Migration createEdgeTables();

    // Version 3: per-aspect node embeddings
    static Migration createEmbeddingTables();

    // Version 4: provenance columns and lookup indexes
    static Migration createProvenanceIndexes();
};

} // namespace cairn::metadata
