#include <cairn/metadata/database.h>
#include <cairn/metadata/migration.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cairn;
using namespace cairn::metadata;

namespace {

bool hasTable(Database& db, const std::string& name) {
    auto stmt = db.prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmt || !stmt.value().bind(1, name))
        return false;
    auto row = stmt.value().step();
    return row && row.value();
}

} // namespace

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto r = db_.open(":memory:");
        ASSERT_TRUE(r) << r.error().message;
        ASSERT_TRUE(db_.execute("CREATE TABLE kv (k TEXT PRIMARY KEY, v INTEGER, note TEXT)"));
    }

    Database db_;
};

TEST_F(DatabaseTest, BindAllAndReadBack) {
    auto insert = db_.prepare("INSERT INTO kv (k, v, note) VALUES (?, ?, ?)");
    ASSERT_TRUE(insert) << insert.error().message;
    auto& stmt = insert.value();
    ASSERT_TRUE(stmt.bindAll(std::string("alpha"), int64_t{7}, std::optional<std::string>{}));
    ASSERT_TRUE(stmt.execute());

    auto select = db_.prepare("SELECT v, note FROM kv WHERE k = ?");
    ASSERT_TRUE(select);
    ASSERT_TRUE(select.value().bind(1, "alpha"));
    auto row = select.value().step();
    ASSERT_TRUE(row);
    ASSERT_TRUE(row.value());
    EXPECT_EQ(select.value().getInt64(0), 7);
    EXPECT_TRUE(select.value().isNull(1));
    EXPECT_FALSE(select.value().getOptionalString(1).has_value());
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    auto r = db_.transaction([&]() -> Result<void> {
        auto ins = db_.execute("INSERT INTO kv (k, v) VALUES ('x', 1)");
        if (!ins)
            return ins;
        return Error{ErrorCode::ValidationError, "abort"};
    });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(db_.inTransaction());

    auto count = db_.prepare("SELECT COUNT(*) FROM kv");
    ASSERT_TRUE(count);
    ASSERT_TRUE(count.value().step());
    EXPECT_EQ(count.value().getInt64(0), 0);
}

TEST_F(DatabaseTest, ConstraintViolationIsDatabaseError) {
    ASSERT_TRUE(db_.execute("INSERT INTO kv (k, v) VALUES ('dup', 1)"));
    auto again = db_.execute("INSERT INTO kv (k, v) VALUES ('dup', 2)");
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::DatabaseError);
}

TEST_F(DatabaseTest, NestedTransactionIsRejected) {
    Result<void> inner;
    auto outer = db_.transaction([&]() -> Result<void> {
        inner = db_.transaction([] { return Result<void>{}; });
        return db_.execute("INSERT INTO kv (k, v) VALUES ('kept', 1)");
    });
    ASSERT_TRUE(outer) << outer.error().message;
    ASSERT_FALSE(inner);
    EXPECT_EQ(inner.error().code, ErrorCode::InvalidState);
    EXPECT_TRUE(hasTable(db_, "kv"));

    auto count = db_.prepare("SELECT COUNT(*) FROM kv");
    ASSERT_TRUE(count);
    ASSERT_TRUE(count.value().step());
    EXPECT_EQ(count.value().getInt64(0), 1);
}

TEST(DatabaseClosedTest, UseBeforeOpenIsNotInitialized) {
    Database db;
    auto stmt = db.prepare("SELECT 1");
    ASSERT_FALSE(stmt);
    EXPECT_EQ(stmt.error().code, ErrorCode::NotInitialized);
    auto exec = db.execute("SELECT 1");
    ASSERT_FALSE(exec);
    EXPECT_EQ(exec.error().code, ErrorCode::NotInitialized);
}

TEST(MigrationTest, AppliesAllGraphMigrationsOnce) {
    Database db;
    ASSERT_TRUE(db.open(":memory:"));
    ASSERT_TRUE(db.enableForeignKeys());

    MigrationManager mm(db);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigrations(GraphSchemaMigrations::getAllMigrations());

    auto needs = mm.needsMigration();
    ASSERT_TRUE(needs);
    EXPECT_TRUE(needs.value());

    auto migrated = mm.migrate();
    ASSERT_TRUE(migrated) << migrated.error().message;

    auto version = mm.getCurrentVersion();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), mm.getLatestVersion());
    EXPECT_EQ(version.value(), 4);

    for (const char* table : {"nodes", "module_nodes", "belief_nodes", "organization_nodes",
                              "edges", "node_embeddings"}) {
        EXPECT_TRUE(hasTable(db, table)) << table;
    }

    // Second run is a no-op
    ASSERT_TRUE(mm.migrate());
    auto history = mm.getHistory();
    ASSERT_TRUE(history);
    EXPECT_EQ(history.value().size(), 4u);
}

TEST(MigrationTest, RefusesDatabaseNewerThanCode) {
    Database db;
    ASSERT_TRUE(db.open(":memory:"));
    {
        MigrationManager mm(db);
        ASSERT_TRUE(mm.initialize());
        mm.registerMigrations(GraphSchemaMigrations::getAllMigrations());
        ASSERT_TRUE(mm.migrate());
    }

    MigrationManager older(db);
    ASSERT_TRUE(older.initialize());
    auto all = GraphSchemaMigrations::getAllMigrations();
    all.pop_back();
    older.registerMigrations(all);
    auto r = older.migrate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
}
