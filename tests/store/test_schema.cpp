#include <catch2/catch_test_macros.hpp>

#include "promptvault/store/database.hpp"
#include "promptvault/store/schema.hpp"
#include "support/test_support.hpp"

using namespace promptvault;
using namespace promptvault::store;
using promptvault::test::TmpDbFile;

namespace {

auto table_exists(Database& db, const std::string& name) -> bool {
    auto guard = db.lock();
    SQLite::Statement stmt(db.connection(),
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind(1, name);
    return stmt.executeStep();
}

} // anonymous namespace

TEST_CASE("ensure_schema creates every table", "[store][schema]") {
    TmpDbFile tmp("pv_schema_create.db");
    auto db = Database::open(tmp.str());
    REQUIRE(db.has_value());

    auto version = ensure_schema(**db);
    REQUIRE(version.has_value());
    CHECK(*version == kSchemaVersion);

    CHECK(table_exists(**db, "prompts"));
    CHECK(table_exists(**db, "database_config"));
    CHECK(table_exists(**db, "prompt_relationships"));
    CHECK(table_exists(**db, "embedding_migrations"));

    auto reported = schema_version(**db);
    REQUIRE(reported.has_value());
    CHECK(*reported == kSchemaVersion);
}

TEST_CASE("ensure_schema is idempotent", "[store][schema]") {
    TmpDbFile tmp("pv_schema_idempotent.db");
    {
        auto db = Database::open(tmp.str());
        REQUIRE(db.has_value());
        REQUIRE(ensure_schema(**db).has_value());
        REQUIRE(ensure_schema(**db).has_value());
    }
    // Reopening an up-to-date file applies nothing and keeps the version.
    auto db = Database::open(tmp.str());
    REQUIRE(db.has_value());
    auto version = ensure_schema(**db);
    REQUIRE(version.has_value());
    CHECK(*version == kSchemaVersion);
}

TEST_CASE("ensure_schema upgrades a version 1 database", "[store][schema]") {
    TmpDbFile tmp("pv_schema_upgrade.db");
    auto db = Database::open(tmp.str());
    REQUIRE(db.has_value());
    {
        auto guard = (*db)->lock();
        auto& conn = (*db)->connection();
        conn.exec(std::string(schema_migrations()[0].sql));
        conn.exec("PRAGMA user_version = 1");
    }
    CHECK_FALSE(table_exists(**db, "prompt_relationships"));

    auto version = ensure_schema(**db);
    REQUIRE(version.has_value());
    CHECK(*version == 2);
    CHECK(table_exists(**db, "prompt_relationships"));
}

TEST_CASE("ensure_schema refuses a newer database", "[store][schema]") {
    TmpDbFile tmp("pv_schema_newer.db");
    auto db = Database::open(tmp.str());
    REQUIRE(db.has_value());
    {
        auto guard = (*db)->lock();
        (*db)->connection().exec("PRAGMA user_version = 99");
    }

    auto version = ensure_schema(**db);
    REQUIRE_FALSE(version.has_value());
    CHECK(version.error().code() == ErrorCode::Conflict);
}

TEST_CASE("Database::open creates missing parent directories", "[store][schema]") {
    auto dir = std::filesystem::temp_directory_path() / "pv_schema_nested";
    std::filesystem::remove_all(dir);

    {
        auto db = Database::open((dir / "a" / "b" / "prompts.db").string());
        REQUIRE(db.has_value());
        CHECK(std::filesystem::exists(dir / "a" / "b" / "prompts.db"));
    }
    std::filesystem::remove_all(dir);
}

TEST_CASE("Schema rejects embeddings whose metadata disagrees", "[store][schema]") {
    TmpDbFile tmp("pv_schema_check.db");
    auto db = Database::open(tmp.str());
    REQUIRE(db.has_value());
    REQUIRE(ensure_schema(**db).has_value());

    auto guard = (*db)->lock();
    SQLite::Statement stmt((*db)->connection(),
        "INSERT INTO prompts (id, content, content_hash, phase, provider, model, "
        "embedding, embedding_model, embedding_dimensions, created_at, updated_at) "
        "VALUES ('x', 'c', 'h', 'solutio', 'p', 'm', zeroblob(8), 'model', 3, 0, 0)");
    CHECK_THROWS_AS(stmt.exec(), SQLite::Exception);
}
