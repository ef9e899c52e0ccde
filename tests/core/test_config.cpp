#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "promptvault/core/config.hpp"

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = promptvault::default_config();

    SECTION("store defaults") {
        CHECK_FALSE(cfg.store.db_path.has_value());
        CHECK(cfg.store.busy_timeout_ms == 5000);
    }

    SECTION("lifecycle defaults") {
        CHECK(cfg.lifecycle.max_prompts == 1000);
        CHECK(cfg.lifecycle.min_relevance_score == 0.3);
    }

    SECTION("embedding standard") {
        CHECK(cfg.embeddings.standard_model == "text-embedding-3-small");
        CHECK(cfg.embeddings.standard_dimensions == 1536);
        CHECK(cfg.embeddings.batch_size == 10);
    }

    SECTION("log level defaults") {
        CHECK(cfg.log_level == "info");
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "promptvault_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "store": { "db_path": "/var/lib/promptvault/prompts.db" },
            "lifecycle": { "max_prompts": 250 },
            "embeddings": { "standard_model": "nomic-embed-text", "standard_dimensions": 768 },
            "log_level": "debug"
        })";
    }

    auto cfg = promptvault::load_config(tmp);

    REQUIRE(cfg.store.db_path.has_value());
    CHECK(*cfg.store.db_path == "/var/lib/promptvault/prompts.db");
    CHECK(cfg.lifecycle.max_prompts == 250);
    CHECK(cfg.embeddings.standard_model == "nomic-embed-text");
    CHECK(cfg.embeddings.standard_dimensions == 768);
    CHECK(cfg.log_level == "debug");
    // Non-specified fields keep defaults
    CHECK(cfg.lifecycle.min_relevance_score == 0.3);
    CHECK(cfg.embeddings.batch_size == 10);
    CHECK(cfg.store.busy_timeout_ms == 5000);

    fs::remove(tmp);
}

TEST_CASE("load_config returns defaults for missing or malformed file", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing") {
        auto cfg = promptvault::load_config("/nonexistent/path/config.json");
        CHECK(cfg.lifecycle.max_prompts == 1000);
        CHECK(cfg.log_level == "info");
    }

    SECTION("malformed") {
        auto tmp = fs::temp_directory_path() / "promptvault_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = promptvault::load_config(tmp);
        CHECK(cfg.embeddings.standard_dimensions == 1536);
        fs::remove(tmp);
    }
}

TEST_CASE("load_config_from_env reads environment variables", "[config]") {
    ::setenv("PROMPTVAULT_DB_PATH", "/tmp/pv-env.db", 1);
    ::setenv("PROMPTVAULT_LOG_LEVEL", "trace", 1);
    ::setenv("PROMPTVAULT_MAX_PROMPTS", "42", 1);
    ::setenv("PROMPTVAULT_MIN_RELEVANCE_SCORE", "not-a-number", 1);
    ::setenv("PROMPTVAULT_EMBEDDING_DIMENSIONS", "384", 1);

    auto cfg = promptvault::load_config_from_env();

    REQUIRE(cfg.store.db_path.has_value());
    CHECK(*cfg.store.db_path == "/tmp/pv-env.db");
    CHECK(cfg.log_level == "trace");
    CHECK(cfg.lifecycle.max_prompts == 42);
    CHECK(cfg.lifecycle.min_relevance_score == 0.3);
    CHECK(cfg.embeddings.standard_dimensions == 384);

    ::unsetenv("PROMPTVAULT_DB_PATH");
    ::unsetenv("PROMPTVAULT_LOG_LEVEL");
    ::unsetenv("PROMPTVAULT_MAX_PROMPTS");
    ::unsetenv("PROMPTVAULT_MIN_RELEVANCE_SCORE");
    ::unsetenv("PROMPTVAULT_EMBEDDING_DIMENSIONS");
}

TEST_CASE("load_config_from_env rejects out-of-range dimensions", "[config]") {
    SECTION("larger than an int") {
        ::setenv("PROMPTVAULT_EMBEDDING_DIMENSIONS", "4294967680", 1);
        CHECK(promptvault::load_config_from_env().embeddings.standard_dimensions == 1536);
    }

    SECTION("above the embedding maximum") {
        ::setenv("PROMPTVAULT_EMBEDDING_DIMENSIONS", "8193", 1);
        CHECK(promptvault::load_config_from_env().embeddings.standard_dimensions == 1536);
    }

    SECTION("zero") {
        ::setenv("PROMPTVAULT_EMBEDDING_DIMENSIONS", "0", 1);
        CHECK(promptvault::load_config_from_env().embeddings.standard_dimensions == 1536);
    }

    ::unsetenv("PROMPTVAULT_EMBEDDING_DIMENSIONS");
}

TEST_CASE("resolve_db_path prefers explicit path over data dir", "[config]") {
    promptvault::Config cfg;

    SECTION("explicit db_path") {
        cfg.store.db_path = "/srv/prompts.db";
        CHECK(promptvault::resolve_db_path(cfg) == std::filesystem::path("/srv/prompts.db"));
    }

    SECTION("data_dir fallback") {
        cfg.data_dir = "/srv/promptvault";
        CHECK(promptvault::resolve_db_path(cfg) ==
              std::filesystem::path("/srv/promptvault/prompts.db"));
    }
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    promptvault::Config cfg;
    cfg.lifecycle.max_prompts = 77;
    cfg.embeddings.standard_model = "text-embedding-3-large";

    promptvault::json j = cfg;
    auto back = j.get<promptvault::Config>();
    CHECK(back.lifecycle.max_prompts == 77);
    CHECK(back.embeddings.standard_model == "text-embedding-3-large");
    CHECK_FALSE(back.store.db_path.has_value());
}
