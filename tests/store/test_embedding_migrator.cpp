#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "support/test_support.hpp"

using namespace promptvault;
using namespace promptvault::store;
using namespace promptvault::test;

namespace {

auto vec(size_t dims, float fill = 0.5f) -> std::vector<float> {
    return std::vector<float>(dims, fill);
}

} // anonymous namespace

TEST_CASE("Migration clears embeddings from another model", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_scenario.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    auto old_id = run_sync(repo.create(with_embedding(make_candidate("old"), vec(1536), "A")));
    auto kept_id = run_sync(repo.create(with_embedding(make_candidate("kept"), vec(768), "B")));
    REQUIRE((old_id && kept_id));

    MigrationOptions options;
    options.target_model = "B";
    options.target_dimensions = 768;
    options.batch_size = 10;

    auto report = run_sync(store->migrator().migrate(options));
    REQUIRE(report.has_value());
    CHECK(report->completed);
    CHECK(report->scanned == 2);
    CHECK(report->cleared == 1);

    auto old_rec = run_sync(repo.get(*old_id));
    REQUIRE(old_rec.has_value());
    CHECK_FALSE(old_rec->embedding.has_value());
    CHECK_FALSE(old_rec->embedding_model.has_value());
    CHECK_FALSE(old_rec->embedding_dimensions.has_value());
    CHECK(old_rec->content == "old");

    auto kept = run_sync(repo.get(*kept_id));
    REQUIRE(kept.has_value());
    CHECK(kept->embedding_model == "B");
    CHECK(kept->embedding_dimensions == 768);
}

TEST_CASE("Migration with a different dimensionality of the same model", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_dims.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    auto id = run_sync(repo.create(with_embedding(make_candidate("x"), vec(4), "B")));
    REQUIRE(id.has_value());

    MigrationOptions options;
    options.target_model = "B";
    options.target_dimensions = 8;
    auto report = run_sync(store->migrator().migrate(options));
    REQUIRE(report.has_value());
    CHECK(report->cleared == 1);
}

TEST_CASE("Migration is idempotent", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_idempotent.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    for (int i = 0; i < 5; ++i) {
        auto model = i % 2 == 0 ? "A" : "B";
        REQUIRE(run_sync(repo.create(with_embedding(make_candidate("r" + std::to_string(i)),
                                                    vec(3), model))).has_value());
    }

    MigrationOptions options;
    options.target_model = "B";
    options.target_dimensions = 3;
    options.batch_size = 2;

    auto first = run_sync(store->migrator().migrate(options));
    REQUIRE(first.has_value());
    CHECK(first->cleared == 3);
    CHECK(first->batches == 3);

    auto second = run_sync(store->migrator().migrate(options));
    REQUIRE(second.has_value());
    CHECK(second->completed);
    CHECK_FALSE(second->resumed);
    CHECK(second->scanned == 5);
    CHECK(second->cleared == 0);

    auto pending = run_sync(store->migrator().needs_migration("B", 3));
    REQUIRE(pending.has_value());
    CHECK_FALSE(*pending);
}

TEST_CASE("Interrupted migration resumes from its cursor", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_resume.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    for (int i = 0; i < 7; ++i) {
        REQUIRE(run_sync(repo.create(with_embedding(make_candidate("r" + std::to_string(i)),
                                                    vec(2), "A"))).has_value());
    }

    MigrationOptions options;
    options.target_model = "B";
    options.target_dimensions = 2;
    options.batch_size = 3;
    options.max_batches = 1;

    auto partial = run_sync(store->migrator().migrate(options));
    REQUIRE(partial.has_value());
    CHECK_FALSE(partial->completed);
    CHECK(partial->batches == 1);
    CHECK(partial->cleared == 3);

    auto stats = run_sync(store->migrator().embedding_stats());
    REQUIRE(stats.has_value());
    CHECK(stats->with_embeddings == 4);

    options.max_batches = 0;
    auto rest = run_sync(store->migrator().migrate(options));
    REQUIRE(rest.has_value());
    CHECK(rest->resumed);
    CHECK(rest->completed);
    CHECK(rest->scanned == 4);
    CHECK(rest->cleared == 4);

    stats = run_sync(store->migrator().embedding_stats());
    REQUIRE(stats.has_value());
    CHECK(stats->with_embeddings == 0);
}

TEST_CASE("A different target restarts from the beginning", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_restart.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    for (int i = 0; i < 4; ++i) {
        REQUIRE(run_sync(repo.create(with_embedding(make_candidate("r" + std::to_string(i)),
                                                    vec(2), "C"))).has_value());
    }

    MigrationOptions to_c;
    to_c.target_model = "C";
    to_c.target_dimensions = 2;
    to_c.batch_size = 1;
    to_c.max_batches = 2;
    auto partial = run_sync(store->migrator().migrate(to_c));
    REQUIRE(partial.has_value());
    CHECK(partial->cleared == 0);

    MigrationOptions to_d = to_c;
    to_d.target_model = "D";
    to_d.max_batches = 0;
    auto full = run_sync(store->migrator().migrate(to_d));
    REQUIRE(full.has_value());
    CHECK_FALSE(full->resumed);
    CHECK(full->scanned == 4);
    CHECK(full->cleared == 4);
}

TEST_CASE("Migration dry run counts without mutating", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_dry.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    REQUIRE(run_sync(repo.create(with_embedding(make_candidate("a"), vec(3), "A"))).has_value());
    REQUIRE(run_sync(repo.create(with_embedding(make_candidate("b"), vec(3), "B"))).has_value());
    REQUIRE(run_sync(repo.create(make_candidate("c"))).has_value());

    MigrationOptions options;
    options.target_model = "B";
    options.target_dimensions = 3;
    options.dry_run = true;

    auto report = run_sync(store->migrator().migrate(options));
    REQUIRE(report.has_value());
    CHECK(report->dry_run);
    CHECK(report->scanned == 3);
    CHECK(report->cleared == 1);

    auto stats = run_sync(store->migrator().embedding_stats());
    REQUIRE(stats.has_value());
    CHECK(stats->with_embeddings == 2);
}

TEST_CASE("Migration validates its target", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_invalid.db");
    auto store = open_store(tmp);

    MigrationOptions options;
    options.target_model = "";
    auto r = run_sync(store->migrator().migrate(options));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == ErrorCode::InvalidArgument);

    options.target_model = "B";
    options.target_dimensions = 0;
    r = run_sync(store->migrator().migrate(options));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("embedding_stats groups by model and dimensions", "[store][migration]") {
    TmpDbFile tmp("pv_migrate_stats.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    auto empty = run_sync(store->migrator().embedding_stats());
    REQUIRE(empty.has_value());
    CHECK(empty->total == 0);
    CHECK(empty->coverage_percent == 0.0);

    REQUIRE(run_sync(repo.create(with_embedding(make_candidate("a"), vec(3), "A"))).has_value());
    REQUIRE(run_sync(repo.create(with_embedding(make_candidate("b"), vec(3), "A"))).has_value());
    REQUIRE(run_sync(repo.create(with_embedding(make_candidate("c"), vec(5), "B"))).has_value());
    REQUIRE(run_sync(repo.create(make_candidate("d"))).has_value());

    auto stats = run_sync(store->migrator().embedding_stats());
    REQUIRE(stats.has_value());
    CHECK(stats->total == 4);
    CHECK(stats->with_embeddings == 3);
    CHECK_THAT(stats->coverage_percent, Catch::Matchers::WithinAbs(75.0, 1e-9));
    REQUIRE(stats->models.size() == 2);
    CHECK(stats->models[0].model == "A");
    CHECK(stats->models[0].dimensions == 3);
    CHECK(stats->models[0].count == 2);

    auto pending = run_sync(store->migrator().needs_migration("A", 3));
    REQUIRE(pending.has_value());
    CHECK(*pending);
}
