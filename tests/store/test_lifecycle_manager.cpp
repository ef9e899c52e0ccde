#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "support/test_support.hpp"

using namespace promptvault;
using namespace promptvault::store;
using namespace promptvault::test;
using Catch::Matchers::WithinAbs;

namespace {

auto create_scored(PromptStore& store, const std::string& content, double score,
                   Timestamp created = ms_ago(0)) -> std::string {
    auto c = make_candidate(content);
    c.relevance_score = score;
    c.created_at = created;
    return run_sync(store.candidates().create(c)).value();
}

} // anonymous namespace

TEST_CASE("compute_relevance is bounded and monotonic", "[store][lifecycle]") {
    const double half_life = 30.0;
    const double w = 0.7;

    SECTION("fresh and unused scores the recency weight") {
        CHECK_THAT(compute_relevance(0.0, 0, half_life, w), WithinAbs(0.7, 1e-12));
    }

    SECTION("one half-life halves the recency term") {
        CHECK_THAT(compute_relevance(30.0, 0, half_life, w), WithinAbs(0.35, 1e-12));
    }

    SECTION("decreasing in age") {
        double previous = 2.0;
        for (double age : {0.0, 1.0, 7.0, 30.0, 90.0, 365.0, 3650.0}) {
            double score = compute_relevance(age, 5, half_life, w);
            CHECK(score < previous);
            CHECK(score >= 0.0);
            previous = score;
        }
    }

    SECTION("increasing in usage") {
        double previous = -1.0;
        for (int64_t uses : {0, 1, 2, 10, 100, 100000}) {
            double score = compute_relevance(10.0, uses, half_life, w);
            CHECK(score > previous);
            CHECK(score <= 1.0);
            previous = score;
        }
    }

    SECTION("future timestamps count as brand new") {
        CHECK(compute_relevance(-5.0, 0, half_life, w) == compute_relevance(0.0, 0, half_life, w));
    }
}

TEST_CASE("Cleanup deletes exactly the least relevant record", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_scenario.db");
    auto store = open_store(tmp);

    auto high = create_scored(*store, "high", 0.9);
    auto mid = create_scored(*store, "mid", 0.5);
    auto low = create_scored(*store, "low", 0.1);
    REQUIRE(run_sync(store->config().set("max_prompts", "2")).has_value());

    auto report = run_sync(store->lifecycle().cleanup_old_prompts());
    REQUIRE(report.has_value());
    CHECK(report->current_count == 3);
    CHECK(report->max_prompts == 2);
    CHECK(report->deleted == 1);
    CHECK(report->protected_blocked == 0);

    CHECK(run_sync(store->candidates().get(high)).has_value());
    CHECK(run_sync(store->candidates().get(mid)).has_value());
    CHECK_FALSE(run_sync(store->candidates().get(low)).has_value());
}

TEST_CASE("Cleanup at or under capacity is a no-op", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_noop.db");
    auto store = open_store(tmp);

    create_scored(*store, "a", 0.1);
    create_scored(*store, "b", 0.2);
    REQUIRE(run_sync(store->config().set("max_prompts", "2")).has_value());

    auto report = run_sync(store->lifecycle().cleanup_old_prompts());
    REQUIRE(report.has_value());
    CHECK(report->selected == 0);
    CHECK(report->deleted == 0);
    CHECK(run_sync(store->candidates().count()) == size_t{2});
}

TEST_CASE("Cleanup never deletes protected records", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_protect.db");
    auto store = open_store(tmp);

    auto p1 = create_scored(*store, "p1", 0.95);
    auto p2 = create_scored(*store, "p2", 0.92);
    auto p3 = create_scored(*store, "p3", 1.0);
    auto weak = create_scored(*store, "weak", 0.2);
    REQUIRE(run_sync(store->config().set("max_prompts", "1")).has_value());

    auto report = run_sync(store->lifecycle().cleanup_old_prompts());
    REQUIRE(report.has_value());
    CHECK(report->deleted == 1);
    CHECK(report->protected_blocked == 2);

    for (const auto& id : {p1, p2, p3}) {
        CHECK(run_sync(store->candidates().get(id)).has_value());
    }
    CHECK_FALSE(run_sync(store->candidates().get(weak)).has_value());
}

TEST_CASE("Cleanup breaks relevance ties by age", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_ties.db");
    auto store = open_store(tmp);

    auto older = create_scored(*store, "older", 0.4, days_ago(10));
    auto newer = create_scored(*store, "newer", 0.4, days_ago(1));
    REQUIRE(run_sync(store->config().set("max_prompts", "1")).has_value());

    auto report = run_sync(store->lifecycle().cleanup_old_prompts());
    REQUIRE(report.has_value());
    CHECK(report->deleted == 1);
    CHECK_FALSE(run_sync(store->candidates().get(older)).has_value());
    CHECK(run_sync(store->candidates().get(newer)).has_value());
}

TEST_CASE("Cleanup dry run reports without deleting", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_dry.db");
    auto store = open_store(tmp);

    for (double score : {0.1, 0.2, 0.25, 0.6, 0.95}) {
        create_scored(*store, "s" + std::to_string(score), score);
    }
    REQUIRE(run_sync(store->config().set("max_prompts", "2")).has_value());

    auto report = run_sync(store->lifecycle().cleanup_old_prompts(true));
    REQUIRE(report.has_value());
    CHECK(report->dry_run);
    CHECK(report->current_count == 5);
    CHECK(report->selected == 3);
    CHECK(report->deleted == 0);
    CHECK(report->below_min_relevance == 3);
    CHECK(report->min_relevance_score == 0.3);
    CHECK(run_sync(store->candidates().count()) == size_t{5});
}

TEST_CASE("Cleanup removes edges of deleted records", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_edges.db");
    auto store = open_store(tmp);

    auto keep = create_scored(*store, "keep", 0.8);
    auto drop = create_scored(*store, "drop", 0.05);
    REQUIRE(run_sync(store->relationships().add(drop, keep, "derived_from")).has_value());
    REQUIRE(run_sync(store->config().set("max_prompts", "1")).has_value());

    REQUIRE(run_sync(store->lifecycle().cleanup_old_prompts()).has_value());

    auto edges = run_sync(store->relationships().list_for_record(keep));
    REQUIRE(edges.has_value());
    CHECK(edges->empty());
}

TEST_CASE("Policy raises a protect threshold that is not above the floor", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_policy.db");
    auto store = open_store(tmp);

    REQUIRE(run_sync(store->config().set("min_relevance_score", "0.5")).has_value());
    REQUIRE(run_sync(store->config().set("cleanup_protect_score", "0.4")).has_value());
    REQUIRE(run_sync(store->config().set("relevance_half_life_days", "-3")).has_value());

    auto policy = run_sync(store->lifecycle().load_policy());
    REQUIRE(policy.has_value());
    CHECK(policy->min_relevance_score == 0.5);
    CHECK(policy->protect_threshold == config_defaults::kCleanupProtectScore);
    CHECK(policy->half_life_days == config_defaults::kRelevanceHalfLifeDays);
    CHECK(policy->max_prompts == config_defaults::kMaxPrompts);
}

TEST_CASE("update_relevance_scores decays old and rewards used records", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_decay.db");
    auto store = open_store(tmp);
    auto& repo = store->candidates();

    auto fresh = create_scored(*store, "fresh", 1.0, days_ago(0));
    auto stale = create_scored(*store, "stale", 1.0, days_ago(60));
    auto used = create_scored(*store, "used", 1.0, days_ago(60));
    for (int i = 0; i < 5; ++i) {
        REQUIRE(run_sync(repo.record_usage(used)).has_value());
    }

    auto updated = run_sync(store->lifecycle().update_relevance_scores());
    REQUIRE(updated.has_value());
    CHECK(*updated == 3);

    auto f = run_sync(repo.get(fresh)).value();
    auto s = run_sync(repo.get(stale)).value();
    auto u = run_sync(repo.get(used)).value();
    CHECK(f.relevance_score > s.relevance_score);
    CHECK(u.relevance_score > s.relevance_score);
    CHECK_THAT(s.relevance_score, WithinAbs(0.7 * 0.25, 1e-3));

    // Recomputing at the same instant changes nothing.
    auto now = Clock::now();
    REQUIRE(run_sync(store->lifecycle().update_relevance_scores(now)).has_value());
    auto again = run_sync(store->lifecycle().update_relevance_scores(now));
    REQUIRE(again.has_value());
    CHECK(*again == 0);
}

TEST_CASE("run_maintenance decays then evicts in one pass", "[store][lifecycle]") {
    TmpDbFile tmp("pv_lifecycle_maintenance.db");
    auto store = open_store(tmp);

    // Both start fully relevant; only decay makes the old one evictable first.
    auto old_id = create_scored(*store, "old", 1.0, days_ago(120));
    auto new_id = create_scored(*store, "new", 1.0, days_ago(0));
    REQUIRE(run_sync(store->config().set("max_prompts", "1")).has_value());

    SECTION("dry run") {
        MaintenanceOptions options;
        options.dry_run = true;
        auto report = run_sync(store->lifecycle().run_maintenance(options));
        REQUIRE(report.has_value());
        CHECK(report->dry_run);
        CHECK(report->relevance_updated == 2);
        REQUIRE(report->cleanup.has_value());
        CHECK(report->cleanup->selected == 1);
        CHECK(report->cleanup->deleted == 0);

        auto untouched = run_sync(store->candidates().get(old_id));
        REQUIRE(untouched.has_value());
        CHECK(untouched->relevance_score == 1.0);
        CHECK(run_sync(store->candidates().count()) == size_t{2});
    }

    SECTION("real run") {
        auto report = run_sync(store->lifecycle().run_maintenance());
        REQUIRE(report.has_value());
        REQUIRE(report->cleanup.has_value());
        CHECK(report->cleanup->deleted == 1);
        CHECK_FALSE(run_sync(store->candidates().get(old_id)).has_value());
        CHECK(run_sync(store->candidates().get(new_id)).has_value());
    }

    SECTION("cleanup skipped") {
        MaintenanceOptions options;
        options.cleanup = false;
        auto report = run_sync(store->lifecycle().run_maintenance(options));
        REQUIRE(report.has_value());
        CHECK_FALSE(report->cleanup.has_value());
        CHECK(run_sync(store->candidates().count()) == size_t{2});
    }
}
