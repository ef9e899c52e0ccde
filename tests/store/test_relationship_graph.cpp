#include <catch2/catch_test_macros.hpp>

#include "support/test_support.hpp"

using namespace promptvault;
using namespace promptvault::store;
using namespace promptvault::test;

namespace {

struct GraphFixture {
    TmpDbFile tmp;
    std::unique_ptr<PromptStore> store;
    std::string a, b, c;

    explicit GraphFixture(const std::string& name)
        : tmp(name), store(open_store(tmp)) {
        a = run_sync(store->candidates().create(make_candidate("a"))).value();
        b = run_sync(store->candidates().create(make_candidate("b"))).value();
        c = run_sync(store->candidates().create(make_candidate("c"))).value();
    }
};

} // anonymous namespace

TEST_CASE("RelationshipGraph add and list", "[store][graph]") {
    GraphFixture fx("pv_graph_add.db");
    auto& graph = fx.store->relationships();

    REQUIRE(run_sync(graph.add(fx.b, fx.a, "derived_from", 0.8, "refined")).has_value());
    REQUIRE(run_sync(graph.add(fx.c, fx.a, "similar_to")).has_value());

    auto edges = run_sync(graph.list_for_record(fx.a));
    REQUIRE(edges.has_value());
    REQUIRE(edges->size() == 2);
    CHECK(edges->at(0).source_id == fx.b);
    CHECK(edges->at(0).type == RelationshipType::DerivedFrom);
    CHECK(edges->at(0).strength == 0.8);
    CHECK(edges->at(0).context == "refined");
    CHECK(edges->at(1).strength == 0.5);

    auto only_b = run_sync(graph.list_for_record(fx.b));
    REQUIRE(only_b.has_value());
    CHECK(only_b->size() == 1);
}

TEST_CASE("RelationshipGraph re-adding an edge updates it", "[store][graph]") {
    GraphFixture fx("pv_graph_upsert.db");
    auto& graph = fx.store->relationships();

    REQUIRE(run_sync(graph.add(fx.b, fx.a, "merged_with", 0.2)).has_value());
    REQUIRE(run_sync(graph.add(fx.b, fx.a, "merged_with", 0.9, "second pass")).has_value());

    auto edges = run_sync(graph.list_for_record(fx.a));
    REQUIRE(edges.has_value());
    REQUIRE(edges->size() == 1);
    CHECK(edges->front().strength == 0.9);
    CHECK(edges->front().context == "second pass");
}

TEST_CASE("RelationshipGraph rejects bad edges", "[store][graph]") {
    GraphFixture fx("pv_graph_invalid.db");
    auto& graph = fx.store->relationships();

    SECTION("unknown type") {
        auto r = run_sync(graph.add(fx.a, fx.b, "parent_of"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("strength out of range") {
        auto r = run_sync(graph.add(fx.a, fx.b, "similar_to", 1.2));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("self edge") {
        auto r = run_sync(graph.add(fx.a, fx.a, "similar_to"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("missing endpoint") {
        auto r = run_sync(graph.add(fx.a, "ghost", "inspired_by"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::NotFound);
    }

    auto edges = run_sync(graph.list_for_record(fx.a));
    REQUIRE(edges.has_value());
    CHECK(edges->empty());
}

TEST_CASE("RelationshipGraph stats_by_type", "[store][graph]") {
    GraphFixture fx("pv_graph_stats.db");
    auto& graph = fx.store->relationships();

    Relationship edge;
    edge.source_id = fx.b;
    edge.target_id = fx.a;
    edge.type = RelationshipType::InspiredBy;
    REQUIRE(run_sync(graph.add(edge)).has_value());
    REQUIRE(run_sync(graph.add(fx.c, fx.a, "inspired_by")).has_value());
    REQUIRE(run_sync(graph.add(fx.c, fx.b, "derived_from")).has_value());

    auto stats = run_sync(graph.stats_by_type());
    REQUIRE(stats.has_value());
    CHECK(stats->at("inspired_by") == 2);
    CHECK(stats->at("derived_from") == 1);
    CHECK(stats->at("similar_to") == 0);
    CHECK(stats->at("merged_with") == 0);
}

TEST_CASE("RelationshipGraph remove_for_record", "[store][graph]") {
    GraphFixture fx("pv_graph_remove.db");
    auto& graph = fx.store->relationships();

    REQUIRE(run_sync(graph.add(fx.a, fx.b, "similar_to")).has_value());
    REQUIRE(run_sync(graph.add(fx.c, fx.a, "derived_from")).has_value());
    REQUIRE(run_sync(graph.add(fx.c, fx.b, "derived_from")).has_value());

    auto removed = run_sync(graph.remove_for_record(fx.a));
    REQUIRE(removed.has_value());
    CHECK(*removed == 2);

    auto rest = run_sync(graph.list_for_record(fx.b));
    REQUIRE(rest.has_value());
    CHECK(rest->size() == 1);

    // The records themselves stay.
    CHECK(run_sync(fx.store->candidates().get(fx.a)).has_value());
}
