#include "promptvault/store/relationship_graph.hpp"
#include "promptvault/core/logger.hpp"
#include "promptvault/core/utils.hpp"

#include "candidate_rows.hpp"

namespace promptvault::store {

namespace {

auto record_exists(SQLite::Database& conn, const std::string& id) -> bool {
    SQLite::Statement stmt(conn, "SELECT 1 FROM prompts WHERE id = ?");
    stmt.bind(1, id);
    return stmt.executeStep();
}

} // anonymous namespace

RelationshipGraph::RelationshipGraph(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

auto RelationshipGraph::add(std::string_view source_id, std::string_view target_id,
                            std::string_view type, double strength,
                            std::string_view context) -> awaitable<Result<void>> {
    auto parsed = parse_relationship_type(type);
    if (!parsed) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Unknown relationship type", std::string(type)));
    }

    Relationship edge;
    edge.source_id = std::string(source_id);
    edge.target_id = std::string(target_id);
    edge.type = *parsed;
    edge.strength = strength;
    edge.context = std::string(context);
    co_return insert(edge);
}

auto RelationshipGraph::add(const Relationship& edge) -> awaitable<Result<void>> {
    co_return insert(edge);
}

auto RelationshipGraph::insert(const Relationship& edge) -> Result<void> {
    if (!(edge.strength >= 0.0 && edge.strength <= 1.0)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Relationship strength must be within [0, 1]", std::to_string(edge.strength)));
    }
    if (edge.source_id == edge.target_id) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "A record cannot be related to itself", edge.source_id));
    }

    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);

        for (const auto* id : {&edge.source_id, &edge.target_id}) {
            if (!record_exists(conn, *id)) {
                return std::unexpected(make_error(ErrorCode::NotFound,
                    "Relationship endpoint not found", *id));
            }
        }

        SQLite::Statement stmt(conn,
            "INSERT INTO prompt_relationships "
            "(source_id, target_id, relationship_type, strength, context, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(source_id, target_id, relationship_type) DO UPDATE SET "
            "strength = excluded.strength, context = excluded.context");
        stmt.bind(1, edge.source_id);
        stmt.bind(2, edge.target_id);
        stmt.bind(3, std::string(relationship_type_to_string(edge.type)));
        stmt.bind(4, edge.strength);
        stmt.bind(5, edge.context);
        stmt.bind(6, utils::timestamp_ms());
        stmt.exec();

        txn.commit();
        LOG_DEBUG("Related {} -[{}]-> {}", edge.source_id,
                  relationship_type_to_string(edge.type), edge.target_id);
        return {};
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to add relationship {} -> {}: {}",
                  edge.source_id, edge.target_id, e.what());
        return std::unexpected(to_error(e, "Failed to add relationship"));
    }
}

auto RelationshipGraph::remove_for_record(std::string_view id) -> awaitable<Result<size_t>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "DELETE FROM prompt_relationships WHERE source_id = ? OR target_id = ?");
        stmt.bind(1, std::string(id));
        stmt.bind(2, std::string(id));
        co_return static_cast<size_t>(stmt.exec());
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to remove relationships for {}: {}", id, e.what());
        co_return make_fail(to_error(e, "Failed to remove relationships"));
    }
}

auto RelationshipGraph::stats_by_type() -> awaitable<Result<std::map<std::string, int64_t>>> {
    auto guard = db_->lock();
    try {
        co_return detail::count_edges_by_type(db_->connection());
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to count relationships: {}", e.what());
        co_return make_fail(to_error(e, "Failed to count relationships"));
    }
}

auto RelationshipGraph::list_for_record(std::string_view id)
    -> awaitable<Result<std::vector<Relationship>>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT source_id, target_id, relationship_type, strength, context, created_at "
            "FROM prompt_relationships WHERE source_id = ? OR target_id = ? "
            "ORDER BY created_at ASC, id ASC");
        stmt.bind(1, std::string(id));
        stmt.bind(2, std::string(id));

        std::vector<Relationship> edges;
        while (stmt.executeStep()) {
            Relationship edge;
            edge.source_id = stmt.getColumn(0).getString();
            edge.target_id = stmt.getColumn(1).getString();
            auto type = parse_relationship_type(stmt.getColumn(2).getString());
            edge.type = type.value_or(RelationshipType::DerivedFrom);
            edge.strength = stmt.getColumn(3).getDouble();
            edge.context = stmt.getColumn(4).getString();
            edge.created_at = ms_to_timestamp(stmt.getColumn(5).getInt64());
            edges.push_back(std::move(edge));
        }
        co_return edges;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to list relationships for {}: {}", id, e.what());
        co_return make_fail(to_error(e, "Failed to list relationships"));
    }
}

} // namespace promptvault::store
