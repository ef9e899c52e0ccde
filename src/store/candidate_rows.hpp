#pragma once

// Row mapping and SQL fragments shared by the store components. Every
// function here expects the caller to hold the Database lock.

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <SQLiteCpp/SQLiteCpp.h>

#include "promptvault/core/error.hpp"
#include "promptvault/core/types.hpp"
#include "promptvault/store/text_search.hpp"

namespace promptvault::store::detail {

inline constexpr std::string_view kCandidateColumns =
    "id, content, content_hash, phase, provider, model, temperature, max_tokens, "
    "actual_tokens, tags, embedding, embedding_model, embedding_dimensions, "
    "relevance_score, usage_count, last_used_at, created_at, updated_at";

auto serialize_embedding(const std::vector<float>& vec) -> std::string;
auto deserialize_embedding(const void* blob, size_t bytes) -> std::vector<float>;

/// Fails with SerializationError when a tag is not valid UTF-8.
auto tags_to_json(const std::set<std::string>& tags) -> Result<std::string>;
auto tags_from_json(const std::string& text) -> std::set<std::string>;

/// Reads one row selected with kCandidateColumns, starting at column 0.
auto read_candidate(SQLite::Statement& stmt) -> Candidate;

/// Deletes the record and every edge touching it. Must run inside the
/// caller's transaction. Returns the number of records removed (0 or 1).
auto delete_candidate(SQLite::Database& conn, const std::string& id) -> int;

/// Edge counts keyed by relationship type name; every type is present,
/// zero when it has no edges.
auto count_edges_by_type(SQLite::Database& conn) -> std::map<std::string, int64_t>;

using BindValue = std::variant<int64_t, double, std::string>;

/// A parenthesised AND of filter predicates (or "1" when unfiltered) plus
/// the positional parameters it consumes.
struct FilterClause {
    std::string sql;
    std::vector<BindValue> params;
};

/// Rejects a min_relevance outside [0, 1].
auto validate_filter(const SearchFilter& filter) -> VoidResult;

auto build_filter(const SearchFilter& filter) -> FilterClause;

/// Binds params starting at the given 1-based index; returns the next free index.
auto bind_params(SQLite::Statement& stmt, const std::vector<BindValue>& params,
                 int first_index = 1) -> int;

/// Escapes %, _ and the escape character itself for LIKE ... ESCAPE '\'.
auto escape_like(std::string_view text) -> std::string;

} // namespace promptvault::store::detail
