#include "promptvault/store/text_search.hpp"
#include "promptvault/core/logger.hpp"

#include <algorithm>

#include "candidate_rows.hpp"

namespace promptvault::store {

auto effective_limit(int limit) -> int {
    if (limit <= 0) return kDefaultSearchLimit;
    return std::min(limit, kMaxSearchLimit);
}

TextSearch::TextSearch(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

auto TextSearch::select(const SearchFilter& filter, std::string_view order_by)
    -> Result<std::vector<Candidate>> {
    if (auto valid = detail::validate_filter(filter); !valid) {
        return std::unexpected(valid.error());
    }
    auto clause = detail::build_filter(filter);
    int limit = effective_limit(filter.limit);

    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT " + std::string(detail::kCandidateColumns) +
            " FROM prompts WHERE " + clause.sql +
            " ORDER BY " + std::string(order_by) + " LIMIT ?");
        int next = detail::bind_params(stmt, clause.params);
        stmt.bind(next, limit);

        std::vector<Candidate> results;
        while (stmt.executeStep()) {
            results.push_back(detail::read_candidate(stmt));
        }
        LOG_DEBUG("Text search returned {} record(s)", results.size());
        return results;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Text search failed: {}", e.what());
        return std::unexpected(to_error(e, "Text search failed"));
    }
}

auto TextSearch::search(const SearchFilter& filter)
    -> awaitable<Result<std::vector<Candidate>>> {
    co_return select(filter, "created_at DESC, id DESC");
}

auto TextSearch::top_relevant(const SearchFilter& filter)
    -> awaitable<Result<std::vector<Candidate>>> {
    // NULL last_used_at sorts after every timestamp under DESC.
    co_return select(filter,
        "relevance_score DESC, last_used_at DESC, created_at DESC, id DESC");
}

auto TextSearch::without_embeddings(int limit)
    -> awaitable<Result<std::vector<Candidate>>> {
    SearchFilter filter;
    filter.has_embedding = false;
    filter.limit = limit;
    co_return select(filter, "created_at ASC, id ASC");
}

} // namespace promptvault::store
