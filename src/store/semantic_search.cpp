#include "promptvault/store/semantic_search.hpp"
#include "promptvault/core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <queue>

#include "candidate_rows.hpp"

namespace promptvault::store {

namespace {

struct ScoredId {
    double score;
    int64_t created_at;
    std::string id;
};

// Orders "better" first: higher score, then newer, then larger id.
auto ranks_before(const ScoredId& a, const ScoredId& b) -> bool {
    if (a.score != b.score) return a.score > b.score;
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id > b.id;
}

// Min-heap on rank so the worst kept entry sits on top.
struct WorstOnTop {
    auto operator()(const ScoredId& a, const ScoredId& b) const -> bool {
        return ranks_before(a, b);
    }
};

} // anonymous namespace

void to_json(json& j, const SemanticResults& r) {
    j = json::array();
    for (size_t i = 0; i < r.candidates.size(); ++i) {
        json entry = r.candidates[i];
        entry["similarity"] = r.similarities[i];
        j.push_back(std::move(entry));
    }
}

auto cosine_similarity(std::span<const float> a, std::span<const float> b) -> double {
    if (a.size() != b.size() || a.empty()) return 0.0;

    double dot = 0.0;
    double mag_a = 0.0;
    double mag_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        mag_a += static_cast<double>(a[i]) * a[i];
        mag_b += static_cast<double>(b[i]) * b[i];
    }
    if (mag_a == 0.0 || mag_b == 0.0) return 0.0;
    return dot / (std::sqrt(mag_a) * std::sqrt(mag_b));
}

SemanticSearch::SemanticSearch(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

auto SemanticSearch::search(const SemanticQuery& query)
    -> awaitable<Result<SemanticResults>> {
    const auto& q = query.embedding;
    if (q.empty() || q.size() > kMaxEmbeddingDimensions) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Query embedding dimensionality out of range", std::to_string(q.size())));
    }
    if (!std::all_of(q.begin(), q.end(), [](float v) { return std::isfinite(v); })) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Query embedding contains non-finite values"));
    }
    if (!(query.min_similarity >= 0.0 && query.min_similarity <= 1.0)) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "min_similarity must be within [0, 1]",
            std::to_string(query.min_similarity)));
    }

    if (auto valid = detail::validate_filter(query.filter); !valid) {
        co_return make_fail(valid.error());
    }

    auto clause = detail::build_filter(query.filter);
    auto limit = static_cast<size_t>(effective_limit(query.filter.limit));

    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        // Scan and fetch read one snapshot, so scores match the rows returned.
        SQLite::Transaction txn(conn);

        std::priority_queue<ScoredId, std::vector<ScoredId>, WorstOnTop> top;
        size_t scored = 0;
        {
            SQLite::Statement stmt(conn,
                "SELECT id, created_at, embedding FROM prompts "
                "WHERE embedding IS NOT NULL AND embedding_dimensions = ? AND " +
                clause.sql);
            stmt.bind(1, static_cast<int>(q.size()));
            detail::bind_params(stmt, clause.params, 2);

            while (stmt.executeStep()) {
                auto blob = stmt.getColumn(2);
                auto vec = detail::deserialize_embedding(
                    blob.getBlob(), static_cast<size_t>(blob.getBytes()));
                double score = cosine_similarity(q, vec);
                ++scored;
                if (score < query.min_similarity) continue;

                ScoredId entry{score, stmt.getColumn(1).getInt64(),
                               stmt.getColumn(0).getString()};
                if (top.size() < limit) {
                    top.push(std::move(entry));
                } else if (ranks_before(entry, top.top())) {
                    top.pop();
                    top.push(std::move(entry));
                }
            }
        }

        std::vector<ScoredId> ranked;
        ranked.reserve(top.size());
        while (!top.empty()) {
            ranked.push_back(top.top());
            top.pop();
        }
        std::reverse(ranked.begin(), ranked.end());

        SemanticResults results;
        results.candidates.reserve(ranked.size());
        results.similarities.reserve(ranked.size());

        SQLite::Statement fetch(conn,
            "SELECT " + std::string(detail::kCandidateColumns) +
            " FROM prompts WHERE id = ?");
        for (const auto& entry : ranked) {
            fetch.bind(1, entry.id);
            if (fetch.executeStep()) {
                results.candidates.push_back(detail::read_candidate(fetch));
                results.similarities.push_back(entry.score);
            }
            fetch.reset();
        }
        txn.commit();

        LOG_DEBUG("Semantic search scored {} record(s), returned {}",
                  scored, results.size());
        co_return results;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Semantic search failed: {}", e.what());
        co_return make_fail(to_error(e, "Semantic search failed"));
    }
}

} // namespace promptvault::store
