#pragma once

#include <memory>
#include <span>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "promptvault/core/error.hpp"
#include "promptvault/core/types.hpp"
#include "promptvault/store/database.hpp"
#include "promptvault/store/text_search.hpp"

namespace promptvault::store {

using boost::asio::awaitable;

struct SemanticQuery {
    std::vector<float> embedding;
    double min_similarity = 0.5;
    SearchFilter filter;
};

/// Parallel vectors: similarities[i] belongs to candidates[i].
struct SemanticResults {
    std::vector<Candidate> candidates;
    std::vector<double> similarities;

    [[nodiscard]] auto size() const -> size_t { return candidates.size(); }
    [[nodiscard]] auto empty() const -> bool { return candidates.empty(); }
};

void to_json(json& j, const SemanticResults& r);

/// Cosine similarity of two equal-length vectors. Returns 0 when either has
/// zero magnitude or the lengths differ.
auto cosine_similarity(std::span<const float> a, std::span<const float> b) -> double;

/// Nearest-neighbour search over stored embeddings by brute-force cosine
/// similarity. Only records whose dimensions equal the query's are scored;
/// rows are streamed and a top-k heap bounds memory to the result limit.
class SemanticSearch {
public:
    explicit SemanticSearch(std::shared_ptr<Database> db);

    auto search(const SemanticQuery& query) -> awaitable<Result<SemanticResults>>;

private:
    std::shared_ptr<Database> db_;
};

} // namespace promptvault::store
