#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "promptvault/core/error.hpp"
#include "promptvault/core/types.hpp"
#include "promptvault/store/database.hpp"

namespace promptvault::store {

using boost::asio::awaitable;

inline constexpr int kDefaultSearchLimit = 10;
inline constexpr int kMaxSearchLimit = 1000;

/// Conjunctive filter over stored candidates. Unset fields do not filter.
struct SearchFilter {
    std::optional<std::string> query;       // case-insensitive substring of content
    std::optional<Phase> phase;
    std::optional<std::string> provider;
    std::optional<std::string> model;
    std::set<std::string> tags;             // match if the record carries ANY of these
    std::optional<Timestamp> created_after; // inclusive
    std::optional<double> min_relevance;    // inclusive, within [0, 1]
    std::optional<bool> has_embedding;
    int limit = kDefaultSearchLimit;
};

/// limit <= 0 selects the default; larger values are capped.
auto effective_limit(int limit) -> int;

class TextSearch {
public:
    explicit TextSearch(std::shared_ptr<Database> db);

    /// Newest first (created_at DESC, id DESC). No match yields an empty vector.
    auto search(const SearchFilter& filter) -> awaitable<Result<std::vector<Candidate>>>;

    /// Highest relevance first, then most recently used. Records never used
    /// follow those that were, newest first.
    auto top_relevant(const SearchFilter& filter) -> awaitable<Result<std::vector<Candidate>>>;

    /// Records still waiting for an embedding, oldest first.
    auto without_embeddings(int limit = kDefaultSearchLimit)
        -> awaitable<Result<std::vector<Candidate>>>;

private:
    auto select(const SearchFilter& filter, std::string_view order_by)
        -> Result<std::vector<Candidate>>;

    std::shared_ptr<Database> db_;
};

} // namespace promptvault::store
