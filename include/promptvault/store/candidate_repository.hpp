#pragma once

#include <cstdint>
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

/// Replacement embedding for an existing record.
struct EmbeddingUpdate {
    std::vector<float> embedding;
    std::string model;
    int dimensions = 0;
};

/// Partial update: only engaged fields are written.
struct CandidateUpdate {
    std::optional<std::string> content;
    std::optional<std::set<std::string>> tags;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::optional<int> actual_tokens;
    std::optional<EmbeddingUpdate> embedding;

    [[nodiscard]] auto empty() const -> bool {
        return !content && !tags && !temperature && !max_tokens && !actual_tokens && !embedding;
    }
};

/// Checks that an embedding and its metadata agree.
///
/// A vector that is empty, larger than kMaxEmbeddingDimensions, or holds
/// non-finite values is InvalidArgument, as is a vector without a model
/// name or a positive dimension count. A vector whose length differs from
/// the declared dimensions, or metadata without a vector, is Conflict.
auto validate_embedding(const std::optional<std::vector<float>>& embedding,
                        const std::optional<std::string>& model,
                        const std::optional<int>& dimensions) -> VoidResult;

/// CRUD over stored candidates.
class CandidateRepository {
public:
    explicit CandidateRepository(std::shared_ptr<Database> db);

    /// Stores a new record and returns its generated id. The input id is
    /// ignored; created_at is kept when the caller set it, otherwise now.
    auto create(const Candidate& candidate) -> awaitable<Result<std::string>>;

    auto get(std::string_view id) -> awaitable<Result<Candidate>>;

    auto update(std::string_view id, const CandidateUpdate& changes) -> awaitable<Result<void>>;

    /// Deletes the record and every relationship touching it atomically.
    auto remove(std::string_view id) -> awaitable<Result<void>>;

    /// Increments usage_count and stamps last_used_at. Returns the new count.
    auto record_usage(std::string_view id) -> awaitable<Result<int64_t>>;

    auto find_by_content_hash(std::string_view hash, int limit = 10)
        -> awaitable<Result<std::vector<Candidate>>>;

    auto count() -> awaitable<Result<size_t>>;

private:
    std::shared_ptr<Database> db_;
};

} // namespace promptvault::store
