#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "promptvault/core/error.hpp"
#include "promptvault/core/types.hpp"
#include "promptvault/store/database.hpp"

namespace promptvault::store {

using boost::asio::awaitable;

/// Directed, typed edges between stored candidates.
class RelationshipGraph {
public:
    explicit RelationshipGraph(std::shared_ptr<Database> db);

    /// Adds (or refreshes) an edge. An unknown type name, a strength outside
    /// [0, 1], or a self-edge is InvalidArgument; a missing endpoint is NotFound.
    /// Re-adding the same (source, target, type) updates strength and context.
    auto add(std::string_view source_id, std::string_view target_id,
             std::string_view type, double strength = 0.5,
             std::string_view context = {}) -> awaitable<Result<void>>;

    auto add(const Relationship& edge) -> awaitable<Result<void>>;

    /// Removes every edge where the record is source or target.
    auto remove_for_record(std::string_view id) -> awaitable<Result<size_t>>;

    /// Edge counts keyed by type name; every known type is present.
    auto stats_by_type() -> awaitable<Result<std::map<std::string, int64_t>>>;

    auto list_for_record(std::string_view id) -> awaitable<Result<std::vector<Relationship>>>;

private:
    auto insert(const Relationship& edge) -> Result<void>;

    std::shared_ptr<Database> db_;
};

} // namespace promptvault::store
