#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "promptvault/core/error.hpp"
#include "promptvault/store/database.hpp"

namespace promptvault::store {

using boost::asio::awaitable;

/// Well-known policy keys and the defaults readers fall back to.
namespace config_keys {
inline constexpr std::string_view kMaxPrompts = "max_prompts";
inline constexpr std::string_view kMinRelevanceScore = "min_relevance_score";
inline constexpr std::string_view kCleanupProtectScore = "cleanup_protect_score";
inline constexpr std::string_view kRelevanceHalfLifeDays = "relevance_half_life_days";
inline constexpr std::string_view kRelevanceRecencyWeight = "relevance_recency_weight";
inline constexpr std::string_view kMaintenanceBatchSize = "maintenance_batch_size";
} // namespace config_keys

namespace config_defaults {
inline constexpr int64_t kMaxPrompts = 1000;
inline constexpr double kMinRelevanceScore = 0.3;
inline constexpr double kCleanupProtectScore = 0.9;
inline constexpr double kRelevanceHalfLifeDays = 30.0;
inline constexpr double kRelevanceRecencyWeight = 0.7;
inline constexpr int64_t kMaintenanceBatchSize = 500;
} // namespace config_defaults

/// Persisted string key/value settings. A missing key is never an error:
/// typed getters return the caller's default for absent or unparseable
/// values. Only storage failures surface as errors.
class ConfigStore {
public:
    explicit ConfigStore(std::shared_ptr<Database> db);

    auto get(std::string_view key) -> awaitable<Result<std::optional<std::string>>>;
    auto get_int(std::string_view key, int64_t default_value) -> awaitable<Result<int64_t>>;
    auto get_float(std::string_view key, double default_value) -> awaitable<Result<double>>;
    auto get_string(std::string_view key, std::string default_value)
        -> awaitable<Result<std::string>>;
    /// Accepts true/false, 1/0, yes/no (case-insensitive).
    auto get_bool(std::string_view key, bool default_value) -> awaitable<Result<bool>>;

    auto set(std::string_view key, std::string_view value) -> awaitable<Result<void>>;
    auto all() -> awaitable<Result<std::map<std::string, std::string>>>;

    /// Inserts each entry whose key is absent; existing values are kept.
    /// Returns the number of keys written.
    auto seed_defaults(const std::map<std::string, std::string>& defaults)
        -> awaitable<Result<size_t>>;

private:
    auto read(std::string_view key) -> Result<std::optional<std::string>>;

    std::shared_ptr<Database> db_;
};

} // namespace promptvault::store
