#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "promptvault/core/error.hpp"
#include "promptvault/core/types.hpp"
#include "promptvault/store/database.hpp"

namespace promptvault::store {

using boost::asio::awaitable;

struct StatsOptions {
    bool include_relationships = true;
    bool include_usage = true;
};

struct UsageStats {
    int64_t total_usage_count = 0;
    double average_usage = 0.0;
    int64_t prompts_with_usage = 0;
};

struct StoreStats {
    int64_t total_prompts = 0;
    int64_t prompts_with_embeddings = 0;
    double embedding_coverage_percent = 0.0;
    double average_relevance = 0.0;
    std::map<std::string, int64_t> by_phase;
    std::map<std::string, int64_t> by_provider;
    std::map<std::string, std::string> configuration;
    std::optional<std::map<std::string, int64_t>> relationships;
    std::optional<UsageStats> usage;
};

void to_json(json& j, const UsageStats& u);
void to_json(json& j, const StoreStats& s);

/// Read-only summary of the store, taken as one consistent snapshot.
class Statistics {
public:
    explicit Statistics(std::shared_ptr<Database> db);

    auto store_stats(const StatsOptions& options = {}) -> awaitable<Result<StoreStats>>;

private:
    std::shared_ptr<Database> db_;
};

} // namespace promptvault::store
