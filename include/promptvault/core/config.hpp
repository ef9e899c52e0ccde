#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "promptvault/core/types.hpp"

// std::optional serializer for nlohmann/json; enables NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace promptvault {

struct StoreConfig {
    std::optional<std::string> db_path;  // defaults to <data_dir>/prompts.db
    int busy_timeout_ms = 5000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(StoreConfig, db_path, busy_timeout_ms)

/// Values seeded into the persisted config table on first run.
struct LifecycleConfig {
    int64_t max_prompts = 1000;
    double min_relevance_score = 0.3;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LifecycleConfig, max_prompts, min_relevance_score)

struct EmbeddingsConfig {
    std::string standard_model = "text-embedding-3-small";
    int standard_dimensions = 1536;
    int batch_size = 10;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EmbeddingsConfig, standard_model, standard_dimensions, batch_size)

struct Config {
    StoreConfig store;
    LifecycleConfig lifecycle;
    EmbeddingsConfig embeddings;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, store, lifecycle, embeddings, log_level, data_dir)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Resolves the database file: store.db_path if set, otherwise
/// <data_dir>/prompts.db.
auto resolve_db_path(const Config& config) -> std::filesystem::path;

} // namespace promptvault
