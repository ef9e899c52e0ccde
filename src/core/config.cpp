#include "promptvault/core/config.hpp"
#include "promptvault/core/logger.hpp"
#include "promptvault/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace promptvault {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("PROMPTVAULT_DB_PATH")) {
        config.store.db_path = val;
    }
    if (auto* val = std::getenv("PROMPTVAULT_DATA_DIR")) {
        config.data_dir = val;
    }
    if (auto* val = std::getenv("PROMPTVAULT_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("PROMPTVAULT_MAX_PROMPTS")) {
        if (auto parsed = utils::parse_int(val)) {
            config.lifecycle.max_prompts = *parsed;
        } else {
            LOG_WARN("Ignoring non-numeric PROMPTVAULT_MAX_PROMPTS='{}'", val);
        }
    }
    if (auto* val = std::getenv("PROMPTVAULT_MIN_RELEVANCE_SCORE")) {
        if (auto parsed = utils::parse_double(val)) {
            config.lifecycle.min_relevance_score = *parsed;
        } else {
            LOG_WARN("Ignoring non-numeric PROMPTVAULT_MIN_RELEVANCE_SCORE='{}'", val);
        }
    }
    if (auto* val = std::getenv("PROMPTVAULT_EMBEDDING_MODEL")) {
        config.embeddings.standard_model = val;
    }
    if (auto* val = std::getenv("PROMPTVAULT_EMBEDDING_DIMENSIONS")) {
        auto parsed = utils::parse_int(val);
        if (parsed && *parsed > 0 &&
            *parsed <= static_cast<int64_t>(kMaxEmbeddingDimensions)) {
            config.embeddings.standard_dimensions = static_cast<int>(*parsed);
        } else {
            LOG_WARN("Ignoring PROMPTVAULT_EMBEDDING_DIMENSIONS='{}', expected 1..{}",
                     val, kMaxEmbeddingDimensions);
        }
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("PROMPTVAULT_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".promptvault";
}

auto resolve_db_path(const Config& config) -> std::filesystem::path {
    if (config.store.db_path) {
        return *config.store.db_path;
    }
    auto data_dir = config.data_dir
        ? std::filesystem::path(*config.data_dir)
        : default_data_dir();
    return data_dir / "prompts.db";
}

} // namespace promptvault
