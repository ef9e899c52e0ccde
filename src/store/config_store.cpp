#include "promptvault/store/config_store.hpp"
#include "promptvault/core/logger.hpp"
#include "promptvault/core/utils.hpp"

namespace promptvault::store {

ConfigStore::ConfigStore(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

auto ConfigStore::read(std::string_view key) -> Result<std::optional<std::string>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT value FROM database_config WHERE key = ?");
        stmt.bind(1, std::string(key));
        if (!stmt.executeStep()) {
            return std::optional<std::string>{};
        }
        return std::optional<std::string>(stmt.getColumn(0).getString());
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to read config key {}: {}", key, e.what());
        return std::unexpected(to_error(e, "Failed to read config"));
    }
}

auto ConfigStore::get(std::string_view key)
    -> awaitable<Result<std::optional<std::string>>> {
    co_return read(key);
}

auto ConfigStore::get_int(std::string_view key, int64_t default_value)
    -> awaitable<Result<int64_t>> {
    auto value = read(key);
    if (!value) co_return make_fail(value.error());
    if (!*value) co_return default_value;

    auto parsed = utils::parse_int(utils::trim(**value));
    if (!parsed) {
        LOG_WARN("Config {}='{}' is not an integer, using {}", key, **value, default_value);
        co_return default_value;
    }
    co_return *parsed;
}

auto ConfigStore::get_float(std::string_view key, double default_value)
    -> awaitable<Result<double>> {
    auto value = read(key);
    if (!value) co_return make_fail(value.error());
    if (!*value) co_return default_value;

    auto parsed = utils::parse_double(utils::trim(**value));
    if (!parsed) {
        LOG_WARN("Config {}='{}' is not a number, using {}", key, **value, default_value);
        co_return default_value;
    }
    co_return *parsed;
}

auto ConfigStore::get_string(std::string_view key, std::string default_value)
    -> awaitable<Result<std::string>> {
    auto value = read(key);
    if (!value) co_return make_fail(value.error());
    if (!*value) co_return default_value;
    co_return std::move(**value);
}

auto ConfigStore::get_bool(std::string_view key, bool default_value)
    -> awaitable<Result<bool>> {
    auto value = read(key);
    if (!value) co_return make_fail(value.error());
    if (!*value) co_return default_value;

    auto v = utils::to_lower(utils::trim(**value));
    if (v == "true" || v == "1" || v == "yes") co_return true;
    if (v == "false" || v == "0" || v == "no") co_return false;
    LOG_WARN("Config {}='{}' is not a boolean, using {}", key, **value, default_value);
    co_return default_value;
}

auto ConfigStore::set(std::string_view key, std::string_view value)
    -> awaitable<Result<void>> {
    if (key.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Config key must not be empty"));
    }

    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "INSERT INTO database_config (key, value, updated_at) VALUES (?, ?, ?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
            "updated_at = excluded.updated_at");
        stmt.bind(1, std::string(key));
        stmt.bind(2, std::string(value));
        stmt.bind(3, utils::timestamp_ms());
        stmt.exec();
        LOG_DEBUG("Config {} set to '{}'", key, value);
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to set config key {}: {}", key, e.what());
        co_return make_fail(to_error(e, "Failed to set config"));
    }
}

auto ConfigStore::all() -> awaitable<Result<std::map<std::string, std::string>>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT key, value FROM database_config ORDER BY key");
        std::map<std::string, std::string> entries;
        while (stmt.executeStep()) {
            entries.emplace(stmt.getColumn(0).getString(), stmt.getColumn(1).getString());
        }
        co_return entries;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to list config: {}", e.what());
        co_return make_fail(to_error(e, "Failed to list config"));
    }
}

auto ConfigStore::seed_defaults(const std::map<std::string, std::string>& defaults)
    -> awaitable<Result<size_t>> {
    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);
        SQLite::Statement stmt(conn,
            "INSERT OR IGNORE INTO database_config (key, value, updated_at) "
            "VALUES (?, ?, ?)");
        auto now = utils::timestamp_ms();
        size_t written = 0;
        for (const auto& [key, value] : defaults) {
            stmt.bind(1, key);
            stmt.bind(2, value);
            stmt.bind(3, now);
            written += static_cast<size_t>(stmt.exec());
            stmt.reset();
        }
        txn.commit();
        if (written > 0) {
            LOG_INFO("Seeded {} config default(s)", written);
        }
        co_return written;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to seed config defaults: {}", e.what());
        co_return make_fail(to_error(e, "Failed to seed config defaults"));
    }
}

} // namespace promptvault::store
