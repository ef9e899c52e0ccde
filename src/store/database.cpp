#include "promptvault/store/database.hpp"
#include "promptvault/core/logger.hpp"

#include <filesystem>

#include <sqlite3.h>

namespace promptvault::store {

Database::Database(const std::string& path, DatabaseOptions options)
    : path_(path) {
    if (path != ":memory:") {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    try {
        db_ = std::make_unique<SQLite::Database>(
            path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        db_->setBusyTimeout(options.busy_timeout_ms);
        db_->exec("PRAGMA journal_mode=WAL");
        db_->exec("PRAGMA synchronous=NORMAL");
        db_->exec("PRAGMA foreign_keys=ON");
        LOG_INFO("Prompt store database opened: {}", path);
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to open prompt store database {}: {}", path, e.what());
        throw;
    }
}

Database::~Database() = default;

auto Database::open(const std::string& path, DatabaseOptions options)
    -> Result<std::shared_ptr<Database>> {
    try {
        return std::make_shared<Database>(path, options);
    } catch (const SQLite::Exception& e) {
        return std::unexpected(to_error(e, "Failed to open database " + path));
    } catch (const std::filesystem::filesystem_error& e) {
        return std::unexpected(make_error(
            ErrorCode::Unavailable, "Failed to create database directory", e.what()));
    }
}

auto Database::lock() -> std::unique_lock<std::mutex> {
    return std::unique_lock<std::mutex>(mutex_);
}

auto Database::connection() -> SQLite::Database& {
    return *db_;
}

auto Database::path() const -> const std::string& {
    return path_;
}

auto to_error(const SQLite::Exception& e, std::string message) -> Error {
    switch (e.getErrorCode() & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
        case SQLITE_FULL:
        case SQLITE_IOERR:
        case SQLITE_NOMEM:
            return make_error(ErrorCode::Unavailable, std::move(message), e.what());
        case SQLITE_CONSTRAINT:
            return make_error(ErrorCode::Conflict, std::move(message), e.what());
        default:
            return make_error(ErrorCode::DatabaseError, std::move(message), e.what());
    }
}

} // namespace promptvault::store
