#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <SQLiteCpp/SQLiteCpp.h>

#include "promptvault/core/error.hpp"

namespace promptvault::store {

struct DatabaseOptions {
    int busy_timeout_ms = 5000;
};

/// One SQLite connection shared by every store component.
///
/// All access goes through lock(): a component holds the guard for the
/// whole statement or transaction it runs, so a multi-step mutation is
/// never interleaved with another caller on the same handle. Other
/// processes are coordinated by SQLite's own file locking and the busy
/// timeout.
class Database {
public:
    /// Opens (or creates) the database file, creating parent directories.
    /// Throws SQLite::Exception or std::filesystem::filesystem_error.
    explicit Database(const std::string& path, DatabaseOptions options = {});
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Non-throwing factory; failures map to Unavailable.
    static auto open(const std::string& path, DatabaseOptions options = {})
        -> Result<std::shared_ptr<Database>>;

    [[nodiscard]] auto lock() -> std::unique_lock<std::mutex>;
    [[nodiscard]] auto connection() -> SQLite::Database&;
    [[nodiscard]] auto path() const -> const std::string&;

private:
    std::string path_;
    std::mutex mutex_;
    std::unique_ptr<SQLite::Database> db_;
};

/// Maps a SQLite failure onto the store's error taxonomy: busy, locked,
/// unopenable, read-only, full and I/O failures become Unavailable;
/// constraint violations become Conflict; the rest DatabaseError.
auto to_error(const SQLite::Exception& e, std::string message) -> Error;

} // namespace promptvault::store
