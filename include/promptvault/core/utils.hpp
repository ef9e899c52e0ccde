#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace promptvault::utils {

auto generate_uuid() -> std::string;
auto timestamp_ms() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto sha256(std::string_view data) -> std::string;

/// Parses a whole string as a number; trailing garbage or overflow yields nullopt.
auto parse_int(std::string_view s) -> std::optional<int64_t>;
auto parse_double(std::string_view s) -> std::optional<double>;

/// Parses "YYYY-MM-DD" as midnight UTC, returned as epoch milliseconds.
auto parse_date_ms(std::string_view s) -> std::optional<int64_t>;

} // namespace promptvault::utils
