#include <catch2/catch_test_macros.hpp>

#include <set>

#include "promptvault/core/utils.hpp"

TEST_CASE("generate_uuid produces valid format", "[utils]") {
    auto uuid = promptvault::utils::generate_uuid();
    // UUID v4 format: 8-4-4-4-12 = 36 chars
    REQUIRE(uuid.size() == 36);
    CHECK(uuid[8] == '-');
    CHECK(uuid[13] == '-');
    CHECK(uuid[18] == '-');
    CHECK(uuid[23] == '-');
    CHECK(uuid[14] == '4');
}

TEST_CASE("generate_uuid is unique across calls", "[utils]") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(promptvault::utils::generate_uuid());
    }
    CHECK(seen.size() == 1000);
}

TEST_CASE("trim removes whitespace", "[utils]") {
    CHECK(promptvault::utils::trim("  hello  ") == "hello");
    CHECK(promptvault::utils::trim("\t\nhello\r\n") == "hello");
    CHECK(promptvault::utils::trim("hello") == "hello");
    CHECK(promptvault::utils::trim("   ").empty());
}

TEST_CASE("to_lower folds ASCII", "[utils]") {
    CHECK(promptvault::utils::to_lower("YeS") == "yes");
}

TEST_CASE("sha256 matches known digests", "[utils]") {
    CHECK(promptvault::utils::sha256("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(promptvault::utils::sha256("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("parse_int accepts whole integers only", "[utils]") {
    CHECK(promptvault::utils::parse_int("1000") == 1000);
    CHECK(promptvault::utils::parse_int(" -7 ") == -7);
    CHECK_FALSE(promptvault::utils::parse_int("12abc").has_value());
    CHECK_FALSE(promptvault::utils::parse_int("").has_value());
    CHECK_FALSE(promptvault::utils::parse_int("99999999999999999999999").has_value());
}

TEST_CASE("parse_double accepts finite numbers only", "[utils]") {
    CHECK(promptvault::utils::parse_double("0.3") == 0.3);
    CHECK(promptvault::utils::parse_double("1") == 1.0);
    CHECK_FALSE(promptvault::utils::parse_double("0.3x").has_value());
    CHECK_FALSE(promptvault::utils::parse_double("inf").has_value());
    CHECK_FALSE(promptvault::utils::parse_double("nan").has_value());
}

TEST_CASE("parse_date_ms parses ISO dates as UTC midnight", "[utils]") {
    CHECK(promptvault::utils::parse_date_ms("1970-01-02") == 86'400'000);
    CHECK(promptvault::utils::parse_date_ms("2024-03-01") == 1'709'251'200'000);
    CHECK_FALSE(promptvault::utils::parse_date_ms("yesterday").has_value());
    CHECK_FALSE(promptvault::utils::parse_date_ms("2024-03-01T00:00").has_value());
}
