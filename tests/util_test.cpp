#include <catch2/catch.hpp>
#include <cstdlib>
#include "util.hpp"

using namespace nlpq;

TEST_CASE("Integer options must be whole numbers", "[util]") {
    REQUIRE(parse_long("5001") == 5001L);
    REQUIRE(parse_long("-3") == -3L);
    REQUIRE_FALSE(parse_long(""));
    REQUIRE_FALSE(parse_long("abc"));
    REQUIRE_FALSE(parse_long("12ms"));
    REQUIRE_FALSE(parse_long("99999999999999999999999"));
}

TEST_CASE("Environment integers fall back on bad values", "[util]") {
    ::setenv("NLPQ_TEST_NUMBER", "250", 1);
    REQUIRE(getenv_long("NLPQ_TEST_NUMBER", 7) == 250);
    ::setenv("NLPQ_TEST_NUMBER", "soon", 1);
    REQUIRE(getenv_long("NLPQ_TEST_NUMBER", 7) == 7);
    ::unsetenv("NLPQ_TEST_NUMBER");
    REQUIRE(getenv_long("NLPQ_TEST_NUMBER", 7) == 7);
}

TEST_CASE("Bulk flags accept the usual truthy spellings", "[util]") {
    for (const char* yes : {"1", "Y", "True", "true"}) REQUIRE(is_truthy(yes));
    for (const char* no : {"", "0", "N", "false", "yes"}) REQUIRE_FALSE(is_truthy(no));
}
