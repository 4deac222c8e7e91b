#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace sta;

TEST_CASE("trim strips surrounding whitespace", "[StringUtils]") {
  REQUIRE(trim("  D:1080 \t\n") == "D:1080");
  REQUIRE(trim("L:8080:web:80") == "L:8080:web:80");
  REQUIRE(trim(" \t ") == "");
  REQUIRE(trim("") == "");
}

TEST_CASE("splitWhitespace drops empty tokens", "[StringUtils]") {
  REQUIRE(splitWhitespace("  a\tb\n\nc  ") == vector<string>{"a", "b", "c"});
  REQUIRE(splitWhitespace("   ").empty());
}

TEST_CASE("split keeps empty fields", "[StringUtils]") {
  REQUIRE(split("L:8080::80", ':') == vector<string>{"L", "8080", "", "80"});
}

TEST_CASE("joinArgs separates with single spaces", "[StringUtils]") {
  REQUIRE(joinArgs({"ssh", "-N", "host"}) == "ssh -N host");
  REQUIRE(joinArgs({}) == "");
}
