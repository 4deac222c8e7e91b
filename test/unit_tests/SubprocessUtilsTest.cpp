#include "SubprocessUtils.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace sta;

TEST_CASE("SubprocessUtils Run executes command", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.Run("echo", {"hello", "world"});

  REQUIRE(result.ok());
  REQUIRE(result.output == "hello world\n");
  REQUIRE(result.error.empty());
}

TEST_CASE("SubprocessUtils Run with no args", "[SubprocessUtils]") {
  // pwd should return a path (containing at least a forward slash)
  SubprocessUtils utils;
  auto result = utils.Run("pwd", {});

  REQUIRE(result.ok());
  REQUIRE(result.output.find("/") != string::npos);
}

TEST_CASE("SubprocessUtils Run captures stdout exactly", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.Run("printf", {"test123"});

  REQUIRE(result.output == "test123");
}

TEST_CASE("SubprocessUtils Run separates stderr and exit code",
          "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result =
      utils.Run("sh", {"-c", "printf out; printf err >&2; exit 3"});

  REQUIRE_FALSE(result.ok());
  REQUIRE(result.exitCode == 3);
  REQUIRE(result.output == "out");
  REQUIRE(result.error == "err");
}

TEST_CASE("SubprocessUtils Run does not use a shell", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.Run("echo", {"$HOME", "a;b"});

  REQUIRE(result.output == "$HOME a;b\n");
}

TEST_CASE("SubprocessUtils Run reports a missing binary",
          "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.Run("sta-no-such-binary-xyz", {});

  REQUIRE(result.exitCode == 127);
}

TEST_CASE("SubprocessUtils Run reports signals", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.Run("sh", {"-c", "kill -TERM $$"});

  REQUIRE(result.exitCode == 128 + SIGTERM);
}

TEST_CASE("SubprocessUtils FindOnPath", "[SubprocessUtils]") {
  SubprocessUtils utils;

  auto sh = utils.FindOnPath("sh");
  REQUIRE(sh.has_value());
  REQUIRE(sh->back() != '/');
  REQUIRE(::access(sh->c_str(), X_OK) == 0);

  REQUIRE_FALSE(utils.FindOnPath("sta-no-such-binary-xyz").has_value());
  REQUIRE(utils.FindOnPath("/bin/sh").has_value());
  REQUIRE_FALSE(utils.FindOnPath("/nonexistent/sh").has_value());
}
