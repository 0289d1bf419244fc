/**
 * @file test_locator.cpp
 * @brief Build artifact lookup unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <filesystem>
#include <string>

#include "fwsize/fwsize.hpp"
#include "test_support.hpp"

using namespace fwsize;
using fwsize_test::TempDir;
using fwsize_test::write_file;

namespace fs = std::filesystem;

TEST_CASE("Build modes")
{
  CHECK(std::string(mode_directory(BuildMode::DEBUG)) == "debug");
  CHECK(std::string(mode_directory(BuildMode::RELEASE)) == "release");
}

TEST_CASE("Native layout")
{
  TempDir dir;
  const fs::path root = dir.path();
  fs::path found;

  SUBCASE("Debug binary")
  {
    write_file(root / "target" / "debug" / "myapp", std::string("elf"));
    REQUIRE(locate_artifact(root, "myapp", BuildMode::DEBUG, found) == ErrorCode::OK);
    CHECK(found == root / "target" / "debug" / "myapp");
  }

  SUBCASE("Release binary")
  {
    write_file(root / "target" / "debug" / "myapp", std::string("elf"));
    write_file(root / "target" / "release" / "myapp", std::string("elf"));
    REQUIRE(locate_artifact(root, "myapp", BuildMode::RELEASE, found) == ErrorCode::OK);
    CHECK(found == root / "target" / "release" / "myapp");
  }

  SUBCASE("Only the other mode was built")
  {
    write_file(root / "target" / "debug" / "myapp", std::string("elf"));
    CHECK(locate_artifact(root, "myapp", BuildMode::RELEASE, found) ==
          ErrorCode::ARTIFACT_NOT_FOUND);
  }

  SUBCASE("Native layout wins over cross layout")
  {
    write_file(root / "target" / "debug" / "myapp", std::string("native"));
    write_file(root / "target" / "thumbv7em-none-eabihf" / "debug" / "myapp",
               std::string("cross"));
    REQUIRE(locate_artifact(root, "myapp", BuildMode::DEBUG, found) == ErrorCode::OK);
    CHECK(found == root / "target" / "debug" / "myapp");
  }
}

TEST_CASE("Cross-compiled layout")
{
  TempDir dir;
  const fs::path root = dir.path();
  fs::path found;

  SUBCASE("Nested target triple")
  {
    fs::create_directories(root / "target" / "debug");
    write_file(root / "target" / "thumbv7em-none-eabihf" / "debug" / "myapp",
               std::string("elf"));
    REQUIRE(locate_artifact(root, "myapp", BuildMode::DEBUG, found) == ErrorCode::OK);
    CHECK(found == root / "target" / "thumbv7em-none-eabihf" / "debug" / "myapp");
  }

  SUBCASE("Every known triple is searched")
  {
    for (const auto triple : TARGET_TRIPLES)
    {
      TempDir scratch;
      const fs::path expected = scratch.path() / "target" / triple / "release" / "fw";
      write_file(expected, std::string("elf"));

      fs::path path;
      REQUIRE(locate_artifact(scratch.path(), "fw", BuildMode::RELEASE, path) == ErrorCode::OK);
      CHECK(path == expected);
    }
  }

  SUBCASE("Table order breaks ties")
  {
    write_file(root / "target" / "thumbv7em-none-eabihf" / "debug" / "myapp",
               std::string("elf"));
    write_file(root / "target" / "thumbv6m-none-eabi" / "debug" / "myapp", std::string("elf"));
    REQUIRE(locate_artifact(root, "myapp", BuildMode::DEBUG, found) == ErrorCode::OK);
    CHECK(found == root / "target" / "thumbv6m-none-eabi" / "debug" / "myapp");
  }

  SUBCASE("Only the first present triple is searched")
  {
    fs::create_directories(root / "target" / "thumbv6m-none-eabi" / "debug");
    write_file(root / "target" / "thumbv7m-none-eabi" / "debug" / "myapp", std::string("elf"));
    CHECK(locate_artifact(root, "myapp", BuildMode::DEBUG, found) ==
          ErrorCode::ARTIFACT_NOT_FOUND);
  }

  SUBCASE("Unknown triple")
  {
    write_file(root / "target" / "xtensa-esp32-none-elf" / "debug" / "myapp",
               std::string("elf"));
    CHECK(locate_artifact(root, "myapp", BuildMode::DEBUG, found) ==
          ErrorCode::ARTIFACT_NOT_FOUND);
  }
}

TEST_CASE("Artifact not found")
{
  TempDir dir;
  const fs::path root = dir.path();
  fs::path found;

  SUBCASE("No target directory")
  {
    CHECK(locate_artifact(root, "myapp", BuildMode::DEBUG, found) ==
          ErrorCode::ARTIFACT_NOT_FOUND);
  }

  SUBCASE("Empty target directory")
  {
    fs::create_directories(root / "target");
    CHECK(locate_artifact(root, "myapp", BuildMode::DEBUG, found) ==
          ErrorCode::ARTIFACT_NOT_FOUND);
  }

  SUBCASE("Directory with the artifact name")
  {
    fs::create_directories(root / "target" / "debug" / "myapp");
    CHECK(locate_artifact(root, "myapp", BuildMode::DEBUG, found) ==
          ErrorCode::ARTIFACT_NOT_FOUND);
  }

  SUBCASE("Other artifact")
  {
    write_file(root / "target" / "debug" / "otherapp", std::string("elf"));
    CHECK(locate_artifact(root, "myapp", BuildMode::DEBUG, found) ==
          ErrorCode::ARTIFACT_NOT_FOUND);
  }

  SUBCASE("Empty artifact name")
  {
    CHECK(locate_artifact(root, "", BuildMode::DEBUG, found) == ErrorCode::INVALID_ARGUMENT);
  }
}
