/**
 * @file test_project.cpp
 * @brief Project discovery, manifest and build invocation unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "fwsize/fwsize.hpp"
#include "test_support.hpp"

using namespace fwsize;
using fwsize_test::TempDir;
using fwsize_test::write_file;

namespace fs = std::filesystem;

/* ========================================================================= */
/* Project root                                                              */
/* ========================================================================= */

TEST_CASE("Project root discovery")
{
  TempDir dir;
  const fs::path root = dir.path() / "blinky";
  write_file(root / "Cargo.toml", std::string("[package]\nname = \"blinky\"\n"));
  fs::create_directories(root / "src" / "bin");

  fs::path found;

  SUBCASE("From the root")
  {
    REQUIRE(find_project_root(root, found) == ErrorCode::OK);
    CHECK(fs::equivalent(found, root));
  }

  SUBCASE("From a subdirectory")
  {
    REQUIRE(find_project_root(root / "src" / "bin", found) == ErrorCode::OK);
    CHECK(fs::equivalent(found, root));
  }

  SUBCASE("Nearest manifest wins")
  {
    const fs::path member = root / "examples" / "member";
    write_file(member / "Cargo.toml", std::string("[package]\nname = \"member\"\n"));
    REQUIRE(find_project_root(member, found) == ErrorCode::OK);
    CHECK(fs::equivalent(found, member));
  }

  SUBCASE("Directory named like the manifest")
  {
    const fs::path other = dir.path() / "other";
    fs::create_directories(other / "Cargo.toml");
    CHECK(find_project_root(other, found) == ErrorCode::NOT_A_PROJECT);
  }
}

/* ========================================================================= */
/* Manifest                                                                  */
/* ========================================================================= */

TEST_CASE("Manifest package name")
{
  TempDir dir;
  const fs::path manifest = dir.path() / "Cargo.toml";
  std::string name;

  SUBCASE("Plain manifest")
  {
    write_file(manifest, std::string(R"([package]
name = "blinky"
version = "0.1.0"
edition = "2021"

[dependencies]
cortex-m = "0.7"
)"));
    REQUIRE(read_artifact_name(manifest, name) == ErrorCode::OK);
    CHECK(name == "blinky");
  }

  SUBCASE("Comments, spacing and literal strings")
  {
    write_file(manifest, std::string(R"(# name = "commented"
[dependencies]
name = "not-the-package"

  [ package ]   # the package table
authors = ["Someone <someone@example.com>"]
name='fw-app'  # trailing comment
)"));
    REQUIRE(read_artifact_name(manifest, name) == ErrorCode::OK);
    CHECK(name == "fw-app");
  }

  SUBCASE("Sub-tables of package do not count")
  {
    write_file(manifest, std::string(R"([package.metadata.docs]
name = "docs"
)"));
    CHECK(read_artifact_name(manifest, name) == ErrorCode::INVALID_MANIFEST);
  }

  SUBCASE("Missing name")
  {
    write_file(manifest, std::string("[package]\nversion = \"0.1.0\"\n"));
    CHECK(read_artifact_name(manifest, name) == ErrorCode::INVALID_MANIFEST);
  }

  SUBCASE("Unquoted name")
  {
    write_file(manifest, std::string("[package]\nname = blinky\n"));
    CHECK(read_artifact_name(manifest, name) == ErrorCode::INVALID_MANIFEST);
  }

  SUBCASE("Empty name")
  {
    write_file(manifest, std::string("[package]\nname = \"\"\n"));
    CHECK(read_artifact_name(manifest, name) == ErrorCode::INVALID_MANIFEST);
  }

  SUBCASE("Missing manifest")
  {
    CHECK(read_artifact_name(dir.path() / "missing.toml", name) == ErrorCode::IO_ERROR);
  }
}

/* ========================================================================= */
/* Build invocation                                                          */
/* ========================================================================= */

TEST_CASE("Build invocation")
{
  TempDir dir;
  const fs::path root = dir.path();
  write_file(root / "Cargo.toml", std::string("[package]\nname = \"fw\"\n"));

  SUBCASE("Successful build")
  {
    setenv("CARGO", "true", 1);
    CHECK(run_build(root, BuildMode::DEBUG) == ErrorCode::OK);
  }

  SUBCASE("Failing build")
  {
    setenv("CARGO", "false", 1);
    CHECK(run_build(root, BuildMode::RELEASE) == ErrorCode::BUILD_FAILED);
  }

  SUBCASE("Missing build tool")
  {
    setenv("CARGO", (root / "no-such-cargo").c_str(), 1);
    CHECK(run_build(root, BuildMode::DEBUG) == ErrorCode::IO_ERROR);
  }

  SUBCASE("Arguments")
  {
    const fs::path tool = root / "fake-cargo";
    const fs::path log = root / "args.txt";
    write_file(tool, "#!/bin/sh\necho \"$@\" > \"" + log.string() + "\"\n");
    fs::permissions(tool, fs::perms::owner_all);
    setenv("CARGO", tool.c_str(), 1);

    REQUIRE(run_build(root, BuildMode::RELEASE) == ErrorCode::OK);

    std::ifstream stream(log);
    std::string line;
    REQUIRE(std::getline(stream, line));
    CHECK(line == "build --release --manifest-path " + (root / "Cargo.toml").string());

    REQUIRE(run_build(root, BuildMode::DEBUG) == ErrorCode::OK);
    std::ifstream second(log);
    REQUIRE(std::getline(second, line));
    CHECK(line == "build --manifest-path " + (root / "Cargo.toml").string());
  }

  unsetenv("CARGO");
}
