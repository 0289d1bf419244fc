/**
 * @file main.cpp
 * @brief cargo-size command-line front end
 *
 * Prints the memory usage of the binary of the enclosing cargo project,
 * building it first unless --no-build is given. Works standalone or as
 * `cargo size`.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <CLI/CLI.hpp>

#include "fwsize/config.hpp"
#include "fwsize/fwsize.hpp"

namespace
{

constexpr const char* GREEN = "92";
constexpr const char* RED = "91";

// Right-aligned status word in front of the text, cargo style
void print_status(std::FILE* stream, const char* word, const char* color, const std::string& text)
{
  std::string body;
  for (const char c : text)
  {
    body.push_back(c);
    if (c == '\n')
    {
      body.append(13, ' ');
    }
  }

  if (isatty(fileno(stream)))
  {
    std::fprintf(stream, "\033[1;%sm%12s\033[0m %s\n", color, word, body.c_str());
  }
  else
  {
    std::fprintf(stream, "%12s %s\n", word, body.c_str());
  }
}

fwsize::ErrorCode run(fwsize::BuildMode mode, bool build, std::string& output)
{
  std::error_code ec;
  const std::filesystem::path cwd = std::filesystem::current_path(ec);
  if (ec)
  {
    return fwsize::ErrorCode::IO_ERROR;
  }

  std::filesystem::path root;
  fwsize::ErrorCode err = fwsize::find_project_root(cwd, root);
  if (err != fwsize::ErrorCode::OK)
  {
    return err;
  }

  std::string name;
  err = fwsize::read_artifact_name(root / fwsize::MANIFEST_FILE, name);
  if (err != fwsize::ErrorCode::OK)
  {
    return err;
  }

  if (build)
  {
    err = fwsize::run_build(root, mode);
    if (err != fwsize::ErrorCode::OK)
    {
      return err;
    }
  }

  fwsize::UsageReport report;
  err = fwsize::measure(root, name, mode, report);
  if (err != fwsize::ErrorCode::OK)
  {
    return err;
  }

  output = fwsize::format_report(report);
  return fwsize::ErrorCode::OK;
}

}  // namespace

int main(int argc, char** argv)
{
  // Invoked as `cargo size`: cargo passes the subcommand name first
  if (argc > 1 && std::strcmp(argv[1], "size") == 0)
  {
    argv[1] = argv[0];
    ++argv;
    --argc;
  }

  CLI::App app{"A command extending cargo to print the memory usage of a program", "cargo-size"};

  bool release = false;
  bool no_build = false;
  app.add_flag("--release", release,
               "Print the size of the release binary (debug if flag is not present)");
  app.add_flag("--no-build", no_build, "Measure the existing binary without building it");
  app.set_version_flag("-v,--version", std::string("cargo-size ") + FWSIZE_VERSION);

  CLI11_PARSE(app, argc, argv);

  const fwsize::BuildMode mode = release ? fwsize::BuildMode::RELEASE : fwsize::BuildMode::DEBUG;

  std::string output;
  const fwsize::ErrorCode err = run(mode, !no_build, output);
  if (err != fwsize::ErrorCode::OK)
  {
    print_status(stderr, "Error", RED, fwsize::error_message(err));
    return 1;
  }

  print_status(stdout, "Printing", GREEN, output);
  return 0;
}
