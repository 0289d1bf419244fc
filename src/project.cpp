/**
 * @file project.cpp
 * @brief Project root discovery, manifest inspection and build invocation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string_view>
#include <system_error>
#include <vector>

#include "fwsize/config.hpp"
#include "fwsize/fwsize.hpp"

extern char** environ;

namespace fwsize
{

namespace
{

namespace fs = std::filesystem;

std::string_view trim(std::string_view text)
{
  const size_t begin = text.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos)
  {
    return {};
  }
  const size_t end = text.find_last_not_of(" \t\r");
  return text.substr(begin, end - begin + 1);
}

// Drop a trailing '#' comment, ignoring '#' inside quoted strings
std::string_view strip_comment(std::string_view line)
{
  char quote = '\0';
  for (size_t i = 0; i < line.size(); ++i)
  {
    const char c = line[i];
    if (quote != '\0')
    {
      if (c == '\\' && quote == '"')
      {
        ++i;
      }
      else if (c == quote)
      {
        quote = '\0';
      }
    }
    else if (c == '"' || c == '\'')
    {
      quote = c;
    }
    else if (c == '#')
    {
      return line.substr(0, i);
    }
  }
  return line;
}

// Basic ("...") or literal ('...') TOML string
bool parse_string(std::string_view value, std::string& out)
{
  if (value.size() < 2)
  {
    return false;
  }

  const char quote = value.front();
  if (quote != '"' && quote != '\'')
  {
    return false;
  }

  out.clear();
  for (size_t i = 1; i < value.size(); ++i)
  {
    const char c = value[i];
    if (c == quote)
    {
      return trim(value.substr(i + 1)).empty();
    }
    if (c == '\\' && quote == '"' && i + 1 < value.size())
    {
      ++i;
      out.push_back(value[i]);
      continue;
    }
    out.push_back(c);
  }
  return false;
}

bool contains_manifest(const fs::path& directory)
{
  std::error_code ec;
  return fs::is_regular_file(directory / MANIFEST_FILE, ec);
}

}  // namespace

ErrorCode find_project_root(const fs::path& start_dir, fs::path& out)
{
  std::error_code ec;
  fs::path dir = fs::absolute(start_dir, ec);
  if (ec)
  {
    return ErrorCode::NOT_A_PROJECT;
  }

  dir = dir.lexically_normal();
  if (!dir.has_filename() && dir.has_parent_path())
  {
    dir = dir.parent_path();
  }

  for (;;)
  {
    if (contains_manifest(dir))
    {
      out = dir;
      return ErrorCode::OK;
    }

    fs::path parent = dir.parent_path();
    if (parent.empty() || parent == dir)
    {
      break;
    }
    dir = parent;
  }

  return ErrorCode::NOT_A_PROJECT;
}

ErrorCode read_artifact_name(const fs::path& manifest_path, std::string& out)
{
  std::ifstream stream(manifest_path);
  if (!stream)
  {
    return ErrorCode::IO_ERROR;
  }

  bool in_package = false;
  std::string line;

  while (std::getline(stream, line))
  {
    const std::string_view view = trim(strip_comment(line));
    if (view.empty())
    {
      continue;
    }

    // Table header
    if (view.front() == '[')
    {
      in_package = view.size() >= 2 && view.back() == ']' &&
                   trim(view.substr(1, view.size() - 2)) == "package";
      continue;
    }

    if (!in_package)
    {
      continue;
    }

    const size_t eq = view.find('=');
    if (eq == std::string_view::npos || trim(view.substr(0, eq)) != "name")
    {
      continue;
    }

    std::string name;
    if (!parse_string(trim(view.substr(eq + 1)), name) || name.empty())
    {
      return ErrorCode::INVALID_MANIFEST;
    }

    out = name;
    return ErrorCode::OK;
  }

  if (stream.bad())
  {
    return ErrorCode::IO_ERROR;
  }
  return ErrorCode::INVALID_MANIFEST;
}

ErrorCode run_build(const fs::path& project_root, BuildMode mode)
{
  const char* env_tool = std::getenv(BUILD_TOOL_ENV);
  const std::string tool = (env_tool != nullptr && *env_tool != '\0') ? env_tool : DEFAULT_BUILD_TOOL;

  std::vector<std::string> args = {tool, "build"};
  switch (mode)
  {
    case BuildMode::DEBUG:
      break;
    case BuildMode::RELEASE:
      args.push_back("--release");
      break;
  }
  args.push_back("--manifest-path");
  args.push_back((project_root / MANIFEST_FILE).string());

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (std::string& arg : args)
  {
    argv.push_back(&arg[0]);
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  if (posix_spawnp(&pid, tool.c_str(), nullptr, nullptr, argv.data(), environ) != 0)
  {
    return ErrorCode::IO_ERROR;
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0)
  {
    if (errno != EINTR)
    {
      return ErrorCode::IO_ERROR;
    }
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
  {
    return ErrorCode::BUILD_FAILED;
  }
  return ErrorCode::OK;
}

}  // namespace fwsize
