/**
 * @file locator.cpp
 * @brief Build artifact lookup in native and cross-compiled layouts
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <string_view>
#include <system_error>

#include "fwsize/config.hpp"
#include "fwsize/fwsize.hpp"

namespace fwsize
{

namespace
{

namespace fs = std::filesystem;

// OK if a regular file exists, ARTIFACT_NOT_FOUND if nothing is there
ErrorCode probe_file(const fs::path& candidate)
{
  std::error_code ec;
  const fs::file_status status = fs::status(candidate, ec);

  if (ec && status.type() != fs::file_type::not_found)
  {
    return ErrorCode::IO_ERROR;
  }
  return fs::is_regular_file(status) ? ErrorCode::OK : ErrorCode::ARTIFACT_NOT_FOUND;
}

bool is_directory(const fs::path& candidate, ErrorCode& err)
{
  std::error_code ec;
  const fs::file_status status = fs::status(candidate, ec);

  if (ec && status.type() != fs::file_type::not_found)
  {
    err = ErrorCode::IO_ERROR;
    return false;
  }
  err = ErrorCode::OK;
  return fs::is_directory(status);
}

}  // namespace

ErrorCode locate_artifact(const fs::path& project_root, const std::string& artifact_name,
                          BuildMode mode, fs::path& out)
{
  if (artifact_name.empty())
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  const fs::path target_dir = project_root / TARGET_DIR;
  const char* mode_dir = mode_directory(mode);

  // Native layout: target/<mode>/<name>
  fs::path candidate = target_dir / mode_dir / artifact_name;
  ErrorCode err = probe_file(candidate);
  if (err != ErrorCode::ARTIFACT_NOT_FOUND)
  {
    if (err == ErrorCode::OK)
    {
      out = candidate;
    }
    return err;
  }

  // Cross layout: target/<triple>/<mode>/<name>, first known triple present
  for (const std::string_view triple : TARGET_TRIPLES)
  {
    const fs::path triple_dir = target_dir / triple;
    if (!is_directory(triple_dir, err))
    {
      if (err != ErrorCode::OK)
      {
        return err;
      }
      continue;
    }

    candidate = triple_dir / mode_dir / artifact_name;
    err = probe_file(candidate);
    if (err == ErrorCode::OK)
    {
      out = candidate;
    }
    return err;
  }

  return ErrorCode::ARTIFACT_NOT_FOUND;
}

}  // namespace fwsize
