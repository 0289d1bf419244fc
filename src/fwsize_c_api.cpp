/**
 * @file fwsize_c_api.cpp
 * @brief fwsize C API implementation
 *
 * C wrapper for the C++ size pipeline.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <string>

#include "fwsize/fwsize.h"
#include "fwsize/fwsize.hpp"

using namespace fwsize;

/* ========================================================================= */
/* Conversions                                                               */
/* ========================================================================= */

static fwsize_error_t to_c_error(ErrorCode code)
{
  return static_cast<fwsize_error_t>(code);
}

static bool to_mode(fwsize_mode_t mode, BuildMode& out)
{
  switch (mode)
  {
    case FWSIZE_MODE_DEBUG:
      out = BuildMode::DEBUG;
      return true;
    case FWSIZE_MODE_RELEASE:
      out = BuildMode::RELEASE;
      return true;
  }
  return false;
}

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* fwsize_strerror(fwsize_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case FWSIZE_ERR_##name:   \
    return msg;
#include "fwsize/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

fwsize_error_t fwsize_read_sizes(const char* path, uint64_t* code_bytes, uint64_t* data_bytes)
{
  if (path == nullptr || code_bytes == nullptr || data_bytes == nullptr)
  {
    return FWSIZE_ERR_INVALID_ARGUMENT;
  }

  SectionSizes sizes;
  const ErrorCode err = read_section_sizes(path, sizes);
  if (err == ErrorCode::OK)
  {
    *code_bytes = sizes.code;
    *data_bytes = sizes.data;
  }
  return to_c_error(err);
}

int fwsize_parse_layout(const char* path, uint64_t* flash, uint64_t* ram)
{
  if (path == nullptr || flash == nullptr || ram == nullptr)
  {
    return 0;
  }

  const std::optional<MemoryLayout> layout = parse_memory_layout(path);
  if (!layout)
  {
    return 0;
  }

  *flash = layout->flash;
  *ram = layout->ram;
  return 1;
}

fwsize_error_t fwsize_measure(const char* project_root, const char* artifact_name,
                              fwsize_mode_t mode, fwsize_report_t* report)
{
  BuildMode build_mode;
  if (project_root == nullptr || artifact_name == nullptr || report == nullptr ||
      !to_mode(mode, build_mode))
  {
    return FWSIZE_ERR_INVALID_ARGUMENT;
  }

  UsageReport result;
  const ErrorCode err = measure(project_root, artifact_name, build_mode, result);
  if (err != ErrorCode::OK)
  {
    return to_c_error(err);
  }

  report->code_bytes = result.sizes.code;
  report->data_bytes = result.sizes.data;
  report->has_percentage = result.percentage ? 1 : 0;
  report->code_percentage = result.percentage ? result.percentage->code : 0.0;
  report->data_percentage = result.percentage ? result.percentage->data : 0.0;

  return FWSIZE_ERR_OK;
}
