/**
 * @file fwsize.cpp
 * @brief fwsize pipeline and report implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwsize/fwsize.hpp"

#include <cinttypes>
#include <cstdio>

namespace fwsize
{

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "fwsize/errors.def"
#undef ERR
  }
  return "unknown error";
}

const char* mode_directory(BuildMode mode)
{
  switch (mode)
  {
    case BuildMode::DEBUG:
      return "debug";
    case BuildMode::RELEASE:
      return "release";
  }
  return "debug";
}

UsageReport build_report(const SectionSizes& sizes, const std::optional<MemoryLayout>& layout)
{
  UsageReport report;
  report.sizes = sizes;

  if (layout)
  {
    UsagePercentage percentage;
    percentage.code = static_cast<double>(sizes.code) / static_cast<double>(layout->flash) * 100.0;
    percentage.data = static_cast<double>(sizes.data) / static_cast<double>(layout->ram) * 100.0;
    report.percentage = percentage;
  }

  return report;
}

ErrorCode measure(const std::filesystem::path& project_root, const std::string& artifact_name,
                  BuildMode mode, UsageReport& out, const std::filesystem::path& layout_path)
{
  std::filesystem::path binary;
  ErrorCode err = locate_artifact(project_root, artifact_name, mode, binary);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  SectionSizes sizes;
  err = read_section_sizes(binary, sizes);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const std::filesystem::path layout_file =
      layout_path.empty() ? project_root / MEMORY_LAYOUT_FILE : layout_path;

  out = build_report(sizes, parse_memory_layout(layout_file));
  return ErrorCode::OK;
}

std::string format_report(const UsageReport& report)
{
  char line[128];
  std::string text = "Memory Usage\n------------\n";

  if (report.percentage)
  {
    std::snprintf(line, sizeof(line), "Program: %7" PRIu64 " bytes (%.1f%% full)\n",
                  report.sizes.code, report.percentage->code);
    text += line;
    std::snprintf(line, sizeof(line), "Data:    %7" PRIu64 " bytes (%.1f%% full)",
                  report.sizes.data, report.percentage->data);
    text += line;
  }
  else
  {
    std::snprintf(line, sizeof(line), "Program: %7" PRIu64 " bytes\n", report.sizes.code);
    text += line;
    std::snprintf(line, sizeof(line), "Data:    %7" PRIu64 " bytes", report.sizes.data);
    text += line;
  }

  return text;
}

}  // namespace fwsize
