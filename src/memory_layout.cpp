/**
 * @file memory_layout.cpp
 * @brief Device capacities from a memory-layout file
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cctype>
#include <fstream>
#include <string_view>
#include <system_error>
#include <vector>

#include "fwsize/config.hpp"
#include "fwsize/fwsize.hpp"
#include "fwsize/internal/ldscript.hpp"

namespace fwsize
{

namespace
{

bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
{
  if (lhs.size() != rhs.size())
  {
    return false;
  }

  for (size_t i = 0; i < lhs.size(); ++i)
  {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i])))
    {
      return false;
    }
  }
  return true;
}

bool read_file(const std::filesystem::path& path, std::string& out)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
  {
    return false;
  }

  const uint64_t size = std::filesystem::file_size(path, ec);
  if (ec || size > MAX_LAYOUT_FILE_SIZE)
  {
    return false;
  }

  std::ifstream stream(path, std::ios::in | std::ios::binary);
  if (!stream)
  {
    return false;
  }

  out.resize(static_cast<size_t>(size));
  stream.read(&out[0], static_cast<std::streamsize>(size));
  return static_cast<uint64_t>(stream.gcount()) == size;
}

}  // namespace

std::optional<MemoryLayout> parse_memory_layout_text(const std::string& script)
{
  std::vector<internal::MemoryRegion> regions;
  if (!internal::parse_memory_regions(script, regions))
  {
    return std::nullopt;
  }

  // Regions sharing a logical name add up
  MemoryLayout layout;
  for (const internal::MemoryRegion& region : regions)
  {
    if (equals_ignore_case(region.name, FLASH_REGION))
    {
      layout.flash += region.length;
    }
    if (equals_ignore_case(region.name, RAM_REGION))
    {
      layout.ram += region.length;
    }
  }

  if (layout.flash == 0 || layout.ram == 0)
  {
    return std::nullopt;
  }
  return layout;
}

std::optional<MemoryLayout> parse_memory_layout(const std::filesystem::path& path)
{
  std::string script;
  if (!read_file(path, script))
  {
    return std::nullopt;
  }
  return parse_memory_layout_text(script);
}

}  // namespace fwsize
