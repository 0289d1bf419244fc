/**
 * @file sections.cpp
 * @brief Code and data size of an ELF binary
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include <elfio/elfio.hpp>

#include "fwsize/config.hpp"
#include "fwsize/fwsize.hpp"

namespace fwsize
{

namespace
{

/// The byte range [offset, offset + size) lies within the file
bool within_file(uint64_t offset, uint64_t size, uint64_t file_size)
{
  return offset <= file_size && size <= file_size - offset;
}

/**
 * @brief Check the loaded image against the file it came from
 *
 * The section header table and the data of every section that occupies
 * file space must lie inside the file, and the name table must be a
 * string table.
 */
bool is_consistent(const ELFIO::elfio& reader, uint64_t file_size)
{
  const uint64_t table_size =
      static_cast<uint64_t>(reader.get_sections_num()) * reader.get_section_entry_size();
  if (table_size != 0 && !within_file(reader.get_sections_offset(), table_size, file_size))
  {
    return false;
  }

  const ELFIO::Elf_Half strndx = reader.get_section_name_str_index();
  if (strndx != ELFIO::SHN_UNDEF)
  {
    if (strndx >= reader.sections.size() ||
        reader.sections[strndx]->get_type() != ELFIO::SHT_STRTAB)
    {
      return false;
    }
  }

  for (ELFIO::Elf_Half i = 0; i < reader.sections.size(); ++i)
  {
    const ELFIO::section* section = reader.sections[i];
    const ELFIO::Elf_Word type = section->get_type();
    if (type == ELFIO::SHT_NULL || type == ELFIO::SHT_NOBITS)
    {
      continue;
    }
    if (!within_file(section->get_offset(), section->get_size(), file_size))
    {
      return false;
    }
  }
  return true;
}

/// Total size of the first section of each name, absent names count zero
template <typename Names>
uint64_t sum_sections(const ELFIO::elfio& reader, const Names& names)
{
  uint64_t total = 0;
  for (const std::string_view name : names)
  {
    const ELFIO::section* section = reader.sections[std::string(name)];
    if (section != nullptr)
    {
      total += section->get_size();
    }
  }
  return total;
}

}  // namespace

ErrorCode read_section_sizes(const std::filesystem::path& path, SectionSizes& out)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
  {
    return ErrorCode::IO_ERROR;
  }

  const uint64_t file_size = std::filesystem::file_size(path, ec);
  if (ec)
  {
    return ErrorCode::IO_ERROR;
  }

  // Tell an unreadable file apart from one that is not an ELF image
  if (!std::ifstream(path, std::ios::in | std::ios::binary))
  {
    return ErrorCode::IO_ERROR;
  }

  ELFIO::elfio reader;
  if (!reader.load(path.string()) || !is_consistent(reader, file_size))
  {
    return ErrorCode::INVALID_BINARY;
  }

  out.code = sum_sections(reader, CODE_SECTIONS);
  out.data = sum_sections(reader, DATA_SECTIONS);
  return ErrorCode::OK;
}

}  // namespace fwsize
