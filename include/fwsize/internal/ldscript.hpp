/**
 * @file ldscript.hpp
 * @brief Internal linker script MEMORY extraction for fwsize
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fwsize::internal
{

/**
 * @brief One region of a MEMORY command
 */
struct MemoryRegion
{
  std::string name;     ///< Region name as written
  uint64_t origin = 0;  ///< Evaluated ORIGIN expression
  uint64_t length = 0;  ///< Evaluated LENGTH expression
};

/**
 * @brief Decode a linker script number literal
 *
 * Accepts decimal, 0x-prefixed hexadecimal and 0-prefixed octal digits,
 * optionally followed by K (x1024) or M (x1024*1024).
 *
 * @param token Literal text
 * @param out   Decoded value
 * @return false on malformed or overflowing literals
 */
bool parse_number(std::string_view token, uint64_t& out);

/**
 * @brief Extract the regions of the first MEMORY command of a linker script
 *
 * The rest of the script is only checked for balanced brackets and
 * terminated comments and strings. A script without a MEMORY command
 * parses successfully with no regions.
 *
 * @param script Linker script text
 * @param out    Regions of the first MEMORY command, in order
 * @return false if the script could not be parsed
 *
 * @note Symbols assigned at top level before MEMORY, and ORIGIN()/LENGTH()
 *       of earlier regions, may be used in region expressions. Region
 *       attributes are skipped. Arithmetic that leaves the unsigned 64-bit
 *       range (a negative length, for one) fails the parse.
 */
bool parse_memory_regions(std::string_view script, std::vector<MemoryRegion>& out);

}  // namespace fwsize::internal
