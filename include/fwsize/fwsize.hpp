/**
 * @file fwsize.hpp
 * @brief fwsize main API
 *
 * Static code/data footprint of a compiled firmware binary, optionally
 * expressed as a percentage of the device's flash and RAM capacity.
 *
 * Example usage:
 * @code
 * fwsize::UsageReport report;
 * const auto err = fwsize::measure("/path/to/project", "myapp",
 *                                  fwsize::BuildMode::RELEASE, report);
 * if (err != fwsize::ErrorCode::OK)
 * {
 *   std::fprintf(stderr, "%s\n", fwsize::error_message(err));
 *   return 1;
 * }
 * std::printf("%s\n", fwsize::format_report(report).c_str());
 * @endcode
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "fwsize/config.hpp"

namespace fwsize
{

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Result of every fallible fwsize operation
 *
 * Defined via errors.def for consistency with the C API.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "fwsize/errors.def"
#undef ERR
};

/**
 * @brief Get the descriptive message of an error code
 * @param code Error code
 * @return Static message string
 */
const char* error_message(ErrorCode code);

/* ========================================================================= */
/* Data model                                                                */
/* ========================================================================= */

/**
 * @brief Build mode selecting the output subdirectory
 */
enum class BuildMode : uint8_t
{
  DEBUG,
  RELEASE,
};

/**
 * @brief Name of the output subdirectory of a build mode
 * @return "debug" or "release"
 */
const char* mode_directory(BuildMode mode);

/**
 * @brief Summed section sizes of a binary
 */
struct SectionSizes
{
  uint64_t code = 0;  ///< Bytes in code-bearing sections
  uint64_t data = 0;  ///< Bytes in data-bearing sections
};

/**
 * @brief Device capacities declared by a memory-layout description
 *
 * Only ever produced with both capacities strictly positive.
 */
struct MemoryLayout
{
  uint64_t flash = 0;  ///< Code capacity in bytes
  uint64_t ram = 0;    ///< Data capacity in bytes
};

/**
 * @brief Usage relative to the device capacities
 */
struct UsagePercentage
{
  double code = 0.0;  ///< code / flash * 100
  double data = 0.0;  ///< data / ram * 100
};

/**
 * @brief Final result of the size pipeline
 */
struct UsageReport
{
  SectionSizes sizes;
  std::optional<UsagePercentage> percentage;  ///< Present with a memory layout
};

/* ========================================================================= */
/* Size pipeline                                                             */
/* ========================================================================= */

/**
 * @brief Find the binary produced by a build
 *
 * Checks target/<mode>/<artifact_name> first. Otherwise the first directory
 * of TARGET_TRIPLES present below target/ is searched as
 * target/<triple>/<mode>/<artifact_name>.
 *
 * @param project_root  Directory holding the target/ directory
 * @param artifact_name Name of the binary
 * @param mode          Build mode selecting debug/ or release/
 * @param out           Path of the binary on success
 * @return OK, ARTIFACT_NOT_FOUND, IO_ERROR or INVALID_ARGUMENT
 */
ErrorCode locate_artifact(const std::filesystem::path& project_root,
                          const std::string& artifact_name, BuildMode mode,
                          std::filesystem::path& out);

/**
 * @brief Sum the sizes of the code and data sections of an ELF binary
 *
 * Sections not listed in CODE_SECTIONS or DATA_SECTIONS are ignored, listed
 * sections missing from the binary contribute nothing.
 *
 * @param path Path of the binary
 * @param out  Section sizes on success
 * @return OK, INVALID_BINARY or IO_ERROR
 */
ErrorCode read_section_sizes(const std::filesystem::path& path, SectionSizes& out);

/**
 * @brief Read device capacities from a linker memory-layout file
 *
 * Sums the lengths of all MEMORY regions named "flash" and "ram" (ignoring
 * case). Never fails: an unreadable or unparsable file, or a missing or
 * zero-length region, yields no layout.
 *
 * @param path Path of the memory-layout file (usually memory.x)
 * @return Layout, or std::nullopt
 */
std::optional<MemoryLayout> parse_memory_layout(const std::filesystem::path& path);

/**
 * @brief Same as parse_memory_layout(), on the text of a layout file
 */
std::optional<MemoryLayout> parse_memory_layout_text(const std::string& script);

/**
 * @brief Combine section sizes and an optional layout into a report
 */
UsageReport build_report(const SectionSizes& sizes, const std::optional<MemoryLayout>& layout);

/**
 * @brief Run the whole size pipeline on a built project
 *
 * Fails fast on the first locator or reader error. The memory layout is read
 * from <project_root>/memory.x unless @p layout_path is given.
 *
 * @param project_root  Project root directory
 * @param artifact_name Name of the binary
 * @param mode          Build mode
 * @param out           Report on success
 * @param layout_path   Memory-layout file override (empty for default)
 * @return OK or the first error encountered
 */
ErrorCode measure(const std::filesystem::path& project_root, const std::string& artifact_name,
                  BuildMode mode, UsageReport& out,
                  const std::filesystem::path& layout_path = {});

/**
 * @brief Render a report as the "Memory Usage" block
 */
std::string format_report(const UsageReport& report);

/* ========================================================================= */
/* Project handling                                                          */
/* ========================================================================= */

/**
 * @brief Find the project root above a directory
 *
 * @p start_dir and each of its ancestors are checked, in that order, for a
 * MANIFEST_FILE.
 *
 * @param start_dir Directory to start from
 * @param out       Project root on success
 * @return OK or NOT_A_PROJECT
 */
ErrorCode find_project_root(const std::filesystem::path& start_dir, std::filesystem::path& out);

/**
 * @brief Read the package name declared by a manifest
 *
 * @param manifest_path Path of Cargo.toml
 * @param out           Package name on success
 * @return OK, INVALID_MANIFEST or IO_ERROR
 */
ErrorCode read_artifact_name(const std::filesystem::path& manifest_path, std::string& out);

/**
 * @brief Build the project with cargo
 *
 * Runs `$CARGO build [--release] --manifest-path <root>/Cargo.toml` and
 * waits for it. The child inherits stdin, stdout and stderr.
 *
 * @param project_root Project root directory
 * @param mode         Build mode
 * @return OK, BUILD_FAILED or IO_ERROR
 */
ErrorCode run_build(const std::filesystem::path& project_root, BuildMode mode);

}  // namespace fwsize
