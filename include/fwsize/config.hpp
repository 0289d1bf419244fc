/**
 * @file config.hpp
 * @brief fwsize static configuration tables
 *
 * Section names, cross-compilation target triples and file names consulted
 * by the size pipeline. Entries may be appended to any table without
 * touching the code that walks them.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

/** @brief Version reported by the command-line front end */
#define FWSIZE_VERSION "0.2.0"

namespace fwsize
{

/* ========================================================================= */
/* Section categories                                                        */
/* ========================================================================= */

/**
 * @brief Sections holding program code
 *
 * Their sizes (if present) add up to the code size stored in flash.
 */
constexpr std::array<std::string_view, 3> CODE_SECTIONS = {
    ".vector_table",
    ".text",
    ".rodata",
};

/**
 * @brief Sections holding program data
 *
 * Their sizes (if present) add up to the data size stored in RAM.
 */
constexpr std::array<std::string_view, 2> DATA_SECTIONS = {
    ".bss",
    ".data",
};

/* ========================================================================= */
/* Build output layout                                                       */
/* ========================================================================= */

/**
 * @brief Known cross-compilation target triples
 *
 * Cross builds place their output in target/<triple>/<mode>/. The order of
 * this table is the tie-break when several triple directories exist.
 */
constexpr std::array<std::string_view, 10> TARGET_TRIPLES = {
    "thumbv6m-none-eabi",
    "thumbv7m-none-eabi",
    "thumbv7em-none-eabi",
    "thumbv7em-none-eabihf",
    "thumbv8m.base-none-eabi",
    "thumbv8m.main-none-eabi",
    "thumbv8m.main-none-eabihf",
    "riscv32i-unknown-none-elf",
    "riscv32imc-unknown-none-elf",
    "riscv32imac-unknown-none-elf",
};

/** @brief Build output directory below the project root */
constexpr std::string_view TARGET_DIR = "target";

/** @brief Project manifest file marking the project root */
constexpr std::string_view MANIFEST_FILE = "Cargo.toml";

/** @brief Memory-layout description next to the manifest */
constexpr std::string_view MEMORY_LAYOUT_FILE = "memory.x";

/** @brief Larger memory-layout files are treated as absent */
constexpr uint64_t MAX_LAYOUT_FILE_SIZE = 1024 * 1024;

/* ========================================================================= */
/* Memory regions                                                            */
/* ========================================================================= */

/**
 * @brief Logical region bounding the code size
 *
 * Matched case-insensitively against MEMORY region names.
 */
constexpr std::string_view FLASH_REGION = "flash";

/**
 * @brief Logical region bounding the data size
 *
 * Matched case-insensitively against MEMORY region names.
 */
constexpr std::string_view RAM_REGION = "ram";

/* ========================================================================= */
/* Build tool                                                                */
/* ========================================================================= */

/** @brief Build tool executable used when CARGO is not set */
constexpr const char* DEFAULT_BUILD_TOOL = "cargo";

/** @brief Environment variable naming the build tool executable */
constexpr const char* BUILD_TOOL_ENV = "CARGO";

}  // namespace fwsize
