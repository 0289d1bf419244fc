/**
 * @file fwsize.h
 * @brief fwsize C API
 *
 * C-compatible interface for the firmware size pipeline.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) FWSIZE_ERR_##name = val,
#include "fwsize/errors.def"
#undef ERR
  } fwsize_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* fwsize_strerror(fwsize_error_t err);

  /* ========================================================================= */
  /* Types                                                                     */
  /* ========================================================================= */

  typedef enum
  {
    FWSIZE_MODE_DEBUG = 0,   /**< target/debug */
    FWSIZE_MODE_RELEASE = 1, /**< target/release */
  } fwsize_mode_t;

  /** @brief Size report */
  typedef struct
  {
    uint64_t code_bytes;
    uint64_t data_bytes;
    int has_percentage;     /**< Non-zero if the percentages are valid */
    double code_percentage; /**< Share of flash used by code */
    double data_percentage; /**< Share of RAM used by data */
  } fwsize_report_t;

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Sum code and data section sizes of an ELF binary
   *
   * @param path       Path of the binary
   * @param code_bytes Output code size (must not be NULL)
   * @param data_bytes Output data size (must not be NULL)
   * @return FWSIZE_ERR_OK on success
   */
  fwsize_error_t fwsize_read_sizes(const char* path, uint64_t* code_bytes,
                                   uint64_t* data_bytes);

  /**
   * @brief Read flash and RAM capacity from a memory-layout file
   *
   * @param path  Path of the memory-layout file
   * @param flash Output flash capacity (must not be NULL)
   * @param ram   Output RAM capacity (must not be NULL)
   * @return 1 if both capacities were found, 0 otherwise
   */
  int fwsize_parse_layout(const char* path, uint64_t* flash, uint64_t* ram);

  /**
   * @brief Locate, read and report the binary of a built project
   *
   * @param project_root  Project root directory
   * @param artifact_name Name of the binary
   * @param mode          Build mode
   * @param report        Output report (must not be NULL)
   * @return FWSIZE_ERR_OK on success
   */
  fwsize_error_t fwsize_measure(const char* project_root, const char* artifact_name,
                                fwsize_mode_t mode, fwsize_report_t* report);

#ifdef __cplusplus
} /* extern "C" */
#endif
