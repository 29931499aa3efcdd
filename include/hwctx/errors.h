#pragma once

/**
 * @file errors.h
 * @brief hwctx error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#include "hwctx/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate error code constants from errors.def */
#define ERR(name, val, msg) static const int HWCTX_ERR_##name = val;
#include "hwctx/errors.def"
#undef ERR

  /**
   * @brief Get a human-readable message for an error code
   *
   * @param err Error code
   * @return Static message string ("unknown error" for unlisted codes)
   */
  const char *hwctx_err_str(hwctx_err err);

#ifdef __cplusplus
}
#endif
