/**
 * @file log.hpp
 * @brief hwctx diagnostic output C++ wrapper
 */

#pragma once

#include "hwctx/log.h"

namespace hwctx
{

/**
 * @brief C++ wrapper for HwctxLogHandler
 */
using LogHandler = HwctxLogHandler;

/**
 * @brief Set diagnostic handler (C++ wrapper)
 *
 * @param handler    Log callback
 * @param user_data  User data passed to handler
 */
inline void set_log_handler(LogHandler handler, void *user_data = nullptr)
{
  hwctx_set_log_handler(handler, user_data);
}

}  // namespace hwctx
