#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Diagnostic output callback type
   *
   * Receives one complete, NUL-terminated message (may span several lines).
   *
   * @param user_data  User data pointer passed to hwctx_set_log_handler
   * @param text       Message text
   */
  typedef void (*HwctxLogHandler)(void *user_data, const char *text);

  /**
   * @brief Set custom diagnostic handler
   *
   * Registers a callback receiving trap-frame dumps and configuration
   * reports. Kernels route this to their console; with no handler the text
   * goes to stdout.
   *
   * @param handler    Log callback (NULL restores stdout output)
   * @param user_data  User data passed to handler
   */
  void hwctx_set_log_handler(HwctxLogHandler handler, void *user_data);

  /**
   * @brief Emit one diagnostic message
   *
   * @param text Message text (NULL is ignored)
   */
  void hwctx_log(const char *text);

#ifdef __cplusplus
}
#endif
