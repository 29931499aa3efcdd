#include "hwctx/log.h"

#include <stdio.h>

#include "hwctx/errors.hpp"
#include "hwctx/log.hpp"

namespace
{

hwctx::LogHandler g_log_handler = nullptr;
void *g_log_user_data = nullptr;

}  // namespace

extern "C"
{
  void hwctx_set_log_handler(HwctxLogHandler handler, void *user_data)
  {
    g_log_handler = handler;
    g_log_user_data = handler ? user_data : nullptr;
  }

  void hwctx_log(const char *text)
  {
    if (!text)
      return;

    if (g_log_handler)
    {
      g_log_handler(g_log_user_data, text);
      return;
    }

    fputs(text, stdout);
    fputc('\n', stdout);
  }

  const char *hwctx_err_str(hwctx_err err)
  {
    return hwctx::err_str(static_cast<hwctx::Err>(err));
  }

}  // extern "C"
