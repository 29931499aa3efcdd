#pragma once

// Error code definition using the X-macro table in errors.def.
// Define ERR(name, val, msg) before including this file if you want to extract text or
// mapping.

#include "hwctx/types.h"

namespace hwctx
{

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "hwctx/errors.def"
};

#undef ERR

inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "hwctx/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace hwctx

// Macro to reduce code size for error returns
#define HWCTX_ERR(name) static_cast<hwctx_err>(::hwctx::Err::name)
