#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** Error code type. 0 = OK, negative = error. */
  typedef int hwctx_err;

  /** Kernel virtual address (stack tops, TLS areas, entry points). */
  typedef uintptr_t hwctx_vaddr_t;

  /** Physical address (page-table roots). */
  typedef uintptr_t hwctx_paddr_t;

#ifdef __cplusplus
} /* extern "C" */
#endif
