#pragma once
#include <stdint.h>

#include "hwctx/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* CPU Port Interface                                                        */
  /* ========================================================================= */
  /**
   * These functions must be implemented by the kernel's architecture port.
   * They touch privileged registers the switch path needs but does not own.
   * A default implementation for each supported architecture lives in
   * src/port/ (enable with the HWCTX_BUILD_PORT option); unit tests link a
   * recording mock instead.
   *
   * Only the primitives required by the enabled features are referenced:
   * a build without TLS or user-space support needs none of them.
   */

  /**
   * @brief Read the live thread-pointer register
   *
   * Example (AArch64):
   *   mrs x0, tpidr_el0
   *
   * Example (LoongArch64):
   *   move a0, $tp
   *
   * @return Current thread pointer value
   */
  hwctx_vaddr_t hwctx_cpu_read_thread_pointer(void);

  /**
   * @brief Write the live thread-pointer register
   *
   * @param tp New thread pointer value
   */
  void hwctx_cpu_write_thread_pointer(hwctx_vaddr_t tp);

  /**
   * @brief Install a user page-table root
   *
   * Example (AArch64):
   *   msr ttbr0_el1, x0; isb
   *
   * Example (LoongArch64):
   *   csrwr a0, PGDL
   *
   * Must not flush the TLB itself; the caller decides when to flush.
   *
   * @param root Physical address of the page-table root
   */
  void hwctx_cpu_write_user_page_table(hwctx_paddr_t root);

  /**
   * @brief Invalidate every local TLB entry
   *
   * Example (AArch64):
   *   dsb ishst; tlbi vmalle1; dsb ish; isb
   *
   * Example (LoongArch64):
   *   dbar 0; invtlb 0x0, $zero, $zero
   */
  void hwctx_cpu_flush_tlb_all(void);

  /**
   * @brief Set the kernel stack used on the next trap from user mode
   *
   * LoongArch64 has no banked kernel stack pointer: trap entry loads it
   * from a KSave scratch CSR. AArch64 banks SP_EL1, so AArch64 ports do not
   * define this function.
   *
   * @param sp Kernel stack pointer of the task about to run
   */
  void hwctx_cpu_write_kernel_sp(hwctx_vaddr_t sp);

#ifdef __cplusplus
} /* extern "C" */
#endif
