#pragma once
#include <stdint.h>

#include "hwctx/addr.hpp"
#include "hwctx/config.h"
#include "hwctx/loongarch64/offsets.h"

namespace hwctx
{
namespace loongarch64
{

/**
 * @brief Floating-point registers of LoongArch64
 */
struct FpuState
{
  uint64_t fp[32] = {};  /**< Floating-point registers (f0..f31) */
  uint8_t fcc[8] = {};   /**< Condition flags ($fcc0..$fcc7), one per byte */
  uint32_t fcsr = 0;     /**< Floating-point Control and Status register */

#if HWCTX_FEATURE_FP_SIMD
  /** Save the current FPU state from the CPU into this structure. */
  void save();

  /** Restore the FPU state from this structure to the CPU. */
  void restore() const;
#endif
};

/**
 * @brief Saved hardware state of a task
 *
 * - return address and stack pointer
 * - the ten static registers $s0..$s8 and $fp (r23..r31, r22)
 * - the thread pointer $tp, tracked when TLS support is enabled
 * - the user page-table root (PGDL), with user-space support
 * - the FPU state, with FP/SIMD support
 */
struct TaskContext
{
  uintptr_t ra = 0;      /**< Return Address */
  uintptr_t sp = 0;      /**< Stack Pointer */
  uintptr_t s[10] = {};  /**< $s0..$s8, then $fp */
  uintptr_t tp = 0;      /**< Thread Pointer */
#if HWCTX_FEATURE_USPACE
  uintptr_t pgdl = 0;    /**< User page-table root */
#endif
#if HWCTX_FEATURE_FP_SIMD
  FpuState fpu;
#endif

  /**
   * @brief Initialize the context of a task that has never run
   *
   * @param entry       Entry point
   * @param kstack_top  Top of the task's kernel stack
   * @param tls_area    Thread-local storage base for $tp
   */
  void init(uintptr_t entry, VirtAddr kstack_top, VirtAddr tls_area);

#if HWCTX_FEATURE_USPACE
  /**
   * @brief Change the page-table root of this context
   *
   * PGDL is updated to the next task's root by switch_to().
   */
  void set_page_table_root(PhysAddr pgdl);
#endif

  /**
   * @brief Switch to another task
   *
   * Saves the running task's state into this context, then restores
   * @p next onto the CPU.
   *
   * @param next Context to activate
   */
  void switch_to(const TaskContext &next);
};

}  // namespace loongarch64
}  // namespace hwctx

extern "C"
{
  /**
   * @brief Raw register transfer (hand-written assembly)
   *
   * Stores ra, sp, $s0..$s8 and $fp into @p current, loads them from
   * @p next, and jumps to the loaded ra.
   */
  void hwctx_la64_context_switch(hwctx::loongarch64::TaskContext *current,
                                 const hwctx::loongarch64::TaskContext *next);

  /** Store f0..f31, $fcc0..$fcc7 and $fcsr0 into @p fpu. */
  void hwctx_la64_fpu_save(hwctx::loongarch64::FpuState *fpu);

  /** Load f0..f31, $fcc0..$fcc7 and $fcsr0 from @p fpu. */
  void hwctx_la64_fpu_restore(const hwctx::loongarch64::FpuState *fpu);
}
