#pragma once
#include <stdint.h>

#include "hwctx/aarch64/offsets.h"
#include "hwctx/addr.hpp"
#include "hwctx/config.h"

namespace hwctx
{
namespace aarch64
{

/**
 * @brief FP & SIMD registers
 *
 * 16-byte aligned so V registers move with paired q-register load/store.
 */
struct FpState
{
  alignas(16) uint64_t regs[32][2] = {}; /**< 128-bit V0..V31, low half first */
  uint32_t fpcr = 0;                     /**< Floating-point Control Register */
  uint32_t fpsr = 0;                     /**< Floating-point Status Register */

#if HWCTX_FEATURE_FP_SIMD
  /** Saves the current FP/SIMD state from the CPU into this structure. */
  void save();

  /** Restores the FP/SIMD state from this structure to the CPU. */
  void restore() const;
#endif
};

/**
 * @brief Saved hardware state of a task
 *
 * Holds what must survive a voluntary switch:
 *
 * - callee-saved registers x19..x29 and the link register x30
 * - the stack pointer
 * - the thread pointer (TPIDR_EL0), tracked when TLS support is enabled
 * - the user page-table root (TTBR0_EL1), with user-space support
 * - the FP/SIMD register file, with FP/SIMD support
 *
 * Caller-saved registers are never stored: the call into switch_to()
 * already makes the compiler preserve them.
 *
 * A default-constructed context is all zero and not runnable. It becomes
 * runnable through init() (new task) or by being the save target of the
 * first switch_to() made by the running bootstrap task.
 */
struct TaskContext
{
  uint64_t sp = 0;
  uint64_t tpidr_el0 = 0;
  uint64_t r19 = 0;
  uint64_t r20 = 0;
  uint64_t r21 = 0;
  uint64_t r22 = 0;
  uint64_t r23 = 0;
  uint64_t r24 = 0;
  uint64_t r25 = 0;
  uint64_t r26 = 0;
  uint64_t r27 = 0;
  uint64_t r28 = 0;
  uint64_t r29 = 0;
  uint64_t lr = 0;  // r30
#if HWCTX_FEATURE_USPACE
  uint64_t ttbr0_el1 = 0; /**< User page-table root */
#endif
#if HWCTX_FEATURE_FP_SIMD
  FpState fp_state;
#endif

  /**
   * @brief Initialize the context of a task that has never run
   *
   * The first switch into this context "returns" to @p entry with the
   * stack pointer at @p kstack_top. No other register is meaningful yet.
   *
   * @param entry       Entry point
   * @param kstack_top  Top of the task's kernel stack (16-byte aligned)
   * @param tls_area    Thread-local storage base for TPIDR_EL0
   */
  void init(uintptr_t entry, VirtAddr kstack_top, VirtAddr tls_area);

#if HWCTX_FEATURE_USPACE
  /**
   * @brief Change the page-table root of this context
   *
   * TTBR0_EL1 is updated to the next task's root by switch_to().
   */
  void set_page_table_root(PhysAddr ttbr0_el1);
#endif

  /**
   * @brief Switch to another task
   *
   * Saves the running task's state into this context, then restores
   * @p next onto the CPU. Returns only when some task switches back here.
   *
   * @param next Context to activate
   */
  void switch_to(const TaskContext &next);
};

}  // namespace aarch64
}  // namespace hwctx

extern "C"
{
  /**
   * @brief Raw register transfer (hand-written assembly)
   *
   * Stores x19..x30 and sp into @p current, loads the same set from
   * @p next, and returns through the loaded x30.
   */
  void hwctx_a64_context_switch(hwctx::aarch64::TaskContext *current,
                                const hwctx::aarch64::TaskContext *next);

  /** Store V0..V31, FPCR and FPSR into @p state. */
  void hwctx_a64_fp_save(hwctx::aarch64::FpState *state);

  /** Load V0..V31, FPCR and FPSR from @p state. */
  void hwctx_a64_fp_restore(const hwctx::aarch64::FpState *state);
}
