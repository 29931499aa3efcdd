#pragma once
#include <stddef.h>
#include <stdint.h>

#include "hwctx/aarch64/offsets.h"
#include "hwctx/types.h"

namespace hwctx
{
namespace aarch64
{

/**
 * @brief Saved registers when a trap (exception) occurs
 *
 * Layout is fixed by the trap-entry assembly, which pushes x0..x30, then
 * SP_EL0, ELR_EL1 and SPSR_EL1 in this exact order. Do not reorder.
 */
struct TrapFrame
{
  uint64_t r[31]; /**< General-purpose registers (x0..x30) */
  uint64_t usp;   /**< User stack pointer (SP_EL0) */
  uint64_t elr;   /**< Exception link register (ELR_EL1) */
  uint64_t spsr;  /**< Saved process status register (SPSR_EL1) */

  /** Gets the 0th syscall argument. */
  uintptr_t arg0() const { return static_cast<uintptr_t>(r[0]); }

  /** Gets the 1st syscall argument. */
  uintptr_t arg1() const { return static_cast<uintptr_t>(r[1]); }

  /** Gets the 2nd syscall argument. */
  uintptr_t arg2() const { return static_cast<uintptr_t>(r[2]); }

  /** Gets the 3rd syscall argument. */
  uintptr_t arg3() const { return static_cast<uintptr_t>(r[3]); }

  /** Gets the 4th syscall argument. */
  uintptr_t arg4() const { return static_cast<uintptr_t>(r[4]); }

  /** Gets the 5th syscall argument. */
  uintptr_t arg5() const { return static_cast<uintptr_t>(r[5]); }
};

static_assert(sizeof(TrapFrame) == HWCTX_A64_TRAP_FRAME_SIZE, "TrapFrame size is ABI");
static_assert(offsetof(TrapFrame, usp) == 31 * 8, "TrapFrame.usp offset is ABI");
static_assert(offsetof(TrapFrame, spsr) == 33 * 8, "TrapFrame.spsr offset is ABI");

/**
 * @brief Render every register of a trap frame as text
 *
 * One "name: 0x..." line per register (r0..r30, usp, elr, spsr). The
 * buffer is always NUL-terminated when cap > 0.
 *
 * @param tf   Trap frame
 * @param buf  Output buffer
 * @param cap  Buffer capacity in bytes
 * @return Characters written, InvalidArg on NULL input, BufferTooSmall if
 *         the text was truncated
 */
hwctx_err format_trap_frame(const TrapFrame *tf, char *buf, size_t cap);

/**
 * @brief Write a trap frame dump to the diagnostic log
 *
 * @param tf Trap frame (NULL is ignored)
 */
void dump_trap_frame(const TrapFrame *tf);

}  // namespace aarch64
}  // namespace hwctx
