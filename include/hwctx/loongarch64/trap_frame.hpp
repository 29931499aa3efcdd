#pragma once
#include <stddef.h>
#include <stdint.h>

#include "hwctx/loongarch64/offsets.h"
#include "hwctx/types.h"

namespace hwctx
{
namespace loongarch64
{

/**
 * @brief General registers of LoongArch64, in hardware numbering order
 *
 * r0 ($zero) .. r31 ($s8). r21 is reserved by the ABI and shows up as u0.
 */
struct GeneralRegisters
{
  uintptr_t zero;
  uintptr_t ra;
  uintptr_t tp;
  uintptr_t sp;
  uintptr_t a0;
  uintptr_t a1;
  uintptr_t a2;
  uintptr_t a3;
  uintptr_t a4;
  uintptr_t a5;
  uintptr_t a6;
  uintptr_t a7;
  uintptr_t t0;
  uintptr_t t1;
  uintptr_t t2;
  uintptr_t t3;
  uintptr_t t4;
  uintptr_t t5;
  uintptr_t t6;
  uintptr_t t7;
  uintptr_t t8;
  uintptr_t u0;
  uintptr_t fp;
  uintptr_t s0;
  uintptr_t s1;
  uintptr_t s2;
  uintptr_t s3;
  uintptr_t s4;
  uintptr_t s5;
  uintptr_t s6;
  uintptr_t s7;
  uintptr_t s8;
};

/**
 * @brief Saved registers when a trap (interrupt or exception) occurs
 */
struct TrapFrame
{
  GeneralRegisters regs; /**< All general registers */
  uintptr_t prmd;        /**< Pre-exception Mode Information */
  uintptr_t era;         /**< Exception Return Address */

  /** Gets the 0th syscall argument. */
  uintptr_t arg0() const { return regs.a0; }

  /** Gets the 1st syscall argument. */
  uintptr_t arg1() const { return regs.a1; }

  /** Gets the 2nd syscall argument. */
  uintptr_t arg2() const { return regs.a2; }

  /** Gets the 3rd syscall argument. */
  uintptr_t arg3() const { return regs.a3; }

  /** Gets the 4th syscall argument. */
  uintptr_t arg4() const { return regs.a4; }

  /** Gets the 5th syscall argument. */
  uintptr_t arg5() const { return regs.a5; }
};

static_assert(sizeof(uintptr_t) == 8, "LoongArch64 layouts assume 64-bit registers");
static_assert(sizeof(GeneralRegisters) == 32 * 8, "one slot per general register");
static_assert(offsetof(GeneralRegisters, a0) == 4 * 8, "a0 is r4");
static_assert(offsetof(GeneralRegisters, fp) == 22 * 8, "fp is r22");
static_assert(sizeof(TrapFrame) == HWCTX_LA64_TRAP_FRAME_SIZE, "TrapFrame size is ABI");

/**
 * @brief Render every register of a trap frame as text
 *
 * @param tf   Trap frame
 * @param buf  Output buffer
 * @param cap  Buffer capacity in bytes
 * @return Characters written, InvalidArg on NULL input, BufferTooSmall if
 *         the text was truncated
 */
hwctx_err format_trap_frame(const TrapFrame *tf, char *buf, size_t cap);

/** Write a trap frame dump to the diagnostic log. */
void dump_trap_frame(const TrapFrame *tf);

}  // namespace loongarch64
}  // namespace hwctx
