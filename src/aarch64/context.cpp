#include "hwctx/aarch64/context.hpp"

#include <stddef.h>

#include "hwctx/cpu_port.h"

/* ========================================================================= */
/* Layout contract with switch.cpp                                           */
/* ========================================================================= */

namespace hwctx
{
namespace aarch64
{

static_assert(offsetof(TaskContext, sp) == HWCTX_A64_CTX_SP, "sp offset");
static_assert(offsetof(TaskContext, tpidr_el0) == HWCTX_A64_CTX_TPIDR_EL0, "tpidr_el0 offset");
static_assert(offsetof(TaskContext, r19) == HWCTX_A64_CTX_X19, "x19 offset");
static_assert(offsetof(TaskContext, r21) == HWCTX_A64_CTX_X21, "x21 offset");
static_assert(offsetof(TaskContext, r23) == HWCTX_A64_CTX_X23, "x23 offset");
static_assert(offsetof(TaskContext, r25) == HWCTX_A64_CTX_X25, "x25 offset");
static_assert(offsetof(TaskContext, r27) == HWCTX_A64_CTX_X27, "x27 offset");
static_assert(offsetof(TaskContext, r29) == HWCTX_A64_CTX_X29, "x29 offset");
static_assert(offsetof(TaskContext, lr) == HWCTX_A64_CTX_LR, "lr offset");
#if HWCTX_FEATURE_USPACE
static_assert(offsetof(TaskContext, ttbr0_el1) == HWCTX_A64_CTX_TTBR0_EL1, "ttbr0_el1 offset");
#endif

static_assert(offsetof(FpState, regs) == HWCTX_A64_FP_REGS, "V0 offset");
static_assert(offsetof(FpState, fpcr) == HWCTX_A64_FP_FPCR, "fpcr offset");
static_assert(offsetof(FpState, fpsr) == HWCTX_A64_FP_FPSR, "fpsr offset");
static_assert(alignof(FpState) == 16, "q-register pairs need 16-byte alignment");

/* ========================================================================= */
/* Task Context                                                              */
/* ========================================================================= */

#if HWCTX_FEATURE_FP_SIMD
void FpState::save()
{
  hwctx_a64_fp_save(this);
}

void FpState::restore() const
{
  hwctx_a64_fp_restore(this);
}
#endif

void TaskContext::init(uintptr_t entry, VirtAddr kstack_top, VirtAddr tls_area)
{
  sp = kstack_top.as_usize();
  lr = entry;
  // With user-space support the kernel itself never uses TPIDR_EL0
  tpidr_el0 = tls_area.as_usize();
}

#if HWCTX_FEATURE_USPACE
void TaskContext::set_page_table_root(PhysAddr root)
{
  ttbr0_el1 = root.as_usize();
}
#endif

void TaskContext::switch_to(const TaskContext &next)
{
#if HWCTX_FEATURE_TLS
  tpidr_el0 = hwctx_cpu_read_thread_pointer();
  hwctx_cpu_write_thread_pointer(next.tpidr_el0);
#endif
#if HWCTX_FEATURE_FP_SIMD
  fp_state.save();
  next.fp_state.restore();
#endif
#if HWCTX_FEATURE_USPACE
  if (ttbr0_el1 != next.ttbr0_el1)
  {
    hwctx_cpu_write_user_page_table(next.ttbr0_el1);
    hwctx_cpu_flush_tlb_all();  // currently flush the entire TLB
  }
#endif
  hwctx_a64_context_switch(this, &next);
}

}  // namespace aarch64
}  // namespace hwctx
