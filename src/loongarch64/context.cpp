#include "hwctx/loongarch64/context.hpp"

#include <stddef.h>

#include "hwctx/cpu_port.h"

namespace hwctx
{
namespace loongarch64
{

static_assert(offsetof(TaskContext, ra) == HWCTX_LA64_CTX_RA, "ra offset");
static_assert(offsetof(TaskContext, sp) == HWCTX_LA64_CTX_SP, "sp offset");
static_assert(offsetof(TaskContext, s) == HWCTX_LA64_CTX_S0, "s0 offset");
static_assert(offsetof(TaskContext, tp) == HWCTX_LA64_CTX_TP, "tp offset");
#if HWCTX_FEATURE_USPACE
static_assert(offsetof(TaskContext, pgdl) == HWCTX_LA64_CTX_PGDL, "pgdl offset");
#endif

static_assert(offsetof(FpuState, fp) == HWCTX_LA64_FPU_FP, "f0 offset");
static_assert(offsetof(FpuState, fcc) == HWCTX_LA64_FPU_FCC, "fcc offset");
static_assert(offsetof(FpuState, fcsr) == HWCTX_LA64_FPU_FCSR, "fcsr offset");

#if HWCTX_FEATURE_FP_SIMD
void FpuState::save()
{
  hwctx_la64_fpu_save(this);
}

void FpuState::restore() const
{
  hwctx_la64_fpu_restore(this);
}
#endif

void TaskContext::init(uintptr_t entry, VirtAddr kstack_top, VirtAddr tls_area)
{
  sp = kstack_top.as_usize();
  ra = entry;
  tp = tls_area.as_usize();
}

#if HWCTX_FEATURE_USPACE
void TaskContext::set_page_table_root(PhysAddr root)
{
  pgdl = root.as_usize();
}
#endif

void TaskContext::switch_to(const TaskContext &next)
{
#if HWCTX_FEATURE_TLS
  tp = hwctx_cpu_read_thread_pointer();
  hwctx_cpu_write_thread_pointer(next.tp);
#endif
#if HWCTX_FEATURE_FP_SIMD
  fpu.save();
  next.fpu.restore();
#endif
#if HWCTX_FEATURE_USPACE
  // Trap entry from user mode of `next` must land on next's kernel stack
  hwctx_cpu_write_kernel_sp(next.sp);
  if (pgdl != next.pgdl)
  {
    hwctx_cpu_write_user_page_table(next.pgdl);
    hwctx_cpu_flush_tlb_all();  // currently flush the entire TLB
  }
#endif
  hwctx_la64_context_switch(this, &next);
}

}  // namespace loongarch64
}  // namespace hwctx
