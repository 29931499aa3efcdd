/**
 * @file loongarch64_port.cpp
 * @brief Default CPU port for a LoongArch64 kernel running at PLV0
 */

#include "hwctx/cpu_port.h"
#include "hwctx/config.h"
#include "hwctx/loongarch64/offsets.h"

#if defined(__loongarch64)

extern "C" hwctx_vaddr_t hwctx_cpu_read_thread_pointer(void)
{
  hwctx_vaddr_t tp;
  asm volatile("move %0, $tp" : "=r"(tp));
  return tp;
}

extern "C" void hwctx_cpu_write_thread_pointer(hwctx_vaddr_t tp)
{
  asm volatile("move $tp, %0" : : "r"(tp));
}

extern "C" void hwctx_cpu_write_user_page_table(hwctx_paddr_t root)
{
  // csrwr swaps: the old PGDL comes back in the operand
  asm volatile("csrwr %0, " HWCTX_STR(HWCTX_LA64_CSR_PGDL) : "+r"(root) : : "memory");
}

extern "C" void hwctx_cpu_flush_tlb_all(void)
{
  asm volatile(
      "dbar 0\n"
      "invtlb 0x0, $zero, $zero"
      :
      :
      : "memory");
}

extern "C" void hwctx_cpu_write_kernel_sp(hwctx_vaddr_t sp)
{
  asm volatile("csrwr %0, " HWCTX_STR(HWCTX_LA64_CSR_KSAVE_KSP) : "+r"(sp));
}

#endif  // __loongarch64
