/**
 * @file aarch64_port.cpp
 * @brief Default CPU port for an AArch64 kernel running at EL1
 *
 * Implements hwctx/cpu_port.h with direct system-register access. Kernels
 * with their own port (ASID-tagged TLB maintenance, EL2 hosts, ...) leave
 * HWCTX_BUILD_PORT off and provide these symbols themselves.
 */

#include "hwctx/cpu_port.h"

#if defined(__aarch64__)

extern "C" hwctx_vaddr_t hwctx_cpu_read_thread_pointer(void)
{
  hwctx_vaddr_t tp;
  asm volatile("mrs %0, tpidr_el0" : "=r"(tp));
  return tp;
}

extern "C" void hwctx_cpu_write_thread_pointer(hwctx_vaddr_t tp)
{
  asm volatile("msr tpidr_el0, %0" : : "r"(tp));
}

extern "C" void hwctx_cpu_write_user_page_table(hwctx_paddr_t root)
{
  asm volatile(
      "msr ttbr0_el1, %0\n"
      "isb"
      :
      : "r"(root)
      : "memory");
}

extern "C" void hwctx_cpu_flush_tlb_all(void)
{
  asm volatile(
      "dsb ishst\n"
      "tlbi vmalle1\n"
      "dsb ish\n"
      "isb"
      :
      :
      : "memory");
}

#endif  // __aarch64__
