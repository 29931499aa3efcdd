#pragma once
#include <cstdint>

#include "hwctx/types.h"

/* ========================================================================= */
/* Mock CPU (for host testing)                                               */
/* ========================================================================= */
/**
 * Stands in for the privileged registers and the hand-written routines
 * when tests run on a host that is neither target. The raw transfer mocks
 * move a simulated register file in and out of the context structures,
 * so "the CPU" after a switch is the simulated state below.
 */

struct MockCpuPort
{
  hwctx_vaddr_t thread_pointer;
  hwctx_paddr_t page_table_root;
  hwctx_vaddr_t kernel_sp;

  int tp_reads;
  int tp_writes;
  int page_table_writes;
  int tlb_flushes;
  int kernel_sp_writes;
};

/** Simulated AArch64 register file. */
struct MockA64Cpu
{
  uint64_t sp;
  uint64_t x[12];  // x19..x30
  uint64_t v[32][2];
  uint32_t fpcr;
  uint32_t fpsr;

  int switches;
  int fp_saves;
  int fp_restores;
};

/** Simulated LoongArch64 register file. */
struct MockLa64Cpu
{
  uint64_t ra;
  uint64_t sp;
  uint64_t s[10];  // s0..s8, fp
  uint64_t f[32];
  uint8_t fcc[8];
  uint32_t fcsr;

  int switches;
  int fpu_saves;
  int fpu_restores;
};

extern "C"
{
  MockCpuPort *mock_cpu_port(void);
  MockA64Cpu *mock_a64_cpu(void);
  MockLa64Cpu *mock_la64_cpu(void);

  /** Zero every simulated register and counter. */
  void mock_cpu_reset(void);

  /** Fill every simulated register with values derived from @p seed. */
  void mock_a64_cpu_fill(uint64_t seed);
  void mock_la64_cpu_fill(uint64_t seed);
}
