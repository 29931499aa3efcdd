#pragma once

/**
 * @file offsets.h
 * @brief AArch64 structure offsets shared with hand-written assembly
 *
 * The raw transfer and FP/SIMD routines address TaskContext / FpState
 * through these constants. context.cpp static_asserts every one of them
 * against offsetof(), so the C++ layout and the assembler cannot drift.
 */

/* TaskContext (byte offsets). x19..x30 are stored as consecutive pairs. */
#define HWCTX_A64_CTX_SP 0
#define HWCTX_A64_CTX_TPIDR_EL0 8
#define HWCTX_A64_CTX_X19 16
#define HWCTX_A64_CTX_X21 32
#define HWCTX_A64_CTX_X23 48
#define HWCTX_A64_CTX_X25 64
#define HWCTX_A64_CTX_X27 80
#define HWCTX_A64_CTX_X29 96
#define HWCTX_A64_CTX_LR 104
#define HWCTX_A64_CTX_TTBR0_EL1 112

/* FpState (byte offsets). V0..V31 are 16 bytes each. */
#define HWCTX_A64_FP_REGS 0
#define HWCTX_A64_FP_FPCR 512
#define HWCTX_A64_FP_FPSR 516

/* TrapFrame */
#define HWCTX_A64_TRAP_FRAME_SIZE 272
