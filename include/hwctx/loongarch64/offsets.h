#pragma once

/**
 * @file offsets.h
 * @brief LoongArch64 structure offsets shared with hand-written assembly
 *
 * context.cpp static_asserts these against offsetof().
 */

/* TaskContext (byte offsets). s[9] holds $fp (r22). */
#define HWCTX_LA64_CTX_RA 0
#define HWCTX_LA64_CTX_SP 8
#define HWCTX_LA64_CTX_S0 16
#define HWCTX_LA64_CTX_TP 96
#define HWCTX_LA64_CTX_PGDL 104

/* FpuState (byte offsets) */
#define HWCTX_LA64_FPU_FP 0
#define HWCTX_LA64_FPU_FCC 256
#define HWCTX_LA64_FPU_FCSR 264

/* TrapFrame */
#define HWCTX_LA64_TRAP_FRAME_SIZE 272

/* Control and status registers used by the bundled port */
#define HWCTX_LA64_CSR_PGDL 0x19
#define HWCTX_LA64_CSR_KSAVE_KSP 0x30
