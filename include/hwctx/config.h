#pragma once

/**
 * @file config.h
 * @brief Build-time configuration of the hardware-context layer
 *
 * Feature switches are normally injected by the build system
 * (HWCTX_FP_SIMD / HWCTX_TLS / HWCTX_USPACE CMake options). Every switch
 * defaults to 0 so a bare include compiles the smallest layout.
 */

/* ------------------------------------------------------------------------- */
/* Optional features                                                         */
/* ------------------------------------------------------------------------- */

/**
 * Save/restore the FP/SIMD register file around a voluntary switch.
 *
 * With this off, nothing preserves the callee-saved FP registers (d8..d15
 * on AArch64, f24..f31 on LoongArch64 LP64D). Such builds need a kernel
 * compiled for general registers only (-mgeneral-regs-only, or
 * -msoft-float / -mabi=lp64s).
 */
#ifndef HWCTX_FEATURE_FP_SIMD
#define HWCTX_FEATURE_FP_SIMD 0
#endif

/** Track the thread pointer (TLS base) across a voluntary switch. */
#ifndef HWCTX_FEATURE_TLS
#define HWCTX_FEATURE_TLS 0
#endif

/** Per-task user page-table root, reloaded (with a TLB flush) on switch. */
#ifndef HWCTX_FEATURE_USPACE
#define HWCTX_FEATURE_USPACE 0
#endif

/* ------------------------------------------------------------------------- */
/* Target architecture                                                       */
/* ------------------------------------------------------------------------- */

#define HWCTX_ARCH_NONE 0
#define HWCTX_ARCH_AARCH64 1
#define HWCTX_ARCH_LOONGARCH64 2

#if defined(HWCTX_TARGET_AARCH64) || (!defined(HWCTX_TARGET_LOONGARCH64) && defined(__aarch64__))
#define HWCTX_ARCH HWCTX_ARCH_AARCH64
#define HWCTX_ARCH_NAME "aarch64"
#elif defined(HWCTX_TARGET_LOONGARCH64) || defined(__loongarch64)
#define HWCTX_ARCH HWCTX_ARCH_LOONGARCH64
#define HWCTX_ARCH_NAME "loongarch64"
#else
/* Host build (unit tests): both register layouts compile, neither is "the" target. */
#define HWCTX_ARCH HWCTX_ARCH_NONE
#define HWCTX_ARCH_NAME "none"
#endif

/* ------------------------------------------------------------------------- */
/* Helpers                                                                   */
/* ------------------------------------------------------------------------- */

#define HWCTX_STR_(x) #x
/** Stringify a macro value (used to feed offsets into assembler text). */
#define HWCTX_STR(x) HWCTX_STR_(x)
