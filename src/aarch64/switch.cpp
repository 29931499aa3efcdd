/**
 * @file switch.cpp
 * @brief AArch64 raw transfer and FP/SIMD save/restore routines
 *
 * Hand-written so the compiler never touches the register movement: the
 * stack pointer changes underneath the call, which no compiled function
 * body may do. Only assembled when targeting AArch64.
 */

#include "hwctx/aarch64/offsets.h"
#include "hwctx/config.h"

#if defined(__aarch64__)

// clang-format off
asm(
    ".equ CTX_SP, "    HWCTX_STR(HWCTX_A64_CTX_SP)  "\n"
    ".equ CTX_X19, "   HWCTX_STR(HWCTX_A64_CTX_X19) "\n"
    ".equ CTX_X21, "   HWCTX_STR(HWCTX_A64_CTX_X21) "\n"
    ".equ CTX_X23, "   HWCTX_STR(HWCTX_A64_CTX_X23) "\n"
    ".equ CTX_X25, "   HWCTX_STR(HWCTX_A64_CTX_X25) "\n"
    ".equ CTX_X27, "   HWCTX_STR(HWCTX_A64_CTX_X27) "\n"
    ".equ CTX_X29, "   HWCTX_STR(HWCTX_A64_CTX_X29) "\n"
    ".equ FP_FPCR, "   HWCTX_STR(HWCTX_A64_FP_FPCR) "\n"
    ".equ FP_FPSR, "   HWCTX_STR(HWCTX_A64_FP_FPSR) "\n"
R"(
.pushsection .text
.arch_extension fp
.arch_extension simd

// void hwctx_a64_context_switch(TaskContext *current, const TaskContext *next)
.balign 4
.globl hwctx_a64_context_switch
.type hwctx_a64_context_switch, %function
hwctx_a64_context_switch:
    // save old context (callee-saved registers)
    stp     x29, x30, [x0, #CTX_X29]
    stp     x27, x28, [x0, #CTX_X27]
    stp     x25, x26, [x0, #CTX_X25]
    stp     x23, x24, [x0, #CTX_X23]
    stp     x21, x22, [x0, #CTX_X21]
    stp     x19, x20, [x0, #CTX_X19]
    mov     x9, sp
    str     x9, [x0, #CTX_SP]           // single store: tpidr_el0 slot follows

    // restore new context
    ldr     x9, [x1, #CTX_SP]
    mov     sp, x9
    ldp     x19, x20, [x1, #CTX_X19]
    ldp     x21, x22, [x1, #CTX_X21]
    ldp     x23, x24, [x1, #CTX_X23]
    ldp     x25, x26, [x1, #CTX_X25]
    ldp     x27, x28, [x1, #CTX_X27]
    ldp     x29, x30, [x1, #CTX_X29]

    ret
.size hwctx_a64_context_switch, .-hwctx_a64_context_switch

// void hwctx_a64_fp_save(FpState *state)
.balign 4
.globl hwctx_a64_fp_save
.type hwctx_a64_fp_save, %function
hwctx_a64_fp_save:
    mrs     x9, fpcr
    mrs     x10, fpsr
    stp     q0, q1, [x0, #0 * 16]
    stp     q2, q3, [x0, #2 * 16]
    stp     q4, q5, [x0, #4 * 16]
    stp     q6, q7, [x0, #6 * 16]
    stp     q8, q9, [x0, #8 * 16]
    stp     q10, q11, [x0, #10 * 16]
    stp     q12, q13, [x0, #12 * 16]
    stp     q14, q15, [x0, #14 * 16]
    stp     q16, q17, [x0, #16 * 16]
    stp     q18, q19, [x0, #18 * 16]
    stp     q20, q21, [x0, #20 * 16]
    stp     q22, q23, [x0, #22 * 16]
    stp     q24, q25, [x0, #24 * 16]
    stp     q26, q27, [x0, #26 * 16]
    stp     q28, q29, [x0, #28 * 16]
    stp     q30, q31, [x0, #30 * 16]
    str     w9, [x0, #FP_FPCR]
    str     w10, [x0, #FP_FPSR]

    isb
    ret
.size hwctx_a64_fp_save, .-hwctx_a64_fp_save

// void hwctx_a64_fp_restore(const FpState *state)
.balign 4
.globl hwctx_a64_fp_restore
.type hwctx_a64_fp_restore, %function
hwctx_a64_fp_restore:
    ldp     q0, q1, [x0, #0 * 16]
    ldp     q2, q3, [x0, #2 * 16]
    ldp     q4, q5, [x0, #4 * 16]
    ldp     q6, q7, [x0, #6 * 16]
    ldp     q8, q9, [x0, #8 * 16]
    ldp     q10, q11, [x0, #10 * 16]
    ldp     q12, q13, [x0, #12 * 16]
    ldp     q14, q15, [x0, #14 * 16]
    ldp     q16, q17, [x0, #16 * 16]
    ldp     q18, q19, [x0, #18 * 16]
    ldp     q20, q21, [x0, #20 * 16]
    ldp     q22, q23, [x0, #22 * 16]
    ldp     q24, q25, [x0, #24 * 16]
    ldp     q26, q27, [x0, #26 * 16]
    ldp     q28, q29, [x0, #28 * 16]
    ldp     q30, q31, [x0, #30 * 16]
    ldr     w9, [x0, #FP_FPCR]
    ldr     w10, [x0, #FP_FPSR]
    msr     fpcr, x9
    msr     fpsr, x10

    isb
    ret
.size hwctx_a64_fp_restore, .-hwctx_a64_fp_restore

.popsection
)");
// clang-format on

#endif  // __aarch64__
