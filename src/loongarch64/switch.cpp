/**
 * @file switch.cpp
 * @brief LoongArch64 raw transfer and FPU save/restore routines
 *
 * Only assembled when targeting LoongArch64.
 */

#include "hwctx/config.h"
#include "hwctx/loongarch64/offsets.h"

#if defined(__loongarch64)

// clang-format off
asm(
    ".equ CTX_RA, "    HWCTX_STR(HWCTX_LA64_CTX_RA)    "\n"
    ".equ CTX_SP, "    HWCTX_STR(HWCTX_LA64_CTX_SP)    "\n"
    ".equ CTX_S0, "    HWCTX_STR(HWCTX_LA64_CTX_S0)    "\n"
    ".equ FPU_FP, "    HWCTX_STR(HWCTX_LA64_FPU_FP)    "\n"
    ".equ FPU_FCC, "   HWCTX_STR(HWCTX_LA64_FPU_FCC)   "\n"
    ".equ FPU_FCSR, "  HWCTX_STR(HWCTX_LA64_FPU_FCSR)  "\n"
R"(
.pushsection .text

# void hwctx_la64_context_switch(TaskContext *current, const TaskContext *next)
.balign 4
.globl hwctx_la64_context_switch
.type hwctx_la64_context_switch, @function
hwctx_la64_context_switch:
    # save old context (callee-saved registers)
    st.d    $ra, $a0, CTX_RA
    st.d    $sp, $a0, CTX_SP
    st.d    $s0, $a0, CTX_S0 + 0 * 8
    st.d    $s1, $a0, CTX_S0 + 1 * 8
    st.d    $s2, $a0, CTX_S0 + 2 * 8
    st.d    $s3, $a0, CTX_S0 + 3 * 8
    st.d    $s4, $a0, CTX_S0 + 4 * 8
    st.d    $s5, $a0, CTX_S0 + 5 * 8
    st.d    $s6, $a0, CTX_S0 + 6 * 8
    st.d    $s7, $a0, CTX_S0 + 7 * 8
    st.d    $s8, $a0, CTX_S0 + 8 * 8
    st.d    $fp, $a0, CTX_S0 + 9 * 8

    # restore new context
    ld.d    $fp, $a1, CTX_S0 + 9 * 8
    ld.d    $s8, $a1, CTX_S0 + 8 * 8
    ld.d    $s7, $a1, CTX_S0 + 7 * 8
    ld.d    $s6, $a1, CTX_S0 + 6 * 8
    ld.d    $s5, $a1, CTX_S0 + 5 * 8
    ld.d    $s4, $a1, CTX_S0 + 4 * 8
    ld.d    $s3, $a1, CTX_S0 + 3 * 8
    ld.d    $s2, $a1, CTX_S0 + 2 * 8
    ld.d    $s1, $a1, CTX_S0 + 1 * 8
    ld.d    $s0, $a1, CTX_S0 + 0 * 8
    ld.d    $sp, $a1, CTX_SP
    ld.d    $ra, $a1, CTX_RA

    jr      $ra
.size hwctx_la64_context_switch, .-hwctx_la64_context_switch

# void hwctx_la64_fpu_save(FpuState *fpu)
.balign 4
.globl hwctx_la64_fpu_save
.type hwctx_la64_fpu_save, @function
hwctx_la64_fpu_save:
    .irp n, 0,1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16,17,18,19,20,21,22,23,24,25,26,27,28,29,30,31
    fst.d   $f\n, $a0, FPU_FP + \n * 8
    .endr
    .irp n, 0,1,2,3,4,5,6,7
    movcf2gr $t0, $fcc\n
    st.b    $t0, $a0, FPU_FCC + \n
    .endr
    movfcsr2gr $t0, $fcsr0
    st.w    $t0, $a0, FPU_FCSR

    jr      $ra
.size hwctx_la64_fpu_save, .-hwctx_la64_fpu_save

# void hwctx_la64_fpu_restore(const FpuState *fpu)
.balign 4
.globl hwctx_la64_fpu_restore
.type hwctx_la64_fpu_restore, @function
hwctx_la64_fpu_restore:
    .irp n, 0,1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16,17,18,19,20,21,22,23,24,25,26,27,28,29,30,31
    fld.d   $f\n, $a0, FPU_FP + \n * 8
    .endr
    .irp n, 0,1,2,3,4,5,6,7
    ld.bu   $t0, $a0, FPU_FCC + \n
    movgr2cf $fcc\n, $t0
    .endr
    ld.w    $t0, $a0, FPU_FCSR
    movgr2fcsr $fcsr0, $t0

    jr      $ra
.size hwctx_la64_fpu_restore, .-hwctx_la64_fpu_restore

.popsection
)");
// clang-format on

#endif  // __loongarch64
