#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstring>

#include "doctest.h"
#include "hwctx/context.hpp"

/* ========================================================================= */
/* Real switches on the build machine                                        */
/* ========================================================================= */
/**
 * Runs only when the host is one of the supported targets. A second task
 * runs on a static stack and bounces control back to the test thread, so
 * the assembly routines move the real sp, return address and callee-saved
 * registers.
 */

#if HWCTX_ARCH == HWCTX_ARCH_NONE
#error "native switch tests need an AArch64 or LoongArch64 host"
#endif

using hwctx::TaskContext;
using hwctx::va;

namespace
{

constexpr size_t kStackSize = 64 * 1024;

alignas(16) unsigned char g_task_stack[kStackSize];

TaskContext g_main_ctx;
TaskContext g_task_ctx;

int g_task_runs = 0;
bool g_frame_on_task_stack = false;
uint64_t g_task_sum = 0;

uintptr_t stack_top(void)
{
  return reinterpret_cast<uintptr_t>(g_task_stack + kStackSize);
}

// Task body: every iteration records where it runs, then yields back
void task_main(void)
{
  for (;;)
  {
    uintptr_t frame = reinterpret_cast<uintptr_t>(__builtin_frame_address(0));
    g_frame_on_task_stack =
        frame <= stack_top() && frame > reinterpret_cast<uintptr_t>(g_task_stack);

    // Locals live across the switch in callee-saved registers or on this stack
    uint64_t sum = 0;
    for (int i = 1; i <= 10; i++)
    {
      sum += static_cast<uint64_t>(i) * (g_task_runs + 1);
    }
    g_task_runs++;

    g_task_ctx.switch_to(g_main_ctx);

    g_task_sum += sum;
  }
}

}  // namespace

TEST_CASE("Native switch into a fresh task and back")
{
  g_task_runs = 0;
  g_task_sum = 0;
  g_frame_on_task_stack = false;
  g_task_ctx = TaskContext();
  g_task_ctx.init(reinterpret_cast<uintptr_t>(&task_main), va(stack_top()), va(0));

  g_main_ctx.switch_to(g_task_ctx);

  CHECK(g_task_runs == 1);
  CHECK(g_frame_on_task_stack);
  CHECK(g_task_ctx.sp > reinterpret_cast<uintptr_t>(g_task_stack));
  CHECK(g_task_ctx.sp < stack_top());

  SUBCASE("Repeated round trips resume where each side stopped")
  {
    for (int round = 0; round < 4; round++)
    {
      g_main_ctx.switch_to(g_task_ctx);
    }

    CHECK(g_task_runs == 5);
    // Runs 1..4 each added 55 * run after being resumed
    CHECK(g_task_sum == 55u * (1 + 2 + 3 + 4));
  }
}

/* ========================================================================= */
/* Callee-saved register fidelity                                            */
/* ========================================================================= */
/**
 * hwctx_test_call_with_registers() keeps the caller's own callee-saved
 * registers on its frame, loads every callee-saved register from @p in,
 * calls @p transfer(current, next), and stores what those registers hold
 * after control comes back into @p out. With the raw routine as
 * @p transfer, no compiled code touches those registers in between.
 */

using Transfer = void (*)(TaskContext *current, const TaskContext *next);

extern "C" void hwctx_test_call_with_registers(TaskContext *current, const TaskContext *next,
                                               const uint64_t *in, uint64_t *out,
                                               Transfer transfer);

namespace
{

#if HWCTX_ARCH == HWCTX_ARCH_AARCH64

constexpr int kCalleeSaved = 11;  // x19..x29

// clang-format off
asm(R"(
.pushsection .text
.balign 4
.globl hwctx_test_call_with_registers
.type hwctx_test_call_with_registers, %function
hwctx_test_call_with_registers:
    stp     x29, x30, [sp, #-112]!
    stp     x19, x20, [sp, #16]
    stp     x21, x22, [sp, #32]
    stp     x23, x24, [sp, #48]
    stp     x25, x26, [sp, #64]
    stp     x27, x28, [sp, #80]
    str     x3, [sp, #96]
    mov     x9, x4

    ldp     x19, x20, [x2, #0]
    ldp     x21, x22, [x2, #16]
    ldp     x23, x24, [x2, #32]
    ldp     x25, x26, [x2, #48]
    ldp     x27, x28, [x2, #64]
    ldr     x29, [x2, #80]
    blr     x9

    ldr     x3, [sp, #96]
    stp     x19, x20, [x3, #0]
    stp     x21, x22, [x3, #16]
    stp     x23, x24, [x3, #32]
    stp     x25, x26, [x3, #48]
    stp     x27, x28, [x3, #64]
    str     x29, [x3, #80]

    ldp     x19, x20, [sp, #16]
    ldp     x21, x22, [sp, #32]
    ldp     x23, x24, [sp, #48]
    ldp     x25, x26, [sp, #64]
    ldp     x27, x28, [sp, #80]
    ldp     x29, x30, [sp], #112
    ret
.size hwctx_test_call_with_registers, .-hwctx_test_call_with_registers
.popsection
)");
// clang-format on

const Transfer kRawTransfer = &hwctx_a64_context_switch;

void check_saved_slots(const TaskContext &ctx, const uint64_t *values)
{
  const uint64_t slots[kCalleeSaved] = {ctx.r19, ctx.r20, ctx.r21, ctx.r22, ctx.r23, ctx.r24,
                                        ctx.r25, ctx.r26, ctx.r27, ctx.r28, ctx.r29};
  for (int i = 0; i < kCalleeSaved; i++)
  {
    CAPTURE(i);
    CHECK(slots[i] == values[i]);
  }
  CHECK(ctx.lr != 0);
}

#elif HWCTX_ARCH == HWCTX_ARCH_LOONGARCH64

constexpr int kCalleeSaved = 10;  // $s0..$s8, $fp

// clang-format off
asm(R"(
.pushsection .text
.balign 4
.globl hwctx_test_call_with_registers
.type hwctx_test_call_with_registers, @function
hwctx_test_call_with_registers:
    addi.d  $sp, $sp, -112
    st.d    $ra, $sp, 0
    st.d    $fp, $sp, 8
    st.d    $s0, $sp, 16
    st.d    $s1, $sp, 24
    st.d    $s2, $sp, 32
    st.d    $s3, $sp, 40
    st.d    $s4, $sp, 48
    st.d    $s5, $sp, 56
    st.d    $s6, $sp, 64
    st.d    $s7, $sp, 72
    st.d    $s8, $sp, 80
    st.d    $a3, $sp, 88
    move    $t0, $a4

    ld.d    $s0, $a2, 0
    ld.d    $s1, $a2, 8
    ld.d    $s2, $a2, 16
    ld.d    $s3, $a2, 24
    ld.d    $s4, $a2, 32
    ld.d    $s5, $a2, 40
    ld.d    $s6, $a2, 48
    ld.d    $s7, $a2, 56
    ld.d    $s8, $a2, 64
    ld.d    $fp, $a2, 72
    jirl    $ra, $t0, 0

    ld.d    $a3, $sp, 88
    st.d    $s0, $a3, 0
    st.d    $s1, $a3, 8
    st.d    $s2, $a3, 16
    st.d    $s3, $a3, 24
    st.d    $s4, $a3, 32
    st.d    $s5, $a3, 40
    st.d    $s6, $a3, 48
    st.d    $s7, $a3, 56
    st.d    $s8, $a3, 64
    st.d    $fp, $a3, 72

    ld.d    $s8, $sp, 80
    ld.d    $s7, $sp, 72
    ld.d    $s6, $sp, 64
    ld.d    $s5, $sp, 56
    ld.d    $s4, $sp, 48
    ld.d    $s3, $sp, 40
    ld.d    $s2, $sp, 32
    ld.d    $s1, $sp, 24
    ld.d    $s0, $sp, 16
    ld.d    $fp, $sp, 8
    ld.d    $ra, $sp, 0
    addi.d  $sp, $sp, 112
    jr      $ra
.size hwctx_test_call_with_registers, .-hwctx_test_call_with_registers
.popsection
)");
// clang-format on

const Transfer kRawTransfer = &hwctx_la64_context_switch;

void check_saved_slots(const TaskContext &ctx, const uint64_t *values)
{
  for (int i = 0; i < kCalleeSaved; i++)
  {
    CAPTURE(i);
    CHECK(ctx.s[i] == values[i]);
  }
  CHECK(ctx.ra != 0);
}

#endif

alignas(16) unsigned char g_peer_stack[kStackSize];

TaskContext g_peer_ctx;
Transfer g_transfer = nullptr;
uint64_t g_main_values[kCalleeSaved];
uint64_t g_peer_values[kCalleeSaved];
uint64_t g_peer_seen[kCalleeSaved];
int g_peer_resumes = 0;

uintptr_t peer_stack_top(void)
{
  return reinterpret_cast<uintptr_t>(g_peer_stack + kStackSize);
}

void fill_values(uint64_t *values, uint64_t tag)
{
  for (int i = 0; i < kCalleeSaved; i++)
  {
    values[i] = tag | (static_cast<uint64_t>(i + 1) << 8) | static_cast<uint64_t>(0x10 + i);
  }
}

void transfer_via_switch_to(TaskContext *current, const TaskContext *next)
{
  current->switch_to(*next);
}

// Loads its own values into every callee-saved register before yielding
void peer_main(void)
{
  for (;;)
  {
    hwctx_test_call_with_registers(&g_peer_ctx, &g_main_ctx, g_peer_values, g_peer_seen,
                                   g_transfer);
    g_peer_resumes++;
  }
}

void start_peer(Transfer transfer)
{
  fill_values(g_main_values, 0x5a5a000000000000ull);
  fill_values(g_peer_values, 0xa5a5000000000000ull);
  memset(g_peer_seen, 0, sizeof(g_peer_seen));
  g_peer_resumes = 0;
  g_transfer = transfer;
  g_peer_ctx = TaskContext();
  g_peer_ctx.init(reinterpret_cast<uintptr_t>(&peer_main), va(peer_stack_top()), va(0));
}

void check_values(const uint64_t *seen, const uint64_t *expected)
{
  for (int i = 0; i < kCalleeSaved; i++)
  {
    CAPTURE(i);
    CHECK(seen[i] == expected[i]);
  }
}

}  // namespace

TEST_CASE("Native raw transfer preserves every callee-saved register")
{
  start_peer(kRawTransfer);

  uint64_t seen[kCalleeSaved];

  SUBCASE("Round trip into a fresh task and back")
  {
    memset(seen, 0, sizeof(seen));
    hwctx_test_call_with_registers(&g_main_ctx, &g_peer_ctx, g_main_values, seen, kRawTransfer);

    check_values(seen, g_main_values);
    check_saved_slots(g_main_ctx, g_main_values);
    check_saved_slots(g_peer_ctx, g_peer_values);

    // sp slots: ours lies below this frame, the peer's on its own stack
    CHECK(g_main_ctx.sp % 16 == 0);
    CHECK(g_main_ctx.sp < reinterpret_cast<uintptr_t>(&seen));
    CHECK(g_peer_ctx.sp % 16 == 0);
    CHECK(g_peer_ctx.sp > reinterpret_cast<uintptr_t>(g_peer_stack));
    CHECK(g_peer_ctx.sp < peer_stack_top());
  }

  SUBCASE("Both sides keep their registers over repeated round trips")
  {
    for (int round = 0; round < 3; round++)
    {
      memset(seen, 0, sizeof(seen));
      hwctx_test_call_with_registers(&g_main_ctx, &g_peer_ctx, g_main_values, seen,
                                     kRawTransfer);
      CAPTURE(round);
      check_values(seen, g_main_values);
    }

    // The peer was resumed twice and saw its own values each time
    CHECK(g_peer_resumes == 2);
    check_values(g_peer_seen, g_peer_values);
  }
}

TEST_CASE("Native switch_to preserves every callee-saved register")
{
  start_peer(transfer_via_switch_to);

  uint64_t seen[kCalleeSaved];
  for (int round = 0; round < 3; round++)
  {
    memset(seen, 0, sizeof(seen));
    hwctx_test_call_with_registers(&g_main_ctx, &g_peer_ctx, g_main_values, seen,
                                   transfer_via_switch_to);
    CAPTURE(round);
    check_values(seen, g_main_values);
  }

  CHECK(g_peer_resumes == 2);
  check_values(g_peer_seen, g_peer_values);
  CHECK(g_peer_ctx.sp > reinterpret_cast<uintptr_t>(g_peer_stack));
  CHECK(g_peer_ctx.sp < peer_stack_top());
}

#if HWCTX_FEATURE_FP_SIMD

#if HWCTX_ARCH == HWCTX_ARCH_AARCH64

static void fill_pattern(hwctx::ExtendedState &st)
{
  for (int i = 0; i < 32; i++)
  {
    st.regs[i][0] = 0x0101010101010101ull * static_cast<uint64_t>(i + 1);
    st.regs[i][1] = ~st.regs[i][0];
  }
  st.fpcr = 3u << 22;  // round towards zero
  st.fpsr = 0x1f;      // cumulative exception flags
}

static bool same_state(const hwctx::ExtendedState &a, const hwctx::ExtendedState &b)
{
  return memcmp(a.regs, b.regs, sizeof(a.regs)) == 0 && a.fpcr == b.fpcr && a.fpsr == b.fpsr;
}

#elif HWCTX_ARCH == HWCTX_ARCH_LOONGARCH64

static void fill_pattern(hwctx::ExtendedState &st)
{
  for (int i = 0; i < 32; i++)
  {
    st.fp[i] = 0x0101010101010101ull * static_cast<uint64_t>(i + 1);
  }
  for (int i = 0; i < 8; i++)
  {
    st.fcc[i] = static_cast<uint8_t>(i & 1);
  }
  st.fcsr = (1u << 8) | (0x1fu << 16);  // round towards zero, all flags
}

static bool same_state(const hwctx::ExtendedState &a, const hwctx::ExtendedState &b)
{
  return memcmp(a.fp, b.fp, sizeof(a.fp)) == 0 && memcmp(a.fcc, b.fcc, sizeof(a.fcc)) == 0 &&
         a.fcsr == b.fcsr;
}

#endif

TEST_CASE("Native extended state save/restore fidelity")
{
  static hwctx::ExtendedState original;
  static hwctx::ExtendedState pattern;
  static hwctx::ExtendedState zero;
  static hwctx::ExtendedState first;
  static hwctx::ExtendedState second;

  fill_pattern(pattern);

  // No floating-point code may run between these calls
  original.save();
  pattern.restore();
  first.save();
  zero.restore();
  first.restore();
  second.save();
  original.restore();

  CHECK(same_state(first, pattern));
  CHECK(same_state(second, pattern));
}

#endif
