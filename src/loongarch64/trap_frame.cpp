#include "hwctx/loongarch64/trap_frame.hpp"

#include <inttypes.h>

#include "hwctx/errors.hpp"
#include "hwctx/internal/format.hpp"
#include "hwctx/log.h"

namespace hwctx
{
namespace loongarch64
{

namespace
{

struct RegisterSlot
{
  const char *name;
  uintptr_t GeneralRegisters::*field;
};

#define SLOT(reg) {#reg, &GeneralRegisters::reg}

const RegisterSlot kRegisterSlots[] = {
    SLOT(zero), SLOT(ra), SLOT(tp), SLOT(sp), SLOT(a0), SLOT(a1), SLOT(a2), SLOT(a3),
    SLOT(a4),   SLOT(a5), SLOT(a6), SLOT(a7), SLOT(t0), SLOT(t1), SLOT(t2), SLOT(t3),
    SLOT(t4),   SLOT(t5), SLOT(t6), SLOT(t7), SLOT(t8), SLOT(u0), SLOT(fp), SLOT(s0),
    SLOT(s1),   SLOT(s2), SLOT(s3), SLOT(s4), SLOT(s5), SLOT(s6), SLOT(s7), SLOT(s8),
};

#undef SLOT

static_assert(sizeof(kRegisterSlots) / sizeof(kRegisterSlots[0]) == 32, "one entry per register");

}  // namespace

hwctx_err format_trap_frame(const TrapFrame *tf, char *buf, size_t cap)
{
  if (!tf || !buf || cap == 0)
    return HWCTX_ERR(InvalidArg);

  detail::FormatBuffer out(buf, cap);

  out.append("TrapFrame: {\n");
  out.append("    regs: {\n");
  for (const RegisterSlot &slot : kRegisterSlots)
  {
    out.append("        %s: 0x%" PRIxPTR ",\n", slot.name, tf->regs.*slot.field);
  }
  out.append("    },\n");
  out.append("    prmd: 0x%" PRIxPTR ",\n", tf->prmd);
  out.append("    era: 0x%" PRIxPTR ",\n", tf->era);
  out.append("}");

  return out.result();
}

void dump_trap_frame(const TrapFrame *tf)
{
  if (!tf)
    return;

  char text[1536];
  if (format_trap_frame(tf, text, sizeof(text)) == HWCTX_ERR(BufferTooSmall))
    hwctx_log("hwctx: trap frame dump truncated");
  hwctx_log(text);
}

}  // namespace loongarch64
}  // namespace hwctx
