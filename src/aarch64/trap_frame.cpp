#include "hwctx/aarch64/trap_frame.hpp"

#include <inttypes.h>

#include "hwctx/errors.hpp"
#include "hwctx/internal/format.hpp"
#include "hwctx/log.h"

namespace hwctx
{
namespace aarch64
{

hwctx_err format_trap_frame(const TrapFrame *tf, char *buf, size_t cap)
{
  if (!tf || !buf || cap == 0)
    return HWCTX_ERR(InvalidArg);

  detail::FormatBuffer out(buf, cap);

  out.append("TrapFrame: {\n");
  for (int i = 0; i < 31; i++)
  {
    out.append("    r%d: 0x%" PRIx64 ",\n", i, tf->r[i]);
  }
  out.append("    usp: 0x%" PRIx64 ",\n", tf->usp);
  out.append("    elr: 0x%" PRIx64 ",\n", tf->elr);
  out.append("    spsr: 0x%" PRIx64 ",\n", tf->spsr);
  out.append("}");

  return out.result();
}

void dump_trap_frame(const TrapFrame *tf)
{
  if (!tf)
    return;

  // 34 lines of at most 31 characters, plus braces
  char text[1280];
  if (format_trap_frame(tf, text, sizeof(text)) == HWCTX_ERR(BufferTooSmall))
    hwctx_log("hwctx: trap frame dump truncated");
  hwctx_log(text);
}

}  // namespace aarch64
}  // namespace hwctx
