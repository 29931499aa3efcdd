#include "hwctx/features.h"

#include <cstring>

#include "hwctx/config.h"
#include "hwctx/context.hpp"
#include "hwctx/errors.hpp"
#include "hwctx/internal/format.hpp"
#include "hwctx/log.h"

/* ========================================================================= */
/* Build Configuration Query                                                 */
/* ========================================================================= */

namespace
{

constexpr uint32_t kFeatureMask = (HWCTX_FEATURE_FP_SIMD ? HWCTX_FEAT_FP_SIMD : 0u) |
                                  (HWCTX_FEATURE_TLS ? HWCTX_FEAT_TLS : 0u) |
                                  (HWCTX_FEATURE_USPACE ? HWCTX_FEAT_USPACE : 0u);

}  // namespace

extern "C" hwctx_err hwctx_get_features(HwctxFeatures *out)
{
  if (!out)
    return HWCTX_ERR(InvalidArg);

  memset(out, 0, sizeof(*out));
  out->arch_name = HWCTX_ARCH_NAME;
  out->arch = HWCTX_ARCH;
  out->mask = kFeatureMask;

#if HWCTX_ARCH != HWCTX_ARCH_NONE
  out->task_context_size = sizeof(hwctx::TaskContext);
  out->trap_frame_size = sizeof(hwctx::TrapFrame);
#if HWCTX_FEATURE_FP_SIMD
  out->ext_state_size = sizeof(hwctx::ExtendedState);
#endif
#endif

  return HWCTX_ERR(OK);
}

extern "C" hwctx_err hwctx_require_features(uint32_t mask)
{
  if ((mask & kFeatureMask) != mask)
    return HWCTX_ERR(FeatureDisabled);

  return HWCTX_ERR(OK);
}

extern "C" hwctx_err hwctx_require_arch(uint8_t arch)
{
  if (arch != HWCTX_ARCH)
    return HWCTX_ERR(ArchMismatch);

  return HWCTX_ERR(OK);
}

extern "C" void hwctx_features_report(void)
{
  HwctxFeatures f;
  if (hwctx_get_features(&f) != HWCTX_ERR(OK))
    return;

  char text[256];
  hwctx::detail::FormatBuffer out(text, sizeof(text));
  out.append("hwctx: arch=%s fp-simd=%s tls=%s uspace=%s", f.arch_name,
             (f.mask & HWCTX_FEAT_FP_SIMD) ? "on" : "off", (f.mask & HWCTX_FEAT_TLS) ? "on" : "off",
             (f.mask & HWCTX_FEAT_USPACE) ? "on" : "off");
  if (f.task_context_size)
  {
    out.append(" task_context=%u trap_frame=%u", static_cast<unsigned>(f.task_context_size),
               static_cast<unsigned>(f.trap_frame_size));
  }
  if (f.ext_state_size)
    out.append(" ext_state=%u", static_cast<unsigned>(f.ext_state_size));

  hwctx_log(text);
}
