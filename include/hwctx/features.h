#pragma once
#include <stdint.h>

#include "hwctx/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Build Configuration Query                                                 */
  /* ========================================================================= */

#define HWCTX_FEAT_FP_SIMD (1u << 0)
#define HWCTX_FEAT_TLS (1u << 1)
#define HWCTX_FEAT_USPACE (1u << 2)

  /**
   * @brief Description of how this library was built
   */
  typedef struct HwctxFeatures
  {
    const char *arch_name;      /**< "aarch64", "loongarch64" or "none" */
    uint8_t arch;               /**< HWCTX_ARCH_* value */
    uint8_t reserved[3];        /**< Alignment */
    uint32_t mask;              /**< HWCTX_FEAT_* bits */
    uint32_t task_context_size; /**< sizeof(TaskContext), 0 on host builds */
    uint32_t trap_frame_size;   /**< sizeof(TrapFrame), 0 on host builds */
    uint32_t ext_state_size;    /**< sizeof(FP state) when FP/SIMD is on, else 0 */
  } HwctxFeatures;

  /**
   * @brief Fill a feature descriptor
   *
   * @param out Output descriptor
   * @return 0 on success, InvalidArg if out is NULL
   */
  hwctx_err hwctx_get_features(HwctxFeatures *out);

  /**
   * @brief Check that every requested feature is compiled in
   *
   * Kernel bring-up code calls this once to fail early instead of running
   * with a context layout that lacks state it relies on.
   *
   * @param mask HWCTX_FEAT_* bits the caller requires
   * @return 0 if all present, FeatureDisabled otherwise
   */
  hwctx_err hwctx_require_features(uint32_t mask);

  /**
   * @brief Check that the library targets the given architecture
   *
   * @param arch HWCTX_ARCH_* value
   * @return 0 on match, ArchMismatch otherwise
   */
  hwctx_err hwctx_require_arch(uint8_t arch);

  /**
   * @brief Write the build configuration to the diagnostic log
   */
  void hwctx_features_report(void);

#ifdef __cplusplus
} /* extern "C" */
#endif
