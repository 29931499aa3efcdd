#pragma once

/**
 * @file context.hpp
 * @brief Task context of the architecture this library is built for
 *
 * Pulls in the backend matching HWCTX_ARCH and exposes it as
 * hwctx::TaskContext / hwctx::TrapFrame. Host builds (HWCTX_ARCH_NONE)
 * see no aliases; they use hwctx::aarch64 / hwctx::loongarch64 directly.
 */

#include "hwctx/config.h"

#if HWCTX_ARCH == HWCTX_ARCH_AARCH64

#include "hwctx/aarch64/context.hpp"
#include "hwctx/aarch64/trap_frame.hpp"

namespace hwctx
{
using aarch64::TaskContext;
using aarch64::TrapFrame;
using ExtendedState = aarch64::FpState;
using aarch64::dump_trap_frame;
using aarch64::format_trap_frame;
}  // namespace hwctx

#elif HWCTX_ARCH == HWCTX_ARCH_LOONGARCH64

#include "hwctx/loongarch64/context.hpp"
#include "hwctx/loongarch64/trap_frame.hpp"

namespace hwctx
{
using loongarch64::TaskContext;
using loongarch64::TrapFrame;
using ExtendedState = loongarch64::FpuState;
using loongarch64::dump_trap_frame;
using loongarch64::format_trap_frame;
}  // namespace hwctx

#endif
