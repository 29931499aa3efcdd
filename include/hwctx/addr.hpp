#pragma once
#include <cstdint>

#include "hwctx/types.h"

namespace hwctx
{

/**
 * @brief Virtual address value
 *
 * Thin wrapper so stack tops and TLS areas cannot be mixed up with
 * physical page-table roots at call sites.
 */
class VirtAddr
{
public:
  constexpr VirtAddr() = default;
  constexpr explicit VirtAddr(hwctx_vaddr_t addr) : addr_(addr) {}

  constexpr hwctx_vaddr_t as_usize() const { return addr_; }

  constexpr bool operator==(VirtAddr other) const { return addr_ == other.addr_; }
  constexpr bool operator!=(VirtAddr other) const { return addr_ != other.addr_; }

private:
  hwctx_vaddr_t addr_ = 0;
};

/**
 * @brief Physical address value
 */
class PhysAddr
{
public:
  constexpr PhysAddr() = default;
  constexpr explicit PhysAddr(hwctx_paddr_t addr) : addr_(addr) {}

  constexpr hwctx_paddr_t as_usize() const { return addr_; }

  constexpr bool operator==(PhysAddr other) const { return addr_ == other.addr_; }
  constexpr bool operator!=(PhysAddr other) const { return addr_ != other.addr_; }

private:
  hwctx_paddr_t addr_ = 0;
};

/** Shorthand constructors. */
constexpr VirtAddr va(hwctx_vaddr_t addr)
{
  return VirtAddr(addr);
}

constexpr PhysAddr pa(hwctx_paddr_t addr)
{
  return PhysAddr(addr);
}

}  // namespace hwctx
