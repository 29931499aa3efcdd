#pragma once
#include <stddef.h>

#include "hwctx/types.h"

namespace hwctx
{
namespace detail
{

/**
 * @brief Bounded text builder over a caller-owned buffer
 *
 * Appends with printf semantics and never writes past the buffer. The
 * buffer is always NUL-terminated (when capacity > 0); once an append
 * does not fit, the builder latches the overflow and further appends are
 * dropped.
 */
class FormatBuffer
{
public:
  FormatBuffer(char *buf, size_t cap);

  void append(const char *fmt, ...) __attribute__((format(printf, 2, 3)));

  /** Characters written so far (excluding the terminator). */
  size_t length() const { return len_; }

  bool overflowed() const { return overflow_; }

  /**
   * @brief Final result in the library's error convention
   * @return length on success, BufferTooSmall if anything was dropped
   */
  hwctx_err result() const;

private:
  char *buf_;
  size_t cap_;
  size_t len_;
  bool overflow_;
};

}  // namespace detail
}  // namespace hwctx
