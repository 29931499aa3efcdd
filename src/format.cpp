#include "hwctx/internal/format.hpp"

#include <cstdarg>
#include <cstdio>

#include "hwctx/errors.hpp"

namespace hwctx
{
namespace detail
{

FormatBuffer::FormatBuffer(char *buf, size_t cap) : buf_(buf), cap_(cap), len_(0), overflow_(false)
{
  if (buf_ && cap_ > 0)
    buf_[0] = '\0';
  else
    overflow_ = true;
}

void FormatBuffer::append(const char *fmt, ...)
{
  if (overflow_)
    return;

  size_t room = cap_ - len_;

  va_list args;
  va_start(args, fmt);
  int n = vsnprintf(buf_ + len_, room, fmt, args);
  va_end(args);

  if (n < 0)
  {
    overflow_ = true;
    buf_[len_] = '\0';
    return;
  }

  if (static_cast<size_t>(n) >= room)
  {
    // vsnprintf left a truncated, terminated prefix in place
    len_ = cap_ - 1;
    overflow_ = true;
    return;
  }

  len_ += static_cast<size_t>(n);
}

hwctx_err FormatBuffer::result() const
{
  if (overflow_)
    return HWCTX_ERR(BufferTooSmall);

  return static_cast<hwctx_err>(len_);
}

}  // namespace detail
}  // namespace hwctx
