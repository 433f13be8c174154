/**
 * @file async_io.cpp
 * @brief Looping read/write futures
 */

#include "kasync/async_io.hpp"

namespace kasync::io
{

Poll<ReadExactFuture::Output> ReadExactFuture::poll(Context& cx)
{
   while (filled < buf.size()) {
      auto polled = reader->poll_read(cx, buf.subspan(filled));
      if (polled.is_pending()) return pending;

      auto result = polled.take();
      if (result.is_err()) return Output::err(std::move(result).error());
      if (result.value() == 0) return Output::err(Error::unexpected_eof());
      filled += result.value();
   }
   return Output::ok();
}

Poll<WriteAllFuture::Output> WriteAllFuture::poll(Context& cx)
{
   while (written < buf.size()) {
      auto polled = writer->poll_write(cx, buf.subspan(written));
      if (polled.is_pending()) return pending;

      auto result = polled.take();
      if (result.is_err()) return Output::err(std::move(result).error());
      if (result.value() == 0) return Output::err(Error(ErrorKind::WriteZero, "failed to write whole buffer"));
      written += result.value();
   }
   return Output::ok();
}

} // namespace kasync::io
