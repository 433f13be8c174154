/**
 * @file buffered.cpp
 * @brief BufReader / BufWriter
 */

#include "kasync/buffered.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>

namespace kasync::io
{

/* ============================================================================
 * BufReader
 * ========================================================================= */

BufReader::BufReader(AsyncRead& inner, std::size_t capacity)
   : inner(&inner), storage(capacity)
{
   assert(capacity > 0 && "BufReader needs a non-empty buffer");
}

Poll<Result<std::span<const std::uint8_t>>> BufReader::poll_fill_buf(Context& cx)
{
   using Output = Result<std::span<const std::uint8_t>>;

   if (pos >= filled) {
      auto polled = inner->poll_read(cx, storage);
      if (polled.is_pending()) return pending;

      auto result = polled.take();
      if (result.is_err()) return Output::err(std::move(result).error());
      pos    = 0;
      filled = result.value();
   }
   return Output::ok(buffer());
}

void BufReader::consume(std::size_t n) noexcept
{
   pos = std::min(pos + n, filled);
}

Poll<Result<std::size_t>> BufReader::poll_read(Context& cx, std::span<std::uint8_t> out)
{
   if (pos >= filled && out.size() >= storage.size()) {
      discard_buffer();
      return inner->poll_read(cx, out);
   }

   auto polled = poll_fill_buf(cx);
   if (polled.is_pending()) return pending;

   auto available = polled.take();
   if (available.is_err()) return Result<std::size_t>::err(std::move(available).error());

   const auto bytes = available.value();
   const std::size_t n = std::min(bytes.size(), out.size());
   if (n) std::memcpy(out.data(), bytes.data(), n);
   consume(n);
   return Result<std::size_t>::ok(n);
}

Poll<ReadLineFuture::Output> ReadLineFuture::poll(Context& cx)
{
   while (true) {
      auto polled = reader->poll_fill_buf(cx);
      if (polled.is_pending()) return pending;

      auto available = polled.take();
      if (available.is_err()) return Output::err(std::move(available).error());

      const auto bytes = available.value();
      if (bytes.empty()) return Output::ok(appended);  // End of stream

      auto newline = std::find(bytes.begin(), bytes.end(), std::uint8_t{'\n'});
      const bool found = newline != bytes.end();
      const std::size_t take = found ? static_cast<std::size_t>(newline - bytes.begin()) + 1 : bytes.size();

      line->append(reinterpret_cast<const char*>(bytes.data()), take);
      reader->consume(take);
      appended += take;

      if (found) return Output::ok(appended);
   }
}

/* ============================================================================
 * BufWriter
 * ========================================================================= */

BufWriter::BufWriter(AsyncWrite& inner, std::size_t capacity)
   : inner(&inner), buffer_capacity(capacity)
{
   assert(capacity > 0 && "BufWriter needs a non-empty buffer");
   pending_bytes.reserve(capacity);
}

Poll<Result<void>> BufWriter::poll_flush_buf(Context& cx)
{
   while (flushed < pending_bytes.size()) {
      auto remaining = std::span<const std::uint8_t>(pending_bytes).subspan(flushed);
      auto polled = inner->poll_write(cx, remaining);
      if (polled.is_pending()) return pending;

      auto result = polled.take();
      if (result.is_err()) return Result<void>::err(std::move(result).error());
      if (result.value() == 0) {
         return Result<void>::err(Error(ErrorKind::WriteZero, "failed to write buffered data"));
      }
      flushed += result.value();
   }

   pending_bytes.clear();
   flushed = 0;
   return Result<void>::ok();
}

Poll<Result<std::size_t>> BufWriter::poll_write(Context& cx, std::span<const std::uint8_t> data)
{
   if (pending_bytes.size() + data.size() > buffer_capacity) {
      auto polled = poll_flush_buf(cx);
      if (polled.is_pending()) return pending;
      auto flushed_result = polled.take();
      if (flushed_result.is_err()) return Result<std::size_t>::err(std::move(flushed_result).error());
   }

   if (data.size() >= buffer_capacity) {
      return inner->poll_write(cx, data);
   }

   pending_bytes.insert(pending_bytes.end(), data.begin(), data.end());
   return Result<std::size_t>::ok(data.size());
}

Poll<Result<void>> BufWriter::poll_flush(Context& cx)
{
   auto polled = poll_flush_buf(cx);
   if (polled.is_pending()) return pending;
   auto result = polled.take();
   if (result.is_err()) return result;
   return inner->poll_flush(cx);
}

Poll<Result<void>> BufWriter::poll_close(Context& cx)
{
   auto polled = poll_flush_buf(cx);
   if (polled.is_pending()) return pending;
   auto result = polled.take();
   if (result.is_err()) return result;
   return inner->poll_close(cx);
}

} // namespace kasync::io
