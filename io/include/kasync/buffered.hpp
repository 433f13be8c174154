/**
 * @file buffered.hpp
 * @brief Buffering wrappers around any byte stream
 *
 * Both wrappers borrow the stream they buffer (it must outlive them) and are
 * themselves streams, so they stack with anything else that takes an
 * AsyncRead or AsyncWrite.
 */

#ifndef KASYNC_BUFFERED_HPP
#define KASYNC_BUFFERED_HPP

#include "kasync/async_io.hpp"
#include "kasync/kernel.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kasync::io
{

/* ============================================================================
 * BufReader
 * ========================================================================= */

class BufReader final : public AsyncRead
{
public:
   explicit BufReader(AsyncRead& inner, std::size_t capacity = config::IO_BUFFER_CAPACITY);

   /**
    * @brief Reads that are at least a buffer long bypass the buffer when it is empty
    */
   Poll<Result<std::size_t>> poll_read(Context& cx, std::span<std::uint8_t> out) override;

   /**
    * @brief Unconsumed buffered bytes, refilling from the stream when empty
    *
    * An empty span means end of stream.
    */
   Poll<Result<std::span<const std::uint8_t>>> poll_fill_buf(Context& cx);

   /**
    * @brief Mark n buffered bytes as used (clamped to what is buffered)
    */
   void consume(std::size_t n) noexcept;

   [[nodiscard]] std::span<const std::uint8_t> buffer() const noexcept { return {storage.data() + pos, filled - pos}; }
   [[nodiscard]] std::size_t capacity() const noexcept { return storage.size(); }
   void discard_buffer() noexcept { pos = filled = 0; }

   [[nodiscard]] AsyncRead& get_ref() noexcept { return *inner; }

private:
   AsyncRead* inner;
   std::vector<std::uint8_t> storage;
   std::size_t pos{0};
   std::size_t filled{0};
};

class FillBufFuture
{
public:
   using Output = Result<std::span<const std::uint8_t>>;

   explicit FillBufFuture(BufReader& reader) noexcept : reader(&reader) {}

   Poll<Output> poll(Context& cx) { return reader->poll_fill_buf(cx); }

private:
   BufReader* reader;
};

/**
 * @brief Append bytes up to and including the next '\n' to line
 *
 * Resolves to the number of bytes appended; 0 means end of stream.
 */
class ReadLineFuture
{
public:
   using Output = Result<std::size_t>;

   ReadLineFuture(BufReader& reader, std::string& line) noexcept : reader(&reader), line(&line) {}

   Poll<Output> poll(Context& cx);

private:
   BufReader* reader;
   std::string* line;
   std::size_t appended{0};
};

inline FillBufFuture fill_buf(BufReader& reader) { return FillBufFuture(reader); }
inline ReadLineFuture read_line(BufReader& reader, std::string& line) { return ReadLineFuture(reader, line); }

/* ============================================================================
 * BufWriter
 * ========================================================================= */

/**
 * @brief Collects small writes; flushes when full, on flush and on close
 *
 * Data still buffered when the BufWriter is destroyed is lost: flush or
 * close it first.
 */
class BufWriter final : public AsyncWrite
{
public:
   explicit BufWriter(AsyncWrite& inner, std::size_t capacity = config::IO_BUFFER_CAPACITY);

   Poll<Result<std::size_t>> poll_write(Context& cx, std::span<const std::uint8_t> data) override;
   Poll<Result<void>> poll_flush(Context& cx) override;
   Poll<Result<void>> poll_close(Context& cx) override;

   [[nodiscard]] std::span<const std::uint8_t> buffer() const noexcept { return {pending_bytes.data() + flushed, pending_bytes.size() - flushed}; }
   [[nodiscard]] std::size_t capacity() const noexcept { return buffer_capacity; }

   [[nodiscard]] AsyncWrite& get_ref() noexcept { return *inner; }

private:
   // Push everything buffered into the inner stream
   Poll<Result<void>> poll_flush_buf(Context& cx);

   AsyncWrite* inner;
   std::size_t buffer_capacity;
   std::vector<std::uint8_t> pending_bytes;
   std::size_t flushed{0}; // Prefix of pending_bytes already accepted by inner
};

} // namespace kasync::io

#endif // KASYNC_BUFFERED_HPP
