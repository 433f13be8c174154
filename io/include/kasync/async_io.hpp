/**
 * @file async_io.hpp
 * @brief Byte stream capabilities and the futures built on them
 *
 * AsyncRead and AsyncWrite are the two capability interfaces of a byte
 * stream. Wrappers (BufReader, BufWriter) hold another object implementing
 * them and forward or intercept calls. The helper functions return futures
 * that borrow both the stream and the caller's buffer; both must outlive the
 * future.
 */

#ifndef KASYNC_ASYNC_IO_HPP
#define KASYNC_ASYNC_IO_HPP

#include "kasync/future.hpp"
#include "kasync/io_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace kasync::io
{

class AsyncRead
{
public:
   virtual ~AsyncRead() = default;

   /**
    * @brief Read up to buf.size() bytes; 0 means end of stream
    */
   virtual Poll<Result<std::size_t>> poll_read(Context& cx, std::span<std::uint8_t> buf) = 0;
};

class AsyncWrite
{
public:
   virtual ~AsyncWrite() = default;

   /**
    * @brief Write up to buf.size() bytes; returns how many were accepted
    */
   virtual Poll<Result<std::size_t>> poll_write(Context& cx, std::span<const std::uint8_t> buf) = 0;
   virtual Poll<Result<void>> poll_flush(Context& cx) = 0;
   virtual Poll<Result<void>> poll_close(Context& cx) = 0;
};

/* ============================================================================
 * Futures
 * ========================================================================= */

class ReadFuture
{
public:
   using Output = Result<std::size_t>;

   ReadFuture(AsyncRead& reader, std::span<std::uint8_t> buf) noexcept : reader(&reader), buf(buf) {}

   Poll<Output> poll(Context& cx) { return reader->poll_read(cx, buf); }

private:
   AsyncRead* reader;
   std::span<std::uint8_t> buf;
};

/**
 * @brief Fill the whole buffer; end of stream first is UnexpectedEof
 */
class ReadExactFuture
{
public:
   using Output = Result<void>;

   ReadExactFuture(AsyncRead& reader, std::span<std::uint8_t> buf) noexcept : reader(&reader), buf(buf) {}

   Poll<Output> poll(Context& cx);

private:
   AsyncRead* reader;
   std::span<std::uint8_t> buf;
   std::size_t filled{0};
};

class WriteFuture
{
public:
   using Output = Result<std::size_t>;

   WriteFuture(AsyncWrite& writer, std::span<const std::uint8_t> buf) noexcept : writer(&writer), buf(buf) {}

   Poll<Output> poll(Context& cx) { return writer->poll_write(cx, buf); }

private:
   AsyncWrite* writer;
   std::span<const std::uint8_t> buf;
};

/**
 * @brief Write the whole buffer; a write of zero bytes is WriteZero
 */
class WriteAllFuture
{
public:
   using Output = Result<void>;

   WriteAllFuture(AsyncWrite& writer, std::span<const std::uint8_t> buf) noexcept : writer(&writer), buf(buf) {}

   Poll<Output> poll(Context& cx);

private:
   AsyncWrite* writer;
   std::span<const std::uint8_t> buf;
   std::size_t written{0};
};

class FlushFuture
{
public:
   using Output = Result<void>;

   explicit FlushFuture(AsyncWrite& writer) noexcept : writer(&writer) {}

   Poll<Output> poll(Context& cx) { return writer->poll_flush(cx); }

private:
   AsyncWrite* writer;
};

class CloseFuture
{
public:
   using Output = Result<void>;

   explicit CloseFuture(AsyncWrite& writer) noexcept : writer(&writer) {}

   Poll<Output> poll(Context& cx) { return writer->poll_close(cx); }

private:
   AsyncWrite* writer;
};

inline ReadFuture read(AsyncRead& reader, std::span<std::uint8_t> buf) { return ReadFuture(reader, buf); }
inline ReadExactFuture read_exact(AsyncRead& reader, std::span<std::uint8_t> buf) { return ReadExactFuture(reader, buf); }
inline WriteFuture write(AsyncWrite& writer, std::span<const std::uint8_t> buf) { return WriteFuture(writer, buf); }
inline WriteAllFuture write_all(AsyncWrite& writer, std::span<const std::uint8_t> buf) { return WriteAllFuture(writer, buf); }
inline FlushFuture flush(AsyncWrite& writer) { return FlushFuture(writer); }
inline CloseFuture close(AsyncWrite& writer) { return CloseFuture(writer); }

} // namespace kasync::io

#endif // KASYNC_ASYNC_IO_HPP
