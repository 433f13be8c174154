/**
 * @file io_error.hpp
 * @brief Structured I/O error (kind + message)
 *
 * I/O failures travel as values: through reactor completions and as the
 * error alternative of io::Result. They are never thrown.
 */

#ifndef KASYNC_IO_ERROR_HPP
#define KASYNC_IO_ERROR_HPP

#include "kasync/result.hpp"

#include <string>
#include <utility>

namespace kasync::io
{

enum class ErrorKind
{
   NotFound,
   PermissionDenied,
   ConnectionRefused,
   ConnectionReset,
   ConnectionAborted,
   NotConnected,
   AddrInUse,
   AddrNotAvailable,
   BrokenPipe,
   AlreadyExists,
   WouldBlock,
   InvalidInput,
   InvalidData,
   TimedOut,
   WriteZero,
   ReadZero,
   Disconnected,
   Interrupted,
   Other,
   UnexpectedEof,
   OutOfMemory,
};

/**
 * @brief Human-readable description of an error kind
 */
const char* as_str(ErrorKind kind) noexcept;

class Error
{
public:
   Error(ErrorKind kind, std::string message) : error_kind(kind), text(std::move(message)) {}

   /**
    * @brief Error whose message is the kind's description
    */
   static Error from(ErrorKind kind) { return Error(kind, as_str(kind)); }

   /**
    * @brief Translate a POSIX errno value (unknown values map to Other)
    */
   static Error from_errno(int err);

   static Error unexpected_eof() { return from(ErrorKind::UnexpectedEof); }

   [[nodiscard]] ErrorKind kind() const noexcept { return error_kind; }
   [[nodiscard]] std::string const& message() const noexcept { return text; }

   /**
    * @brief "<kind description>: <message>"
    */
   [[nodiscard]] std::string to_string() const;

private:
   ErrorKind error_kind;
   std::string text;
};

template<typename T>
using Result = kasync::Result<T, Error>;

} // namespace kasync::io

#endif // KASYNC_IO_ERROR_HPP
