/**
 * @file io_error.cpp
 * @brief Error kind descriptions and errno translation
 */

#include "kasync/io_error.hpp"

#include <cerrno>
#include <cstring>

namespace kasync::io
{

const char* as_str(ErrorKind kind) noexcept
{
   switch (kind) {
      case ErrorKind::NotFound:          return "entity not found";
      case ErrorKind::PermissionDenied:  return "permission denied";
      case ErrorKind::ConnectionRefused: return "connection refused";
      case ErrorKind::ConnectionReset:   return "connection reset";
      case ErrorKind::ConnectionAborted: return "connection aborted";
      case ErrorKind::NotConnected:      return "not connected";
      case ErrorKind::AddrInUse:         return "address in use";
      case ErrorKind::AddrNotAvailable:  return "address not available";
      case ErrorKind::BrokenPipe:        return "broken pipe";
      case ErrorKind::AlreadyExists:     return "entity already exists";
      case ErrorKind::WouldBlock:        return "operation would block";
      case ErrorKind::InvalidInput:      return "invalid input parameter";
      case ErrorKind::InvalidData:       return "invalid data";
      case ErrorKind::TimedOut:          return "timed out";
      case ErrorKind::WriteZero:         return "write zero";
      case ErrorKind::ReadZero:          return "read zero";
      case ErrorKind::Disconnected:      return "disconnected";
      case ErrorKind::Interrupted:       return "operation interrupted";
      case ErrorKind::Other:             return "other I/O error";
      case ErrorKind::UnexpectedEof:     return "unexpected end of file";
      case ErrorKind::OutOfMemory:       return "out of memory";
   }
   return "unknown I/O error";
}

static ErrorKind kind_for_errno(int err) noexcept
{
   switch (err) {
      case ENOENT:       return ErrorKind::NotFound;
      case EPERM:
      case EACCES:       return ErrorKind::PermissionDenied;
      case ECONNREFUSED: return ErrorKind::ConnectionRefused;
      case ECONNRESET:   return ErrorKind::ConnectionReset;
      case ECONNABORTED: return ErrorKind::ConnectionAborted;
      case ENOTCONN:     return ErrorKind::NotConnected;
      case EADDRINUSE:   return ErrorKind::AddrInUse;
      case EADDRNOTAVAIL:return ErrorKind::AddrNotAvailable;
      case EPIPE:        return ErrorKind::BrokenPipe;
      case EEXIST:       return ErrorKind::AlreadyExists;
      case EAGAIN:       return ErrorKind::WouldBlock;
#if EWOULDBLOCK != EAGAIN
      case EWOULDBLOCK:  return ErrorKind::WouldBlock;
#endif
      case EINVAL:       return ErrorKind::InvalidInput;
      case ETIMEDOUT:    return ErrorKind::TimedOut;
      case ENOMEM:       return ErrorKind::OutOfMemory;
      case EINTR:        return ErrorKind::Interrupted;
      default:           return ErrorKind::Other;
   }
}

Error Error::from_errno(int err)
{
   return Error(kind_for_errno(err), std::string("errno ") + std::to_string(err) + " (" + std::strerror(err) + ")");
}

std::string Error::to_string() const
{
   return std::string(as_str(error_kind)) + ": " + text;
}

} // namespace kasync::io
