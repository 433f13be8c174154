/**
 * @file device.hpp
 * @brief Synchronous network device surface consumed by the reactor backends
 *
 * A DeviceSocket is the blocking, fallible socket primitive a network stack
 * driver exposes. Backends call these on their own schedule; async code
 * never calls them directly. Every operation defaults to InvalidInput so a
 * TCP-only or UDP-only socket overrides just what it supports.
 */

#ifndef KASYNC_DEVICE_HPP
#define KASYNC_DEVICE_HPP

#include "kasync/io_error.hpp"
#include "kasync/socket_addr.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>

namespace kasync::io
{

class DeviceSocket
{
public:
   virtual ~DeviceSocket() = default;

   virtual Result<void> bind(SocketAddr) { return unsupported("bind"); }
   virtual Result<void> listen() { return unsupported("listen"); }
   virtual Result<void> connect(SocketAddr) { return unsupported("connect"); }
   virtual Result<std::shared_ptr<DeviceSocket>> accept() { return unsupported("accept"); }
   virtual Result<void> shutdown() { return Result<void>::ok(); }

   virtual Result<std::size_t> send(std::span<const std::uint8_t>) { return unsupported("send"); }
   virtual Result<std::size_t> recv(std::span<std::uint8_t>) { return unsupported("recv"); }
   virtual Result<std::size_t> send_to(std::span<const std::uint8_t>, SocketAddr) { return unsupported("send_to"); }
   virtual Result<std::pair<std::size_t, SocketAddr>> recv_from(std::span<std::uint8_t>) { return unsupported("recv_from"); }

   virtual Result<SocketAddr> local_addr() const { return unsupported("local_addr"); }
   virtual Result<SocketAddr> peer_addr() const { return unsupported("peer_addr"); }

protected:
   static Error unsupported(const char* what)
   {
      return Error(ErrorKind::InvalidInput, std::string(what) + " not supported by this socket");
   }
};

/**
 * @brief Socket factory of a network device
 */
class DeviceNet
{
public:
   virtual ~DeviceNet() = default;

   virtual Result<std::shared_ptr<DeviceSocket>> tcp_socket() = 0;
   virtual Result<std::shared_ptr<DeviceSocket>> udp_socket() = 0;
};

} // namespace kasync::io

#endif // KASYNC_DEVICE_HPP
