/**
 * @file net.hpp
 * @brief TCP and UDP sockets whose data transfers run through the Reactor
 *
 * Setup calls that the device answers synchronously (bind, listen, connect on
 * UDP) return a Result directly. Transfers are submitted to the reactor and
 * resolve when it delivers their completion.
 */

#ifndef KASYNC_NET_HPP
#define KASYNC_NET_HPP

#include "kasync/async_io.hpp"
#include "kasync/device.hpp"
#include "kasync/reactor.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace kasync::io
{

class TcpStream;

/**
 * @brief Resolves to a typed result once an underlying IoFuture resolves
 */
template<typename T>
using IoTask = MappedIoFuture<std::function<Result<T>(IoFuture::Output)>>;

/* ============================================================================
 * TcpStream
 * ========================================================================= */

/**
 * @brief Connected TCP stream
 *
 * At most one read and one write are in flight at a time. A read or write
 * that is abandoned mid-flight (its future dropped) stays with the stream and
 * its completion is picked up by the next poll_read / poll_write. Received
 * bytes that do not fit the buffer passed to poll_read are held on the stream
 * and returned by the following reads before another read is submitted.
 */
class TcpStream final : public AsyncRead, public AsyncWrite
{
public:
   TcpStream(Reactor& reactor, std::shared_ptr<DeviceSocket> socket) noexcept
      : reactor(&reactor), socket(std::move(socket)) {}

   /**
    * @brief Open a socket on the device and connect it to addr
    */
   static IoTask<TcpStream> connect(Reactor& reactor, DeviceNet& net, SocketAddr addr);

   Poll<Result<std::size_t>> poll_read(Context& cx, std::span<std::uint8_t> buf) override;
   Poll<Result<std::size_t>> poll_write(Context& cx, std::span<const std::uint8_t> buf) override;

   // TCP needs no explicit flush
   Poll<Result<void>> poll_flush(Context&) override { return Result<void>::ok(); }
   Poll<Result<void>> poll_close(Context& cx) override;

   [[nodiscard]] Result<SocketAddr> local_addr() const { return socket->local_addr(); }
   [[nodiscard]] Result<SocketAddr> peer_addr() const { return socket->peer_addr(); }

   [[nodiscard]] std::shared_ptr<DeviceSocket> const& device_socket() const noexcept { return socket; }

private:
   Reactor* reactor;
   std::shared_ptr<DeviceSocket> socket;
   std::optional<IoFuture> read_op;
   std::optional<IoFuture> write_op;
   std::vector<std::uint8_t> read_leftover;
};

/* ============================================================================
 * TcpListener
 * ========================================================================= */

class TcpListener
{
public:
   /**
    * @brief Open, bind and start listening
    */
   static Result<TcpListener> bind(Reactor& reactor, DeviceNet& net, SocketAddr addr);

   /**
    * @brief Resolves to the next incoming connection
    */
   [[nodiscard]] IoTask<TcpStream> accept();

   [[nodiscard]] Result<SocketAddr> local_addr() const { return socket->local_addr(); }

private:
   TcpListener(Reactor& reactor, std::shared_ptr<DeviceSocket> socket) noexcept
      : reactor(&reactor), socket(std::move(socket)) {}

   Reactor* reactor;
   std::shared_ptr<DeviceSocket> socket;
};

/* ============================================================================
 * UdpSocket
 * ========================================================================= */

class UdpSocket
{
public:
   static Result<UdpSocket> bind(Reactor& reactor, DeviceNet& net, SocketAddr addr);

   /**
    * @brief Set the default peer for send() / recv()
    */
   Result<void> connect(SocketAddr addr) { return socket->connect(addr); }

   /**
    * @brief The datagram is copied at submission; data need not outlive the future
    */
   [[nodiscard]] IoTask<std::size_t> send_to(std::span<const std::uint8_t> data, SocketAddr addr);
   [[nodiscard]] IoTask<std::size_t> send(std::span<const std::uint8_t> data);

   /**
    * @brief Received bytes are copied into buf, which must outlive the future
    */
   [[nodiscard]] IoTask<std::pair<std::size_t, SocketAddr>> recv_from(std::span<std::uint8_t> buf);
   [[nodiscard]] IoTask<std::size_t> recv(std::span<std::uint8_t> buf);

   [[nodiscard]] Result<SocketAddr> local_addr() const { return socket->local_addr(); }

private:
   UdpSocket(Reactor& reactor, std::shared_ptr<DeviceSocket> socket) noexcept
      : reactor(&reactor), socket(std::move(socket)) {}

   Reactor* reactor;
   std::shared_ptr<DeviceSocket> socket;
};

} // namespace kasync::io

#endif // KASYNC_NET_HPP
