/**
 * @file net.cpp
 * @brief TCP/UDP wrappers over reactor operations
 */

#include "kasync/net.hpp"

#include "DEBUG_PRINT.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>

namespace kasync::io
{

// Unwrap the completion a request is expected to produce
template<typename Done>
static Result<Done> expect(IoFuture::Output result)
{
   if (result.is_err()) return std::move(result).error();

   auto completion = std::move(result).value();
   if (auto* done = std::get_if<Done>(&completion)) return std::move(*done);
   return Error(ErrorKind::InvalidData, "unexpected completion kind");
}

static std::size_t copy_out(std::vector<std::uint8_t> const& bytes, std::span<std::uint8_t> buf)
{
   const std::size_t n = std::min(bytes.size(), buf.size());
   if (n) std::memcpy(buf.data(), bytes.data(), n);
   return n;
}

/* ============================================================================
 * TcpStream
 * ========================================================================= */

IoTask<TcpStream> TcpStream::connect(Reactor& reactor, DeviceNet& net, SocketAddr addr)
{
   auto opened = net.tcp_socket();
   std::shared_ptr<DeviceSocket> socket;
   std::optional<IoFuture> op;
   if (opened.is_ok()) {
      socket = std::move(opened).value();
      LOG_REACTOR("tcp connect to %s", addr.to_string().c_str());
      op.emplace(reactor.submit_operation(ConnectOp{socket, addr}));
   } else {
      op.emplace(IoFuture::from_error(std::move(opened).error()));
   }

   return IoTask<TcpStream>(std::move(*op), [r = &reactor, socket](IoFuture::Output result) -> Result<TcpStream> {
      auto done = expect<ConnectDone>(std::move(result));
      if (done.is_err()) return std::move(done).error();
      return TcpStream(*r, socket);
   });
}

Poll<Result<std::size_t>> TcpStream::poll_read(Context& cx, std::span<std::uint8_t> buf)
{
   if (!read_leftover.empty()) {
      const std::size_t n = copy_out(read_leftover, buf);
      read_leftover.erase(read_leftover.begin(), read_leftover.begin() + static_cast<std::ptrdiff_t>(n));
      return Result<std::size_t>::ok(n);
   }

   if (!read_op) {
      if (buf.empty()) return Result<std::size_t>::ok(0);
      read_op.emplace(reactor->submit_operation(ReadOp{socket, buf.size()}));
   }

   auto polled = read_op->poll(cx);
   if (polled.is_pending()) return pending;
   read_op.reset();

   auto done = expect<ReadDone>(polled.take());
   if (done.is_err()) return Result<std::size_t>::err(std::move(done).error());

   auto& bytes = done.value().bytes;
   const std::size_t n = copy_out(bytes, buf);
   if (n < bytes.size()) {
      // Submitted for a larger buffer than this caller passed
      read_leftover.assign(bytes.begin() + static_cast<std::ptrdiff_t>(n), bytes.end());
      LOG_REACTOR("tcp read kept %zu byte(s) for the next read", read_leftover.size());
   }
   return Result<std::size_t>::ok(n);
}

Poll<Result<std::size_t>> TcpStream::poll_write(Context& cx, std::span<const std::uint8_t> buf)
{
   if (!write_op) {
      if (buf.empty()) return Result<std::size_t>::ok(0);
      write_op.emplace(reactor->submit_operation(WriteOp{socket, {buf.begin(), buf.end()}}));
   }

   auto polled = write_op->poll(cx);
   if (polled.is_pending()) return pending;
   write_op.reset();

   auto done = expect<WriteDone>(polled.take());
   if (done.is_err()) return Result<std::size_t>::err(std::move(done).error());
   return Result<std::size_t>::ok(done.value().written);
}

Poll<Result<void>> TcpStream::poll_close(Context&)
{
   return socket->shutdown();
}

/* ============================================================================
 * TcpListener
 * ========================================================================= */

Result<TcpListener> TcpListener::bind(Reactor& reactor, DeviceNet& net, SocketAddr addr)
{
   auto opened = net.tcp_socket();
   if (opened.is_err()) return std::move(opened).error();
   auto socket = std::move(opened).value();

   if (auto bound = socket->bind(addr); bound.is_err()) return std::move(bound).error();
   if (auto listening = socket->listen(); listening.is_err()) return std::move(listening).error();

   LOG_REACTOR("tcp listening on %s", addr.to_string().c_str());
   return TcpListener(reactor, std::move(socket));
}

IoTask<TcpStream> TcpListener::accept()
{
   return IoTask<TcpStream>(reactor->submit_operation(AcceptOp{socket}), [r = reactor](IoFuture::Output result) -> Result<TcpStream> {
      auto done = expect<AcceptDone>(std::move(result));
      if (done.is_err()) return std::move(done).error();
      if (!done.value().socket) return Error(ErrorKind::InvalidData, "accept produced no socket");
      return TcpStream(*r, std::move(done.value().socket));
   });
}

/* ============================================================================
 * UdpSocket
 * ========================================================================= */

Result<UdpSocket> UdpSocket::bind(Reactor& reactor, DeviceNet& net, SocketAddr addr)
{
   auto opened = net.udp_socket();
   if (opened.is_err()) return std::move(opened).error();
   auto socket = std::move(opened).value();

   if (auto bound = socket->bind(addr); bound.is_err()) return std::move(bound).error();

   LOG_REACTOR("udp bound to %s", addr.to_string().c_str());
   return UdpSocket(reactor, std::move(socket));
}

IoTask<std::size_t> UdpSocket::send_to(std::span<const std::uint8_t> data, SocketAddr addr)
{
   auto op = reactor->submit_operation(SendToOp{socket, {data.begin(), data.end()}, addr});
   return IoTask<std::size_t>(std::move(op), [](IoFuture::Output result) -> Result<std::size_t> {
      auto done = expect<SendToDone>(std::move(result));
      if (done.is_err()) return std::move(done).error();
      return done.value().sent;
   });
}

IoTask<std::size_t> UdpSocket::send(std::span<const std::uint8_t> data)
{
   auto op = reactor->submit_operation(SendOp{socket, {data.begin(), data.end()}});
   return IoTask<std::size_t>(std::move(op), [](IoFuture::Output result) -> Result<std::size_t> {
      auto done = expect<SendDone>(std::move(result));
      if (done.is_err()) return std::move(done).error();
      return done.value().sent;
   });
}

IoTask<std::pair<std::size_t, SocketAddr>> UdpSocket::recv_from(std::span<std::uint8_t> buf)
{
   using Received = std::pair<std::size_t, SocketAddr>;

   auto op = reactor->submit_operation(RecvFromOp{socket, buf.size()});
   return IoTask<Received>(std::move(op), [buf](IoFuture::Output result) -> Result<Received> {
      auto done = expect<RecvFromDone>(std::move(result));
      if (done.is_err()) return std::move(done).error();
      return Received{copy_out(done.value().bytes, buf), done.value().from};
   });
}

IoTask<std::size_t> UdpSocket::recv(std::span<std::uint8_t> buf)
{
   auto op = reactor->submit_operation(RecvOp{socket, buf.size()});
   return IoTask<std::size_t>(std::move(op), [buf](IoFuture::Output result) -> Result<std::size_t> {
      auto done = expect<RecvDone>(std::move(result));
      if (done.is_err()) return std::move(done).error();
      return copy_out(done.value().bytes, buf);
   });
}

} // namespace kasync::io
