/**
 * @file memory_io.hpp
 * @brief In-memory streams and a loopback socket device for the I/O tests
 */

#ifndef KASYNC_TEST_MEMORY_IO_HPP
#define KASYNC_TEST_MEMORY_IO_HPP

#include "kasync/async_io.hpp"
#include "kasync/device.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kasync::test
{

/* ============================================================================
 * MemoryReader / MemoryWriter
 * ========================================================================= */

/**
 * @brief AsyncRead over a fixed byte string
 *
 * Hands out at most chunk bytes per read. With stall set, every other read
 * reports pending first (and wakes the caller immediately).
 */
class MemoryReader final : public io::AsyncRead
{
public:
   explicit MemoryReader(std::string data, std::size_t chunk = SIZE_MAX, bool stall = false)
      : data(std::move(data)), chunk(chunk), stall(stall) {}

   Poll<io::Result<std::size_t>> poll_read(Context& cx, std::span<std::uint8_t> buf) override
   {
      ++reads;
      if (stall && (stalled = !stalled)) {
         cx.waker().wake_by_ref();
         return pending;
      }
      const std::size_t n = std::min({buf.size(), chunk, data.size() - offset});
      if (n) std::memcpy(buf.data(), data.data() + offset, n);
      offset += n;
      return io::Result<std::size_t>::ok(n);
   }

   int reads{0};

private:
   std::string data;
   std::size_t chunk;
   bool stall;
   bool stalled{false};
   std::size_t offset{0};
};

/**
 * @brief AsyncWrite into a vector, accepting at most chunk bytes per write
 */
class MemoryWriter final : public io::AsyncWrite
{
public:
   explicit MemoryWriter(std::size_t chunk = SIZE_MAX) : chunk(chunk) {}

   Poll<io::Result<std::size_t>> poll_write(Context&, std::span<const std::uint8_t> buf) override
   {
      ++writes;
      const std::size_t n = std::min(buf.size(), chunk);
      sink.insert(sink.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
      return io::Result<std::size_t>::ok(n);
   }

   Poll<io::Result<void>> poll_flush(Context&) override
   {
      ++flushes;
      return io::Result<void>::ok();
   }

   Poll<io::Result<void>> poll_close(Context&) override
   {
      closed = true;
      return io::Result<void>::ok();
   }

   [[nodiscard]] std::string text() const { return {sink.begin(), sink.end()}; }

   std::vector<std::uint8_t> sink;
   std::size_t chunk;
   int writes{0};
   int flushes{0};
   bool closed{false};
};

/* ============================================================================
 * MemoryNet
 * ========================================================================= */

class MemoryNet;

/**
 * @brief Socket whose peer lives in the same process
 *
 * TCP sockets exchange bytes through a pair of shared pipes; UDP sockets
 * exchange whole datagrams through the net's address table.
 */
class MemorySocket final : public io::DeviceSocket, public std::enable_shared_from_this<MemorySocket>
{
public:
   struct Pipe
   {
      std::deque<std::uint8_t> bytes;
      bool closed{false};
   };

   MemorySocket(MemoryNet& net, bool tcp) : net(&net), tcp(tcp) {}

   io::Result<void> bind(io::SocketAddr addr) override;
   io::Result<void> listen() override;
   io::Result<void> connect(io::SocketAddr addr) override;
   io::Result<std::shared_ptr<io::DeviceSocket>> accept() override;
   io::Result<void> shutdown() override;

   io::Result<std::size_t> send(std::span<const std::uint8_t> data) override;
   io::Result<std::size_t> recv(std::span<std::uint8_t> buf) override;
   io::Result<std::size_t> send_to(std::span<const std::uint8_t> data, io::SocketAddr addr) override;
   io::Result<std::pair<std::size_t, io::SocketAddr>> recv_from(std::span<std::uint8_t> buf) override;

   io::Result<io::SocketAddr> local_addr() const override { return local; }
   io::Result<io::SocketAddr> peer_addr() const override
   {
      if (!connected) return io::Error::from(io::ErrorKind::NotConnected);
      return peer;
   }

private:
   friend class MemoryNet;

   MemoryNet* net;
   bool tcp;
   bool listening{false};
   bool connected{false};
   io::SocketAddr local{};
   io::SocketAddr peer{};

   std::shared_ptr<Pipe> rx;
   std::shared_ptr<Pipe> tx;
   std::deque<std::shared_ptr<MemorySocket>> backlog;
   std::deque<std::pair<std::vector<std::uint8_t>, io::SocketAddr>> datagrams;
};

class MemoryNet final : public io::DeviceNet
{
public:
   io::Result<std::shared_ptr<io::DeviceSocket>> tcp_socket() override
   {
      return std::shared_ptr<io::DeviceSocket>(std::make_shared<MemorySocket>(*this, true));
   }

   io::Result<std::shared_ptr<io::DeviceSocket>> udp_socket() override
   {
      return std::shared_ptr<io::DeviceSocket>(std::make_shared<MemorySocket>(*this, false));
   }

   std::uint16_t next_ephemeral{40000};
   std::map<std::pair<bool, std::uint64_t>, std::weak_ptr<MemorySocket>> bound;

   static std::uint64_t key(io::SocketAddr addr)
   {
      std::uint64_t k = addr.port;
      for (auto octet : addr.ip) k = (k << 8) | octet;
      return k;
   }

   std::shared_ptr<MemorySocket> find(bool tcp, io::SocketAddr addr)
   {
      auto it = bound.find({tcp, key(addr)});
      return it == bound.end() ? nullptr : it->second.lock();
   }
};

inline io::Result<void> MemorySocket::bind(io::SocketAddr addr)
{
   if (net->find(tcp, addr)) return io::Error::from(io::ErrorKind::AddrInUse);
   local = addr;
   net->bound[{tcp, MemoryNet::key(addr)}] = weak_from_this();
   return io::Result<void>::ok();
}

inline io::Result<void> MemorySocket::listen()
{
   if (!tcp) return unsupported("listen");
   listening = true;
   return io::Result<void>::ok();
}

inline io::Result<void> MemorySocket::connect(io::SocketAddr addr)
{
   if (!tcp) {
      peer = addr;
      connected = true;
      return io::Result<void>::ok();
   }

   auto server = net->find(true, addr);
   if (!server || !server->listening) return io::Error::from(io::ErrorKind::ConnectionRefused);

   local = io::SocketAddr({127, 0, 0, 1}, net->next_ephemeral++);
   peer = addr;
   connected = true;
   rx = std::make_shared<Pipe>();
   tx = std::make_shared<Pipe>();

   auto accepted = std::make_shared<MemorySocket>(*net, true);
   accepted->local = addr;
   accepted->peer = local;
   accepted->connected = true;
   accepted->rx = tx;
   accepted->tx = rx;
   server->backlog.push_back(std::move(accepted));
   return io::Result<void>::ok();
}

inline io::Result<std::shared_ptr<io::DeviceSocket>> MemorySocket::accept()
{
   if (!listening) return io::Error(io::ErrorKind::InvalidInput, "socket is not listening");
   if (backlog.empty()) return io::Error::from(io::ErrorKind::WouldBlock);
   std::shared_ptr<io::DeviceSocket> next = std::move(backlog.front());
   backlog.pop_front();
   return next;
}

inline io::Result<void> MemorySocket::shutdown()
{
   if (tx) tx->closed = true;
   return io::Result<void>::ok();
}

inline io::Result<std::size_t> MemorySocket::send(std::span<const std::uint8_t> data)
{
   if (!connected) return io::Error::from(io::ErrorKind::NotConnected);
   if (!tcp) return send_to(data, peer);
   if (tx->closed) return io::Error::from(io::ErrorKind::BrokenPipe);
   tx->bytes.insert(tx->bytes.end(), data.begin(), data.end());
   return data.size();
}

inline io::Result<std::size_t> MemorySocket::recv(std::span<std::uint8_t> buf)
{
   if (!connected) return io::Error::from(io::ErrorKind::NotConnected);
   if (!tcp) {
      auto got = recv_from(buf);
      if (got.is_err()) return std::move(got).error();
      return got.value().first;
   }
   if (rx->bytes.empty()) {
      if (rx->closed) return std::size_t{0};
      return io::Error::from(io::ErrorKind::WouldBlock);
   }
   const std::size_t n = std::min(buf.size(), rx->bytes.size());
   std::copy_n(rx->bytes.begin(), n, buf.begin());
   rx->bytes.erase(rx->bytes.begin(), rx->bytes.begin() + static_cast<std::ptrdiff_t>(n));
   return n;
}

inline io::Result<std::size_t> MemorySocket::send_to(std::span<const std::uint8_t> data, io::SocketAddr addr)
{
   if (tcp) return unsupported("send_to");
   auto target = net->find(false, addr);
   if (!target) return io::Error::from(io::ErrorKind::ConnectionRefused);
   target->datagrams.emplace_back(std::vector<std::uint8_t>(data.begin(), data.end()), local);
   return data.size();
}

inline io::Result<std::pair<std::size_t, io::SocketAddr>> MemorySocket::recv_from(std::span<std::uint8_t> buf)
{
   if (tcp) return unsupported("recv_from");
   if (datagrams.empty()) return io::Error::from(io::ErrorKind::WouldBlock);
   auto [bytes, from] = std::move(datagrams.front());
   datagrams.pop_front();
   const std::size_t n = std::min(buf.size(), bytes.size());
   std::copy_n(bytes.begin(), n, buf.begin());
   return std::pair<std::size_t, io::SocketAddr>{n, from};
}

} // namespace kasync::test

#endif // KASYNC_TEST_MEMORY_IO_HPP
