/**
 * @file reactor.hpp
 * @brief I/O completion reactor with a pluggable backend
 *
 * submit_operation() hands a request to the backend under a fresh RequestId
 * and returns an IoFuture. The reactor keeps only a weak reference to the
 * future's state: poll() delivers every completion the backend has ready to
 * the futures that still exist, then sweeps the table of entries whose future
 * was dropped, so abandoned requests never accumulate.
 *
 * Usage:
 *   Reactor reactor(std::make_unique<SyncDeviceBackend>());
 *   auto fut = reactor.submit_operation(WriteOp{socket, {1, 2, 3}});
 *   reactor.poll();                     // normally run from the idle loop
 *   auto result = executor.block_on(std::move(fut));
 */

#ifndef KASYNC_REACTOR_HPP
#define KASYNC_REACTOR_HPP

#include "kasync/device.hpp"
#include "kasync/future.hpp"
#include "kasync/io_error.hpp"
#include "kasync/kernel.hpp"
#include "kasync/socket_addr.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace kasync::io
{

struct RequestId
{
   std::uint64_t value{0};

   bool operator==(RequestId const&) const = default;

   /**
    * @brief Process-wide monotonically increasing id, starting at 1
    */
   static RequestId next() noexcept;
};

/* ============================================================================
 * Operations / Completions
 * ========================================================================= */

// Operations own their outgoing data; incoming data comes back in the completion
struct ReadOp     { std::shared_ptr<DeviceSocket> socket; std::size_t len{0}; };
struct WriteOp    { std::shared_ptr<DeviceSocket> socket; std::vector<std::uint8_t> data; };
struct ConnectOp  { std::shared_ptr<DeviceSocket> socket; SocketAddr addr; };
struct AcceptOp   { std::shared_ptr<DeviceSocket> socket; };
struct SendOp     { std::shared_ptr<DeviceSocket> socket; std::vector<std::uint8_t> data; };
struct SendToOp   { std::shared_ptr<DeviceSocket> socket; std::vector<std::uint8_t> data; SocketAddr addr; };
struct RecvOp     { std::shared_ptr<DeviceSocket> socket; std::size_t len{0}; };
struct RecvFromOp { std::shared_ptr<DeviceSocket> socket; std::size_t len{0}; };

using IoOperation = std::variant<ReadOp, WriteOp, ConnectOp, AcceptOp, SendOp, SendToOp, RecvOp, RecvFromOp>;

struct ReadDone     { std::vector<std::uint8_t> bytes; };
struct WriteDone    { std::size_t written{0}; };
struct ConnectDone  {};
struct AcceptDone   { std::shared_ptr<DeviceSocket> socket; };
struct SendDone     { std::size_t sent{0}; };
struct SendToDone   { std::size_t sent{0}; };
struct RecvDone     { std::vector<std::uint8_t> bytes; };
struct RecvFromDone { std::vector<std::uint8_t> bytes; SocketAddr from; };

using Completion = std::variant<ReadDone, WriteDone, ConnectDone, AcceptDone, SendDone, SendToDone, RecvDone, RecvFromDone, Error>;

/**
 * @brief Short name of an operation ("read", "send_to", ...) for logs
 */
const char* operation_name(IoOperation const& op) noexcept;

/* ============================================================================
 * IoFuture
 * ========================================================================= */

namespace detail
{
   struct IoState
   {
      Spinlock lock;
      std::optional<Completion> result;
      Waker waker;
   };
}  // namespace detail

/**
 * @brief Resolves once the backend completed the request
 *
 * An Error completion is surfaced as the error alternative of the Result.
 */
class IoFuture
{
public:
   using Output = Result<Completion>;

   IoFuture(RequestId id, std::shared_ptr<detail::IoState> state) noexcept : request(id), state(std::move(state)) {}

   /**
    * @brief An already-failed future (submission could not even be attempted)
    */
   static IoFuture from_error(Error error);

   Poll<Output> poll(Context& cx);

   [[nodiscard]] RequestId id() const noexcept { return request; }

   /**
    * @brief Future resolving to fn(result) once this one resolves
    */
   template<typename Fn>
   auto map(Fn&& fn) &&;

private:
   RequestId request;
   std::shared_ptr<detail::IoState> state;
};

template<typename Fn>
class MappedIoFuture
{
public:
   using Output = std::invoke_result_t<Fn&, IoFuture::Output>;

   MappedIoFuture(IoFuture inner, Fn fn) : inner(std::move(inner)), fn(std::move(fn)) {}

   Poll<Output> poll(Context& cx)
   {
      auto polled = inner.poll(cx);
      if (polled.is_pending()) return pending;
      return fn(polled.take());
   }

private:
   IoFuture inner;
   Fn fn;
};

template<typename Fn>
auto IoFuture::map(Fn&& fn) &&
{
   return MappedIoFuture<std::decay_t<Fn>>(std::move(*this), std::forward<Fn>(fn));
}

/* ============================================================================
 * Backend / Reactor
 * ========================================================================= */

/**
 * @brief Executes operations; the reactor only brokers them
 *
 * submit() may complete the operation immediately (queuing the result) or
 * start it on hardware. poll() returns every completion available now.
 * Both may be called from any core.
 */
class IoBackend
{
public:
   using CompletionList = std::vector<std::pair<RequestId, Completion>>;

   virtual ~IoBackend() = default;

   virtual void submit(RequestId id, IoOperation operation) = 0;
   virtual CompletionList poll() = 0;
};

class Reactor
{
public:
   explicit Reactor(std::unique_ptr<IoBackend> backend);

   Reactor(Reactor const&)            = delete;
   Reactor& operator=(Reactor const&) = delete;

   /**
    * @brief Record the request and forward it to the backend
    */
   IoFuture submit_operation(IoOperation operation);

   /**
    * @brief Deliver available completions, then drop entries of dropped futures
    * @return Number of futures resolved
    */
   std::size_t poll();

   /**
    * @brief Requests still tracked (diagnostic)
    */
   [[nodiscard]] std::size_t pending_count() const;

   [[nodiscard]] IoBackend& backend() noexcept { return *io_backend; }

private:
   std::unique_ptr<IoBackend> io_backend;

   mutable Spinlock lock;
   std::unordered_map<std::uint64_t, std::weak_ptr<detail::IoState>> in_flight;
};

} // namespace kasync::io

#endif // KASYNC_REACTOR_HPP
