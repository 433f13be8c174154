/**
 * @file backends.cpp
 * @brief Synchronous device and loopback reactor backends
 */

#include "kasync/backends.hpp"

#include "DEBUG_PRINT.hpp"

#include <algorithm>
#include <type_traits>

namespace kasync::io
{

/* ============================================================================
 * SyncDeviceBackend
 * ========================================================================= */

// Receive up to len bytes into a right-sized buffer
template<typename Done>
static Completion receive_into(DeviceSocket& socket, std::size_t len)
{
   std::vector<std::uint8_t> bytes(len);
   auto received = socket.recv(bytes);
   if (received.is_err()) return std::move(received).error();
   bytes.resize(received.value());
   return Done{std::move(bytes)};
}

Completion SyncDeviceBackend::execute(IoOperation& operation)
{
   return std::visit([](auto& op) -> Completion {
      using Op = std::decay_t<decltype(op)>;

      if (!op.socket) return Error(ErrorKind::InvalidInput, "operation has no socket");
      DeviceSocket& socket = *op.socket;

      if constexpr (std::is_same_v<Op, ReadOp>) {
         return receive_into<ReadDone>(socket, op.len);
      } else if constexpr (std::is_same_v<Op, RecvOp>) {
         return receive_into<RecvDone>(socket, op.len);
      } else if constexpr (std::is_same_v<Op, WriteOp>) {
         auto sent = socket.send(op.data);
         if (sent.is_err()) return std::move(sent).error();
         return WriteDone{sent.value()};
      } else if constexpr (std::is_same_v<Op, SendOp>) {
         auto sent = socket.send(op.data);
         if (sent.is_err()) return std::move(sent).error();
         return SendDone{sent.value()};
      } else if constexpr (std::is_same_v<Op, SendToOp>) {
         auto sent = socket.send_to(op.data, op.addr);
         if (sent.is_err()) return std::move(sent).error();
         return SendToDone{sent.value()};
      } else if constexpr (std::is_same_v<Op, ConnectOp>) {
         auto connected = socket.connect(op.addr);
         if (connected.is_err()) return std::move(connected).error();
         return ConnectDone{};
      } else if constexpr (std::is_same_v<Op, AcceptOp>) {
         auto accepted = socket.accept();
         if (accepted.is_err()) return std::move(accepted).error();
         return AcceptDone{std::move(accepted).value()};
      } else {
         static_assert(std::is_same_v<Op, RecvFromOp>, "Unhandled I/O operation");
         std::vector<std::uint8_t> bytes(op.len);
         auto received = socket.recv_from(bytes);
         if (received.is_err()) return std::move(received).error();
         auto [n, from] = received.value();
         bytes.resize(n);
         return RecvFromDone{std::move(bytes), from};
      }
   }, operation);
}

void SyncDeviceBackend::submit(RequestId id, IoOperation operation)
{
   auto completion = execute(operation);

   if (auto const* error = std::get_if<Error>(&completion)) {
      LOG_REACTOR("#%llu %s failed: %s", static_cast<unsigned long long>(id.value),
                  operation_name(operation), error->to_string().c_str());
   }

   SpinlockGuard guard(lock);
   ready.emplace_back(id, std::move(completion));
}

IoBackend::CompletionList SyncDeviceBackend::poll()
{
   CompletionList drained;
   SpinlockGuard guard(lock);
   drained.swap(ready);
   return drained;
}

/* ============================================================================
 * LoopbackBackend
 * ========================================================================= */

void LoopbackBackend::submit(RequestId id, IoOperation operation)
{
   if (responder) {
      auto completion = responder(operation);
      SpinlockGuard guard(lock);
      ++submissions;
      ready.emplace_back(id, std::move(completion));
      return;
   }

   SpinlockGuard guard(lock);
   ++submissions;
   in_flight.emplace_back(id, std::move(operation));
}

IoBackend::CompletionList LoopbackBackend::poll()
{
   CompletionList drained;
   SpinlockGuard guard(lock);
   drained.swap(ready);
   return drained;
}

bool LoopbackBackend::complete(RequestId id, Completion completion)
{
   IoOperation finished;
   {
      SpinlockGuard guard(lock);
      auto it = std::find_if(in_flight.begin(), in_flight.end(), [id](auto const& entry) { return entry.first == id; });
      if (it == in_flight.end()) return false;

      finished = std::move(it->second);
      in_flight.erase(it);
      ready.emplace_back(id, std::move(completion));
   }
   // The operation's socket reference is released outside the lock
   return true;
}

std::optional<RequestId> LoopbackBackend::oldest_outstanding() const
{
   SpinlockGuard guard(lock);
   if (in_flight.empty()) return std::nullopt;
   return in_flight.front().first;
}

std::size_t LoopbackBackend::outstanding() const
{
   SpinlockGuard guard(lock);
   return in_flight.size();
}

std::size_t LoopbackBackend::submitted_total() const
{
   SpinlockGuard guard(lock);
   return submissions;
}

} // namespace kasync::io
