/**
 * @file reactor.cpp
 * @brief Request table, completion delivery and the abandoned-entry sweep
 */

#include "kasync/reactor.hpp"

#include "DEBUG_PRINT.hpp"

#include <cassert>
#include <iterator>

namespace kasync::io
{

RequestId RequestId::next() noexcept
{
   static std::atomic<std::uint64_t> counter{1};
   return RequestId{counter.fetch_add(1, std::memory_order_relaxed)};
}

const char* operation_name(IoOperation const& op) noexcept
{
   static constexpr const char* names[] = {
      "read", "write", "connect", "accept", "send", "send_to", "recv", "recv_from",
   };
   static_assert(std::size(names) == std::variant_size_v<IoOperation>);
   return names[op.index()];
}

static void resolve(detail::IoState& state, Completion completion)
{
   Waker to_wake;
   {
      SpinlockGuard guard(state.lock);
      assert(!state.result && "Request completed twice");
      state.result.emplace(std::move(completion));
      to_wake = std::move(state.waker);
   }
   to_wake.wake();
}

/* ============================================================================
 * IoFuture
 * ========================================================================= */

IoFuture IoFuture::from_error(Error error)
{
   auto state = std::make_shared<detail::IoState>();
   state->result.emplace(std::move(error));
   return IoFuture(RequestId::next(), std::move(state));
}

Poll<IoFuture::Output> IoFuture::poll(Context& cx)
{
   assert(state && "IoFuture polled after completion");

   std::optional<Completion> completion;
   {
      SpinlockGuard guard(state->lock);
      if (!state->result) {
         if (!state->waker.will_wake(cx.waker())) state->waker = cx.waker();
         return pending;
      }
      completion = std::move(state->result);
   }
   state.reset();

   if (auto* error = std::get_if<Error>(&*completion)) {
      return Output::err(std::move(*error));
   }
   return Output::ok(std::move(*completion));
}

/* ============================================================================
 * Reactor
 * ========================================================================= */

Reactor::Reactor(std::unique_ptr<IoBackend> backend)
   : io_backend(std::move(backend))
{
   assert(io_backend && "Reactor needs a backend");
}

IoFuture Reactor::submit_operation(IoOperation operation)
{
   const auto id = RequestId::next();
   auto state = std::make_shared<detail::IoState>();

   // Tracked before the backend sees it: a synchronous backend may already
   // have the completion queued when submit() returns
   {
      SpinlockGuard guard(lock);
      in_flight.emplace(id.value, state);
   }

   LOG_REACTOR("submit #%llu (%s)", static_cast<unsigned long long>(id.value), operation_name(operation));
   io_backend->submit(id, std::move(operation));
   return IoFuture(id, std::move(state));
}

std::size_t Reactor::poll()
{
   auto completions = io_backend->poll();

   std::vector<std::pair<std::shared_ptr<detail::IoState>, Completion>> deliveries;
   deliveries.reserve(completions.size());
   {
      SpinlockGuard guard(lock);

      for (auto& [id, completion] : completions) {
         auto it = in_flight.find(id.value);
         if (it == in_flight.end()) continue;  // Unknown or already completed: at most one completion per id

         auto state = it->second.lock();
         in_flight.erase(it);
         if (state) deliveries.emplace_back(std::move(state), std::move(completion));
      }

      // Entries whose future was dropped before completion
      std::erase_if(in_flight, [](auto const& entry) { return entry.second.expired(); });
   }

   // Resolve outside the table lock; waking may run arbitrary executor code
   for (auto& [state, completion] : deliveries) {
      resolve(*state, std::move(completion));
   }

   if (!deliveries.empty()) {
      LOG_REACTOR("delivered %zu completion(s), %zu still pending", deliveries.size(), pending_count());
   }
   return deliveries.size();
}

std::size_t Reactor::pending_count() const
{
   SpinlockGuard guard(lock);
   return in_flight.size();
}

} // namespace kasync::io
