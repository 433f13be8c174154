/**
 * @file backends.hpp
 * @brief Reactor backends shipped with the runtime
 */

#ifndef KASYNC_BACKENDS_HPP
#define KASYNC_BACKENDS_HPP

#include "kasync/reactor.hpp"

#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace kasync::io
{

/**
 * @brief Runs each operation against its DeviceSocket inside submit()
 *
 * The result is queued and handed out by the next poll(), so the reactor's
 * submit-then-poll contract holds even though no work is deferred.
 */
class SyncDeviceBackend final : public IoBackend
{
public:
   void submit(RequestId id, IoOperation operation) override;
   CompletionList poll() override;

   /**
    * @brief Execute one operation synchronously
    */
   static Completion execute(IoOperation& operation);

private:
   Spinlock lock;
   CompletionList ready;
};

/**
 * @brief Pure software backend
 *
 * Without a responder, operations stay outstanding until complete() is
 * called for their id. With a responder, every submission is answered
 * immediately with whatever the responder returns.
 */
class LoopbackBackend final : public IoBackend
{
public:
   using Responder = std::function<Completion(IoOperation const&)>;

   LoopbackBackend() = default;
   explicit LoopbackBackend(Responder responder) : responder(std::move(responder)) {}

   void submit(RequestId id, IoOperation operation) override;
   CompletionList poll() override;

   /**
    * @brief Answer an outstanding request
    * @return false if no such request is outstanding
    */
   bool complete(RequestId id, Completion completion);

   /**
    * @brief Oldest outstanding request, if any
    */
   [[nodiscard]] std::optional<RequestId> oldest_outstanding() const;

   [[nodiscard]] std::size_t outstanding() const;
   [[nodiscard]] std::size_t submitted_total() const;

private:
   Responder responder;

   mutable Spinlock lock;
   std::deque<std::pair<RequestId, IoOperation>> in_flight;
   CompletionList ready;
   std::size_t submissions{0};
};

} // namespace kasync::io

#endif // KASYNC_BACKENDS_HPP
