/**
 * @file mmio.hpp
 * @brief Interrupt-driven device events as futures
 *
 * A device driver implements MmioEventHandler, usually on top of an
 * MmioWakerSet that its interrupt handler drains. An MmioEvent registers
 * with the driver on its first poll and resolves once the driver fires it.
 *
 * Usage:
 *   class Uart : public MmioEventHandler
 *   {
 *      MmioWakerSet rx_waiters;
 *      bool register_event(MmioEventId id, Waker w) override { return rx_waiters.register_waker(id, std::move(w)); }
 *      bool cancel_event(MmioEventId id) override { return rx_waiters.cancel(id); }
 *      // IRQ handler: rx_waiters.wake_matching([](MmioEventId) { return true; });
 *   };
 *
 *   auto id = executor.block_on(MmioEvent(uart));
 */

#ifndef KASYNC_MMIO_HPP
#define KASYNC_MMIO_HPP

#include "kasync/future.hpp"
#include "kasync/kernel.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace kasync
{

using MmioEventId = std::uint64_t;

/**
 * @brief Driver side of an MMIO event
 */
class MmioEventHandler
{
public:
   virtual ~MmioEventHandler() = default;

   /**
    * @brief Arrange for waker to be woken when the event fires
    * @return false if the event cannot be armed
    */
   virtual bool register_event(MmioEventId id, Waker waker) = 0;

   /**
    * @brief Withdraw a registration that has not fired
    */
   virtual bool cancel_event(MmioEventId id) = 0;
};

/**
 * @brief Interrupt-safe map from event id to the waker waiting for it
 */
class MmioWakerSet
{
public:
   MmioWakerSet() = default;
   MmioWakerSet(MmioWakerSet const&)            = delete;
   MmioWakerSet& operator=(MmioWakerSet const&) = delete;

   /**
    * @brief Store (or replace) the waker for id
    */
   bool register_waker(MmioEventId id, Waker waker);

   bool cancel(MmioEventId id);

   /**
    * @brief Remove and wake the waker for id
    * @return false if nothing was registered for id
    */
   bool wake_event(MmioEventId id);

   /**
    * @brief Remove and wake every waker whose id satisfies predicate
    * @return Number of wakers woken
    */
   std::size_t wake_matching(std::function<bool(MmioEventId)> const& predicate);

   [[nodiscard]] std::size_t len() const;

private:
   mutable Spinlock lock;
   std::map<MmioEventId, Waker> wakers;
};

/**
 * @brief Future resolving to its event id once the driver fires it
 *
 * A registration that failed resolves immediately. Dropping the future
 * before it fires cancels the registration with the driver.
 */
class MmioEvent
{
public:
   using Output = MmioEventId;

   explicit MmioEvent(std::shared_ptr<MmioEventHandler> handler);

   MmioEvent(MmioEvent&& other) noexcept;
   MmioEvent& operator=(MmioEvent&&)      = delete;
   MmioEvent(MmioEvent const&)            = delete;
   MmioEvent& operator=(MmioEvent const&) = delete;

   ~MmioEvent();

   Poll<Output> poll(Context& cx);

   [[nodiscard]] MmioEventId event_id() const noexcept { return id; }

private:
   // The waker handed to the driver: records the firing, then forwards it
   struct Signal final : Wakeable
   {
      std::atomic<bool> fired{false};
      Spinlock lock;
      Waker task;

      void wake() override;
   };

   std::shared_ptr<MmioEventHandler> handler;
   std::shared_ptr<Signal> signal;
   MmioEventId id;
   bool registered{false};
   bool completed{false};
};

} // namespace kasync

#endif // KASYNC_MMIO_HPP
