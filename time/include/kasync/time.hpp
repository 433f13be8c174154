/**
* @file time.hpp
* @brief Monotonic time types
*
* Time is measured in port ticks (kasync_port_time_freq_hz() per second).
* The runtime never looks at wall-clock time; everything is deadline
* arithmetic on these values.
*/

#ifndef KASYNC_TIME_HPP
#define KASYNC_TIME_HPP

#include <cstdint>
#include <limits>

namespace kasync
{

/**
* @brief Monotonic time point (in port ticks)
*/
struct TimePoint
{
   uint64_t value{0};

   constexpr TimePoint() = default;
   constexpr explicit TimePoint(uint64_t v) : value(v) {}

   constexpr bool operator==(TimePoint rhs) const { return value == rhs.value; }
   constexpr bool operator!=(TimePoint rhs) const { return value != rhs.value; }
   constexpr bool operator< (TimePoint rhs) const { return value <  rhs.value; }
   constexpr bool operator<=(TimePoint rhs) const { return value <= rhs.value; }
   constexpr bool operator> (TimePoint rhs) const { return value >  rhs.value; }
   constexpr bool operator>=(TimePoint rhs) const { return value >= rhs.value; }

   static constexpr TimePoint max()
   {
      return TimePoint{std::numeric_limits<uint64_t>::max()};
   }
};

/**
* @brief Span of time in port ticks
*/
struct Duration
{
   uint64_t value{0};

   constexpr Duration() = default;
   constexpr explicit Duration(uint64_t v) : value(v) {}

   /**
   * @brief Convert from real units at the port's tick rate (rounded up)
   */
   static Duration from_secs(uint64_t s);
   static Duration from_millis(uint64_t ms);
   static Duration from_micros(uint64_t us);

   [[nodiscard]] uint64_t as_millis() const;

   constexpr Duration operator+(Duration rhs) const { return Duration{value + rhs.value}; }

   constexpr bool operator==(Duration rhs) const { return value == rhs.value; }
   constexpr bool operator< (Duration rhs) const { return value <  rhs.value; }
};

// Saturating: a deadline never wraps past TimePoint::max()
constexpr TimePoint operator+(TimePoint tp, Duration d)
{
   return (d.value > std::numeric_limits<uint64_t>::max() - tp.value) ? TimePoint::max() : TimePoint{tp.value + d.value};
}

constexpr Duration operator-(TimePoint a, TimePoint b)
{
   return Duration{a.value > b.value ? a.value - b.value : 0};
}

/**
* @brief Current monotonic time from the port clock
*/
[[nodiscard]] TimePoint now();

} // namespace kasync

#endif // KASYNC_TIME_HPP
