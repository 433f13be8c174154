/**
* @file time.cpp
* @brief Port clock access and unit conversion
*/

#include "kasync/time.hpp"
#include "kasync/port.h"

namespace kasync
{

static uint64_t ticks_for(uint64_t amount, uint64_t per_second)
{
   const uint64_t hz = kasync_port_time_freq_hz();
   return (amount * hz + per_second - 1) / per_second;
}

Duration Duration::from_secs(uint64_t s)
{
   return Duration{s * kasync_port_time_freq_hz()};
}

Duration Duration::from_millis(uint64_t ms)
{
   return Duration{ticks_for(ms, 1'000)};
}

Duration Duration::from_micros(uint64_t us)
{
   return Duration{ticks_for(us, 1'000'000)};
}

uint64_t Duration::as_millis() const
{
   return value * 1'000 / kasync_port_time_freq_hz();
}

TimePoint now()
{
   return TimePoint{kasync_port_time_now()};
}

} // namespace kasync
