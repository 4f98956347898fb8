#pragma once

#include <cstdint>

namespace cdsfi {

enum class cycle_state: uint8_t {
   None     = 0,
   Open     = 1,
   Locked   = 2
};

struct pool_cycle {
   uint64_t    index        = 0;
   uint64_t    started_at   = 0;    // seconds
   uint8_t     state        = 0;    // cycle_state
};

inline void start_pool_cycle(pool_cycle& cycle, uint64_t now) {
   cycle.index      = 1;
   cycle.started_at = now;
   cycle.state      = uint8_t(cycle_state::Open);
}

// Moves the cycle forward to `now`. A cycle stays open for open_duration_sec and then
// locks until cycle_duration_sec has passed; whole elapsed cycles are skipped at once.
inline cycle_state refresh_pool_cycle(pool_cycle& cycle,
                                      uint64_t open_duration_sec,
                                      uint64_t cycle_duration_sec,
                                      uint64_t now) {
   if (cycle.index == 0 || cycle_duration_sec == 0 || now < cycle.started_at)
      return cycle_state(cycle.state);

   uint64_t elapsed = now - cycle.started_at;
   if (elapsed >= cycle_duration_sec) {
      uint64_t passed   = elapsed / cycle_duration_sec;
      cycle.index      += passed;
      cycle.started_at += passed * cycle_duration_sec;
      elapsed          -= passed * cycle_duration_sec;
   }
   cycle.state = uint8_t(elapsed < open_duration_sec ? cycle_state::Open : cycle_state::Locked);
   return cycle_state(cycle.state);
}

// protections may not outlive the end of the next cycle
inline uint64_t next_cycle_end(const pool_cycle& cycle, uint64_t cycle_duration_sec) {
   return cycle.started_at + 2 * cycle_duration_sec;
}

// a withdrawal requested during cycle n becomes available in cycle n + 2
inline uint64_t withdrawal_cycle_index(const pool_cycle& cycle) {
   return cycle.index + 2;
}

} // namespace cdsfi
