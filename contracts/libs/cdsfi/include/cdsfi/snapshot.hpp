#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

namespace cdsfi {

// value a balance (or the total supply) had when snapshot `snapshot_id` was taken
struct checkpoint {
   uint64_t    snapshot_id  = 0;
   int64_t     value        = 0;
};

/**
 * Call before changing a balance. The first change after a snapshot records the value
 * held at that snapshot; later changes within the same snapshot leave it alone.
 */
inline void update_checkpoints(std::vector<checkpoint>& points,
                               uint64_t current_snapshot_id,
                               int64_t current_value) {
   if (current_snapshot_id == 0) return;
   if (points.empty() || points.back().snapshot_id < current_snapshot_id)
      points.push_back({current_snapshot_id, current_value});
}

// first checkpoint at or after snapshot_id, or the live value when nothing changed since
inline int64_t value_at(const std::vector<checkpoint>& points,
                        uint64_t snapshot_id,
                        int64_t current_value) {
   auto itr = std::lower_bound(points.begin(), points.end(), snapshot_id,
      [](const checkpoint& p, uint64_t id) { return p.snapshot_id < id; });
   return itr == points.end() ? current_value : itr->value;
}

} // namespace cdsfi
