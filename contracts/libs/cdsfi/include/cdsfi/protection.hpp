#pragma once

#include <algorithm>

#include <cdsfi/accrued_premium.hpp>
#include <cdsfi/errors.hpp>
#include <cdsfi/pool_params.hpp>

namespace cdsfi {

struct protection_terms {
   uint64_t    started_at     = 0;
   uint64_t    duration_sec   = 0;
   int128      k              = 0;
   int128      lambda         = 0;

   uint64_t expires_at() const { return started_at + duration_sec; }
};

inline err check_protection_duration(uint64_t duration_sec,
                                     uint64_t now,
                                     uint64_t next_cycle_end_at,
                                     const pool_params& params) {
   if (duration_sec < params.min_protection_duration_sec) return err::DURATION_TOO_SHORT;
   if (now + duration_sec > next_cycle_end_at)            return err::DURATION_TOO_LONG;
   return err::NONE;
}

// renewal needs an earlier protection on the same position that ended at most
// renewal_grace_sec ago
inline err check_protection_renewal(bool found, uint64_t expires_at, uint64_t now, const pool_params& params) {
   if (!found) return err::RENEWAL_NOT_FOUND;
   if (now > expires_at + params.renewal_grace_sec) return err::RENEWAL_WINDOW_CLOSED;
   return err::NONE;
}

/**
 * Premium a protection earned between last_accrued_at and now, clipped to its lifetime.
 * `expired` is set once now has reached the end of the protection.
 */
inline int128 calc_protection_accrual(const protection_terms& terms,
                                      uint64_t last_accrued_at,
                                      uint64_t now,
                                      bool& expired) {
   uint64_t from = std::max(last_accrued_at, terms.started_at);
   uint64_t to   = std::min(now, terms.expires_at());
   expired       = now >= terms.expires_at();

   if (to <= from) return 0;
   return calc_accrued_premium(from - terms.started_at, to - terms.started_at, terms.k, terms.lambda);
}

} // namespace cdsfi
