#pragma once

#include <cdsfi/lending_status.hpp>

namespace cdsfi {

struct default_config {
   uint32_t    confirm_payments        = 2;  // qualifying payments needed to leave Late
   uint32_t    default_missed_periods  = 3;  // missed periods until a late pool defaults
};

// status of one lending pool as tracked for one protection pool
struct lending_pool_state {
   uint8_t     status               = uint8_t(lending_pool_status::Active);
   uint32_t    confirmations        = 0;
   uint64_t    last_payment_seen_at = 0;
   uint64_t    late_at              = 0;
};

struct payment_observation {
   lending_pool_status  status             = lending_pool_status::NotSupported;
   uint64_t             last_payment_at    = 0;
   uint64_t             payment_period_sec = 0;
   uint64_t             late_grace_sec     = 0;
};

enum class state_effect: uint8_t {
   None     = 0,
   Lock     = 1,
   Unlock   = 2
};

inline err validate_default_config(const default_config& conf) {
   if (conf.confirm_payments == 0 || conf.default_missed_periods == 0)
      return err::PARAM_ERROR;
   return err::NONE;
}

inline lending_pool_state initial_lending_pool_state(const payment_observation& obs) {
   lending_pool_state state;
   state.status               = uint8_t(lending_pool_status::Active);
   state.last_payment_seen_at = obs.last_payment_at;
   return state;
}

inline bool is_default_overdue(const payment_observation& obs,
                               const default_config& conf,
                               uint64_t now) {
   uint64_t deadline = obs.last_payment_at
                     + obs.payment_period_sec * conf.default_missed_periods
                     + obs.late_grace_sec;
   return now > deadline;
}

/**
 * Advances `state` with the latest observation of its lending pool.
 *
 * Active and LateWithinGracePeriod follow the reported status; turning Late or Defaulted
 * from there locks capital. While locked, each advance of the last payment timestamp is a
 * qualifying payment: the first moves to UnderReview, and reaching confirm_payments
 * returns to Active and unlocks. Missing another payment while under review falls back
 * to Late without a new lock. Defaulted and Expired are final.
 */
inline state_effect next_lending_pool_state(lending_pool_state& state,
                                            const payment_observation& obs,
                                            const default_config& conf,
                                            uint64_t now) {
   const auto current = lending_pool_status(state.status);
   const auto reported = obs.status;

   switch (current) {
      case lending_pool_status::Defaulted:
      case lending_pool_status::Expired:
      case lending_pool_status::NotSupported:
         return state_effect::None;

      case lending_pool_status::Active:
      case lending_pool_status::LateWithinGracePeriod:
         state.last_payment_seen_at = obs.last_payment_at;
         switch (reported) {
            case lending_pool_status::Late:
               state.status        = uint8_t(lending_pool_status::Late);
               state.confirmations = 0;
               state.late_at       = now;
               return state_effect::Lock;
            case lending_pool_status::Defaulted:
               state.status = uint8_t(lending_pool_status::Defaulted);
               return state_effect::Lock;
            case lending_pool_status::Active:
            case lending_pool_status::LateWithinGracePeriod:
            case lending_pool_status::Expired:
               state.status = uint8_t(reported);
               return state_effect::None;
            default:
               return state_effect::None;
         }

      case lending_pool_status::Late:
      case lending_pool_status::UnderReview:
         if (reported == lending_pool_status::Defaulted) {
            state.status = uint8_t(lending_pool_status::Defaulted);
            return state_effect::None;
         }
         if (reported == lending_pool_status::Expired) {
            state.status = uint8_t(lending_pool_status::Expired);
            return state_effect::Unlock;
         }
         if (obs.last_payment_at > state.last_payment_seen_at) {
            state.last_payment_seen_at = obs.last_payment_at;
            state.confirmations       += 1;
            if (state.confirmations >= conf.confirm_payments) {
               state.status        = uint8_t(lending_pool_status::Active);
               state.confirmations = 0;
               state.late_at       = 0;
               return state_effect::Unlock;
            }
            state.status = uint8_t(lending_pool_status::UnderReview);
            return state_effect::None;
         }
         if (reported == lending_pool_status::Late) {
            if (is_default_overdue(obs, conf, now)) {
               state.status = uint8_t(lending_pool_status::Defaulted);
               return state_effect::None;
            }
            if (current == lending_pool_status::UnderReview) {
               state.status        = uint8_t(lending_pool_status::Late);
               state.confirmations = 0;
            }
         }
         return state_effect::None;
   }
   return state_effect::None;
}

} // namespace cdsfi
