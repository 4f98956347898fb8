#pragma once

#include <cstdint>

namespace cdsfi {

enum class err: uint8_t {
   NONE                          = 0,
   RECORD_NOT_FOUND              = 1,
   RECORD_EXISTING               = 2,
   SYMBOL_MISMATCH               = 3,
   CONTRACT_MISMATCH             = 4,
   PARAM_ERROR                   = 5,
   MEMO_FORMAT_ERROR             = 6,
   PAUSED                        = 7,
   NO_AUTH                       = 8,
   NOT_POSITIVE                  = 9,
   ACCOUNT_INVALID               = 10,
   ACTION_REDUNDANT              = 11,
   STATUS_ERROR                  = 12,
   OVERSIZED                     = 13,

   // protection admission
   LENDING_POOL_UNSUPPORTED      = 20,
   LENDING_POOL_LATE             = 21,
   LENDING_POOL_EXPIRED          = 22,
   LENDING_POOL_DEFAULTED        = 23,
   PURCHASE_WINDOW_CLOSED        = 24,
   PROTECTION_EXCEEDS_PRINCIPAL  = 25,
   DURATION_TOO_SHORT            = 26,
   DURATION_TOO_LONG             = 27,
   PREMIUM_EXCEEDS_MAX           = 28,
   RENEWAL_NOT_FOUND             = 29,
   RENEWAL_WINDOW_CLOSED         = 30,

   // pool economics
   LEVERAGE_TOO_HIGH             = 40,
   LEVERAGE_TOO_LOW              = 41,
   PHASE_MISMATCH                = 42,
   POOL_NOT_OPEN                 = 43,
   INSUFFICIENT_CAPITAL          = 44,
   INSUFFICIENT_BALANCE          = 45,
   WITHDRAWAL_NOT_REQUESTED      = 46,
   WITHDRAWAL_EXCEEDS_REQUEST    = 47,

   MATH_DOMAIN                   = 60,
   SYSTEM_ERROR                  = 200
};

} // namespace cdsfi
