#pragma once

#include <cstdint>

namespace cdsfi {

using int128  = __int128;
using uint128 = unsigned __int128;

static constexpr int128   HIGH_PRECISION    = 1'000'000'000'000'000'000;    // 10^18
static constexpr int128   LN2               = 693'147'180'559'945'309;      // ln(2) * 10^18
static constexpr uint64_t DAY_SECONDS       = 24 * 60 * 60;
static constexpr uint64_t YEAR_DAYS         = 365;
static constexpr uint64_t SECONDS_IN_YEAR   = 31'556'736;                   // 365.24 days

namespace math {

   struct uint256 {
      uint128 hi = 0;
      uint128 lo = 0;
   };

   inline uint256 mul_wide(uint128 a, uint128 b) {
      const uint128 mask = ~uint64_t(0);
      uint128 a0 = a & mask, a1 = a >> 64;
      uint128 b0 = b & mask, b1 = b >> 64;

      uint128 p00 = a0 * b0;
      uint128 p01 = a0 * b1;
      uint128 p10 = a1 * b0;
      uint128 p11 = a1 * b1;

      uint128 mid = (p00 >> 64) + (p01 & mask) + (p10 & mask);

      uint256 r;
      r.lo = (p00 & mask) | (mid << 64);
      r.hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
      return r;
   }

   // n / d with remainder; the quotient must fit in 128 bits (n.hi < d)
   inline uint128 div_wide(const uint256& n, uint128 d, uint128& rem) {
      if (n.hi == 0) {
         rem = n.lo % d;
         return n.lo / d;
      }
      uint128 q = 0;
      uint128 r = n.hi;
      for (int i = 127; i >= 0; --i) {
         bool carry = (r >> 127) != 0;
         r = (r << 1) | ((n.lo >> i) & 1);
         q <<= 1;
         if (carry || r >= d) {
            r -= d;
            q |= 1;
         }
      }
      rem = r;
      return q;
   }

   inline uint128 abs_u(int128 v) { return v < 0 ? uint128(-v) : uint128(v); }

   // a * b / c, truncated toward zero
   inline int128 mul_div(int128 a, int128 b, int128 c) {
      bool negative = (a < 0) ^ (b < 0) ^ (c < 0);
      uint128 rem = 0;
      uint128 q = div_wide(mul_wide(abs_u(a), abs_u(b)), abs_u(c), rem);
      return negative ? -int128(q) : int128(q);
   }

   // a * b / c, rounded away from zero
   inline int128 mul_div_up(int128 a, int128 b, int128 c) {
      bool negative = (a < 0) ^ (b < 0) ^ (c < 0);
      uint128 rem = 0;
      uint128 q = div_wide(mul_wide(abs_u(a), abs_u(b)), abs_u(c), rem);
      if (rem != 0) q += 1;
      return negative ? -int128(q) : int128(q);
   }

   /**
    * e^x with x and the result scaled by 10^18.
    *
    * x = k*ln2 + r with k = floor(x / ln2), r in [0, ln2). e^r comes from a Taylor
    * series whose terms are all truncated downwards, so the result never exceeds the
    * true value and is monotone non-decreasing in x, also across the k boundaries.
    * Valid for x <= 40 * 10^18; returns 0 once e^x drops below the last digit.
    */
   inline int128 exp18(int128 x) {
      int128 k = x / LN2;
      if (x < 0 && x % LN2 != 0) --k;
      if (k <= -64) return 0;

      int128 r    = x - k * LN2;
      int128 term = HIGH_PRECISION;
      int128 sum  = HIGH_PRECISION;
      for (int i = 1; i < 40 && term != 0; ++i) {
         term = term * r / (HIGH_PRECISION * i);
         sum += term;
      }
      return k >= 0 ? sum << int(k) : sum >> int(-k);
   }

   // ln(x) for x > 0, scaled by 10^18 (atanh series on the mantissa in [1, 2))
   inline int128 ln18(int128 x) {
      int128 k = 0;
      int128 m = x;
      while (m < HIGH_PRECISION) { m <<= 1; --k; }
      while (m >= 2 * HIGH_PRECISION) { m >>= 1; ++k; }

      int128 z    = (m - HIGH_PRECISION) * HIGH_PRECISION / (m + HIGH_PRECISION);
      int128 z2   = z * z / HIGH_PRECISION;
      int128 term = z;
      int128 sum  = 0;
      for (int n = 1; term != 0; n += 2) {
         sum += term / n;
         term = term * z2 / HIGH_PRECISION;
      }
      return 2 * sum + k * LN2;
   }

} // namespace math

} // namespace cdsfi
