#pragma once

#include <cstdint>
#include <string_view>

namespace cdsfi {

// decimal digits only, no sign, no overflow
inline bool parse_uint64(std::string_view str, uint64_t& value) {
   if (str.empty() || str.size() > 20) return false;
   uint64_t v = 0;
   for (char c : str) {
      if (c < '0' || c > '9') return false;
      uint64_t digit = uint64_t(c - '0');
      if (v > (UINT64_MAX - digit) / 10) return false;
      v = v * 10 + digit;
   }
   value = v;
   return true;
}

} // namespace cdsfi
