#pragma once

#include <boost/locale/utf.hpp>
#include <string_view>

namespace upecho::wire {

// Strict UTF-8 check: overlong forms, UTF-16 surrogates, code points above
// U+10FFFF and sequences cut short all fail.
inline bool IsValidUtf8(std::string_view s) {
  using traits = boost::locale::utf::utf_traits<char>;
  auto p = s.begin();
  while (p != s.end()) {
    const auto cp = traits::decode(p, s.end());
    if (cp == boost::locale::utf::illegal ||
        cp == boost::locale::utf::incomplete) {
      return false;
    }
  }
  return true;
}

} // namespace upecho::wire
