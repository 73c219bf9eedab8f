#pragma once

#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <locale>
#include <string>
#include <string_view>

namespace upecho::text {

// UTF-8 locale for case mapping, generated once per process.
inline const std::locale &Utf8Locale() {
  static const std::locale loc = boost::locale::generator{}("en_US.UTF-8");
  return loc;
}

// Full Unicode uppercase: "straße" becomes "STRASSE", so the result may be
// longer than the input.
inline std::string ToUpper(std::string_view s) {
  return boost::locale::to_upper(s.data(), s.data() + s.size(),
                                 Utf8Locale());
}

} // namespace upecho::text
