#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace ixb {

  // Calendar date without timezone, years 0000-9999.
  class date {
    int32_t year_ = 1;
    uint8_t month_ = 1;
    uint8_t day_ = 1;

  public:
    date() = default;
    date(int32_t year, uint8_t month, uint8_t day);

    // Basic form "YYYYMMDD" (UN/CEFACT date format code 102).
    static date
    from_basic(std::string_view str);

    // Extended form "YYYY-MM-DD".
    std::string
    to_string() const;
    std::string
    to_basic_string() const;

    int32_t
    year() const;
    uint8_t
    month() const;
    uint8_t
    day() const;

    bool
    operator==(const date&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const date& d) {
      return os << d.to_string();
    }
  };

} // namespace ixb
