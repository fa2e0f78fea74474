#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace ixb {

  // Exact decimal of any length, held as its digit string, a sign, and the
  // number of fractional digits as written. "100.00" renders back as
  // "100.00", while equality is numeric ("12.50" == "12.5").
  class decimal {
    bool negative_ = false;
    // Coefficient digits without leading zeros; "0" for zero.
    std::string digits_ = "0";
    std::size_t scale_ = 0;

  public:
    decimal() = default;
    explicit decimal(std::string_view str);

    std::string
    to_string() const;

    bool
    operator==(const decimal& other) const;

    friend std::ostream&
    operator<<(std::ostream& os, const decimal& d) {
      return os << d.to_string();
    }
  };

} // namespace ixb
