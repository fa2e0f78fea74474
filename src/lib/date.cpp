#include <ixb/date.hpp>

#include <stdexcept>

namespace ixb {

  namespace {

    bool
    is_leap_year(int32_t year) {
      return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    uint8_t
    days_in_month(int32_t year, uint8_t month) {
      static constexpr uint8_t table[] = {0,  31, 28, 31, 30, 31, 30,
                                          31, 31, 30, 31, 30, 31};
      if (month == 2 && is_leap_year(year)) { return 29; }
      return table[month];
    }

    // Parse exactly `count` digits starting at pos.
    int32_t
    parse_fixed_digits(std::string_view str, std::size_t pos,
                       std::size_t count) {
      if (pos + count > str.size()) {
        throw std::invalid_argument("date: insufficient digits in '" +
                                    std::string(str) + "'");
      }
      int32_t value = 0;
      for (std::size_t i = pos; i < pos + count; ++i) {
        if (str[i] < '0' || str[i] > '9') {
          throw std::invalid_argument("date: invalid character in '" +
                                      std::string(str) + "'");
        }
        value = value * 10 + (str[i] - '0');
      }
      return value;
    }

    void
    check_range(int32_t year, int32_t month, int32_t day) {
      if (year < 0 || year > 9999) {
        throw std::invalid_argument("date: year out of range");
      }
      if (month < 1 || month > 12) {
        throw std::invalid_argument("date: month out of range");
      }
      if (day < 1 ||
          day > days_in_month(year, static_cast<uint8_t>(month))) {
        throw std::invalid_argument("date: day out of range");
      }
    }

    void
    append_padded(std::string& out, int32_t value, std::size_t width) {
      std::string digits = std::to_string(value);
      if (digits.size() < width) { out.append(width - digits.size(), '0'); }
      out += digits;
    }

  } // namespace

  date::date(int32_t year, uint8_t month, uint8_t day)
      : year_(year), month_(month), day_(day) {
    check_range(year, month, day);
  }

  date
  date::from_basic(std::string_view str) {
    if (str.size() != 8) {
      throw std::invalid_argument("date: expected YYYYMMDD, got '" +
                                  std::string(str) + "'");
    }
    int32_t year = parse_fixed_digits(str, 0, 4);
    int32_t month = parse_fixed_digits(str, 4, 2);
    int32_t day = parse_fixed_digits(str, 6, 2);
    check_range(year, month, day);
    return date(year, static_cast<uint8_t>(month), static_cast<uint8_t>(day));
  }

  std::string
  date::to_string() const {
    std::string result;
    append_padded(result, year_, 4);
    result += '-';
    append_padded(result, month_, 2);
    result += '-';
    append_padded(result, day_, 2);
    return result;
  }

  std::string
  date::to_basic_string() const {
    std::string result;
    append_padded(result, year_, 4);
    append_padded(result, month_, 2);
    append_padded(result, day_, 2);
    return result;
  }

  int32_t
  date::year() const {
    return year_;
  }

  uint8_t
  date::month() const {
    return month_;
  }

  uint8_t
  date::day() const {
    return day_;
  }

} // namespace ixb
