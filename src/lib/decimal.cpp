#include <ixb/decimal.hpp>

#include <stdexcept>
#include <string>

namespace ixb {

  namespace {

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    struct normalized {
      std::string_view digits;
      std::size_t scale;
    };

    // Drop trailing fractional zeros so equal values compare equal.
    normalized
    normalize(std::string_view digits, std::size_t scale) {
      while (scale > 0 && digits.size() > 1 && digits.back() == '0') {
        digits.remove_suffix(1);
        --scale;
      }
      if (digits == "0") { scale = 0; }
      return {digits, scale};
    }

  } // namespace

  decimal::decimal(std::string_view str) {
    // xs:decimal has whitespace="collapse"
    while (!str.empty() && is_space(str.front())) {
      str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
      str.remove_suffix(1);
    }
    if (str.empty()) { throw std::invalid_argument("decimal: empty string"); }

    std::size_t pos = 0;
    bool negative = false;
    if (str[0] == '-' || str[0] == '+') {
      negative = str[0] == '-';
      ++pos;
    }

    std::string digits;
    std::size_t scale = 0;
    bool seen_point = false;

    for (; pos < str.size(); ++pos) {
      char c = str[pos];
      if (c == '.') {
        if (seen_point) {
          throw std::invalid_argument("decimal: multiple decimal points in '" +
                                      std::string(str) + "'");
        }
        seen_point = true;
        continue;
      }
      if (c < '0' || c > '9') {
        throw std::invalid_argument("decimal: invalid character in '" +
                                    std::string(str) + "'");
      }
      digits += c;
      if (seen_point) { ++scale; }
    }

    if (digits.empty()) {
      throw std::invalid_argument("decimal: no digits in '" + std::string(str) +
                                  "'");
    }

    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
      digits_ = "0";
      negative_ = false;
    } else {
      digits_ = digits.substr(first);
      negative_ = negative;
    }
    scale_ = scale;
  }

  std::string
  decimal::to_string() const {
    std::string result = digits_;
    if (scale_ > 0) {
      if (result.size() <= scale_) {
        result.insert(0, scale_ - result.size() + 1, '0');
      }
      result.insert(result.size() - scale_, 1, '.');
    }
    if (negative_) { result.insert(0, 1, '-'); }
    return result;
  }

  bool
  decimal::operator==(const decimal& other) const {
    auto a = normalize(digits_, scale_);
    auto b = normalize(other.digits_, other.scale_);
    return negative_ == other.negative_ && a.digits == b.digits &&
           a.scale == b.scale;
  }

} // namespace ixb
