#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ixb {

  enum class error_kind {
    tag_mismatch,
    unknown_element,
    invalid_decimal,
    missing_attribute,
    malformed_date_container,
    unsupported_date_format,
    malformed_indicator,
    validation_failed,
  };

  inline std::string_view
  to_string(error_kind kind) {
    switch (kind) {
      case error_kind::tag_mismatch:
        return "tag mismatch";
      case error_kind::unknown_element:
        return "unknown element";
      case error_kind::invalid_decimal:
        return "invalid decimal";
      case error_kind::missing_attribute:
        return "missing attribute";
      case error_kind::malformed_date_container:
        return "malformed date container";
      case error_kind::unsupported_date_format:
        return "unsupported date format";
      case error_kind::malformed_indicator:
        return "malformed indicator";
      case error_kind::validation_failed:
        return "validation failed";
    }
    return "unknown error";
  }

  // Raised by the element codec and by document serialization. subject() is
  // the offending tag, attribute, or text so the caller can pinpoint the
  // schema violation without re-parsing.
  class binding_error : public std::runtime_error {
    error_kind kind_;
    std::string subject_;

  public:
    binding_error(error_kind kind, std::string subject,
                  const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message),
          kind_(kind), subject_(std::move(subject)) {}

    error_kind
    kind() const {
      return kind_;
    }

    const std::string&
    subject() const {
      return subject_;
    }
  };

} // namespace ixb
