#pragma once

#include <ixb/date.hpp>
#include <ixb/decimal.hpp>
#include <ixb/qname.hpp>
#include <ixb/xml_node.hpp>

#include <stdexcept>
#include <string>
#include <variant>

namespace ixb {

  // ===== leaf payloads =====

  struct text_value {
    std::string text;

    bool
    operator==(const text_value&) const = default;
  };

  struct decimal_value {
    decimal value;

    bool
    operator==(const decimal_value&) const = default;
  };

  struct quantity {
    decimal amount;
    std::string unit_code;

    bool
    operator==(const quantity&) const = default;
  };

  struct currency_amount {
    decimal amount;
    std::string currency = "EUR";

    bool
    operator==(const currency_amount&) const = default;
  };

  // Code from a published code list, e.g. a product classification.
  struct classification {
    std::string text;
    std::string list_id;
    std::string list_version_id;

    bool
    operator==(const classification&) const = default;
  };

  struct agency_code {
    std::string text;
    std::string scheme_agency_id;

    bool
    operator==(const agency_code&) const = default;
  };

  // Identifier qualified by an identification scheme (GLN, VAT, ...).
  struct identifier {
    std::string text;
    std::string scheme_id;

    bool
    operator==(const identifier&) const = default;
  };

  inline constexpr std::string_view date_format_102 = "102";

  struct date_value {
    date value;
    std::string format_code = std::string(date_format_102);

    bool
    operator==(const date_value&) const = default;
  };

  struct indicator {
    bool value = false;

    bool
    operator==(const indicator&) const = default;
  };

  using leaf_value =
      std::variant<text_value, decimal_value, quantity, currency_amount,
                   classification, agency_code, identifier, date_value,
                   indicator>;

  // Human-readable form of a payload, e.g. "12.50 KGM".
  std::string
  to_string(const leaf_value& value);

  // ===== leaf =====

  // A terminal element: its own tag plus one typed payload. The payload
  // alternative fixes the wire shape (text, attributes, wrapper child).
  class leaf {
    qname tag_;
    leaf_value value_;

  public:
    leaf(qname tag, leaf_value value)
        : tag_(std::move(tag)), value_(std::move(value)) {}

    const qname&
    tag() const {
      return tag_;
    }

    const leaf_value&
    value() const {
      return value_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(value_);
    }

    template <typename T>
    const T&
    as() const {
      if (const T* p = std::get_if<T>(&value_)) { return *p; }
      throw std::invalid_argument("leaf " + tag_.to_string() +
                                  " holds a different value type");
    }

    template <typename T>
    T&
    as() {
      if (T* p = std::get_if<T>(&value_)) { return *p; }
      throw std::invalid_argument("leaf " + tag_.to_string() +
                                  " holds a different value type");
    }

    // Replace the payload. The new payload must be the same alternative, so
    // the leaf keeps the wire shape its field declared.
    void
    assign(leaf_value value);

    xml_node
    encode() const;

    leaf&
    decode(const xml_node& node);

    std::string
    to_string() const {
      return ixb::to_string(value_);
    }

    bool
    operator==(const leaf&) const = default;
  };

} // namespace ixb
