#include <ixb/binding_error.hpp>
#include <ixb/leaf.hpp>
#include <ixb/namespaces.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace ixb {

  namespace {

    template <typename>
    inline constexpr bool always_false = false;

    qname
    udt(std::string local_name) {
      return qname{std::string(ns_udt), std::move(local_name)};
    }

    decimal
    decode_decimal(const xml_node& node) {
      std::string text = node.text().value_or("");
      try {
        return decimal(text);
      } catch (const std::invalid_argument& e) {
        throw binding_error(error_kind::invalid_decimal, text,
                            node.name().to_string() + ": " + e.what());
      }
    }

    std::string
    require_attribute(const xml_node& node, std::string_view name) {
      auto value = node.attribute(name);
      if (!value) {
        throw binding_error(error_kind::missing_attribute, std::string(name),
                            "attribute '" + std::string(name) +
                                "' required on " + node.name().to_string());
      }
      return std::string(*value);
    }

    // Date and indicator leaves wrap their value in exactly one udt child.
    const xml_node&
    single_wrapper_child(const xml_node& node, const qname& wrapper,
                         error_kind failure) {
      if (node.children().size() != 1) {
        throw binding_error(failure, node.name().to_string(),
                            node.name().to_string() +
                                " must have exactly one child, found " +
                                std::to_string(node.children().size()));
      }
      const xml_node& child = node.children().front();
      if (child.name() != wrapper) {
        throw binding_error(failure, child.name().to_string(),
                            "tag " + child.name().to_string() +
                                " not recognized in " +
                                node.name().to_string() + ", expected " +
                                wrapper.to_string());
      }
      return child;
    }

    date_value
    decode_date(const xml_node& node) {
      const xml_node& child = single_wrapper_child(
          node, udt("DateTimeString"), error_kind::malformed_date_container);

      std::string format = require_attribute(child, "format");
      if (format != date_format_102) {
        throw binding_error(error_kind::unsupported_date_format, format,
                            "date format " + format + " cannot be parsed");
      }

      std::string text = child.text().value_or("");
      try {
        return date_value{date::from_basic(text), format};
      } catch (const std::invalid_argument& e) {
        throw binding_error(error_kind::malformed_date_container, text,
                            node.name().to_string() + ": " + e.what());
      }
    }

    indicator
    decode_indicator(const xml_node& node) {
      const xml_node& child = single_wrapper_child(
          node, udt("Indicator"), error_kind::malformed_indicator);

      std::string text = child.text().value_or("");
      if (text == "true" || text == "1") { return indicator{true}; }
      if (text == "false" || text == "0") { return indicator{false}; }
      throw binding_error(error_kind::malformed_indicator, text,
                          "invalid indicator value '" + text + "' in " +
                              node.name().to_string());
    }

  } // namespace

  std::string
  to_string(const leaf_value& value) {
    return std::visit(
        [](const auto& v) -> std::string {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, text_value>) {
            return v.text;
          } else if constexpr (std::is_same_v<T, decimal_value>) {
            return v.value.to_string();
          } else if constexpr (std::is_same_v<T, quantity>) {
            return v.amount.to_string() + " " + v.unit_code;
          } else if constexpr (std::is_same_v<T, currency_amount>) {
            return v.amount.to_string() + " " + v.currency;
          } else if constexpr (std::is_same_v<T, classification>) {
            return v.text + " (" + v.list_id + " " + v.list_version_id + ")";
          } else if constexpr (std::is_same_v<T, agency_code>) {
            return v.text + " (" + v.scheme_agency_id + ")";
          } else if constexpr (std::is_same_v<T, identifier>) {
            return v.text + " (" + v.scheme_id + ")";
          } else if constexpr (std::is_same_v<T, date_value>) {
            return v.value.to_string();
          } else if constexpr (std::is_same_v<T, indicator>) {
            return v.value ? "true" : "false";
          } else {
            static_assert(always_false<T>, "unhandled leaf value");
          }
        },
        value);
  }

  void
  leaf::assign(leaf_value value) {
    if (value.index() != value_.index()) {
      throw std::invalid_argument("leaf " + tag_.to_string() +
                                  ": cannot change value type");
    }
    value_ = std::move(value);
  }

  xml_node
  leaf::encode() const {
    xml_node node(tag_);
    std::visit(
        [&node](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, text_value>) {
            node.set_text(v.text);
          } else if constexpr (std::is_same_v<T, decimal_value>) {
            node.set_text(v.value.to_string());
          } else if constexpr (std::is_same_v<T, quantity>) {
            node.set_text(v.amount.to_string());
            node.set_attribute("unitCode", v.unit_code);
          } else if constexpr (std::is_same_v<T, currency_amount>) {
            node.set_text(v.amount.to_string());
            node.set_attribute("currencyID", v.currency);
          } else if constexpr (std::is_same_v<T, classification>) {
            node.set_text(v.text);
            node.set_attribute("listID", v.list_id);
            node.set_attribute("listVersionID", v.list_version_id);
          } else if constexpr (std::is_same_v<T, agency_code>) {
            node.set_text(v.text);
            node.set_attribute("schemeAgencyID", v.scheme_agency_id);
          } else if constexpr (std::is_same_v<T, identifier>) {
            node.set_text(v.text);
            node.set_attribute("schemeID", v.scheme_id);
          } else if constexpr (std::is_same_v<T, date_value>) {
            if (v.format_code != date_format_102) {
              throw binding_error(error_kind::unsupported_date_format,
                                  v.format_code,
                                  "date format " + v.format_code +
                                      " cannot be written");
            }
            xml_node child(udt("DateTimeString"));
            child.set_text(v.value.to_basic_string());
            child.set_attribute("format", v.format_code);
            node.append_child(std::move(child));
          } else if constexpr (std::is_same_v<T, indicator>) {
            xml_node child(udt("Indicator"));
            child.set_text(v.value ? "true" : "false");
            node.append_child(std::move(child));
          } else {
            static_assert(always_false<T>, "unhandled leaf value");
          }
        },
        value_);
    return node;
  }

  leaf&
  leaf::decode(const xml_node& node) {
    if (node.name() != tag_) {
      throw binding_error(error_kind::tag_mismatch, node.name().to_string(),
                          "found tag " + node.name().to_string() + " where " +
                              tag_.to_string() + " was expected");
    }

    // Decode into a fresh payload so a failure leaves this leaf unchanged.
    value_ = std::visit(
        [&node](const auto& v) -> leaf_value {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, text_value>) {
            return text_value{node.text().value_or("")};
          } else if constexpr (std::is_same_v<T, decimal_value>) {
            return decimal_value{decode_decimal(node)};
          } else if constexpr (std::is_same_v<T, quantity>) {
            auto amount = decode_decimal(node);
            return quantity{amount, require_attribute(node, "unitCode")};
          } else if constexpr (std::is_same_v<T, currency_amount>) {
            auto amount = decode_decimal(node);
            return currency_amount{amount,
                                   require_attribute(node, "currencyID")};
          } else if constexpr (std::is_same_v<T, classification>) {
            return classification{node.text().value_or(""),
                                  require_attribute(node, "listID"),
                                  require_attribute(node, "listVersionID")};
          } else if constexpr (std::is_same_v<T, agency_code>) {
            return agency_code{node.text().value_or(""),
                               require_attribute(node, "schemeAgencyID")};
          } else if constexpr (std::is_same_v<T, identifier>) {
            return identifier{node.text().value_or(""),
                              require_attribute(node, "schemeID")};
          } else if constexpr (std::is_same_v<T, date_value>) {
            return decode_date(node);
          } else if constexpr (std::is_same_v<T, indicator>) {
            return decode_indicator(node);
          } else {
            static_assert(always_false<T>, "unhandled leaf value");
          }
        },
        value_);
    return *this;
  }

} // namespace ixb
