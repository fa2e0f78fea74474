#pragma once

#include <ixb/qname.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ixb {

  class xml_attribute {
    qname name_;
    std::string value_;

  public:
    xml_attribute() = default;

    xml_attribute(qname name, std::string value)
        : name_(std::move(name)), value_(std::move(value)) {}

    const qname&
    name() const {
      return name_;
    }

    const std::string&
    value() const {
      return value_;
    }

    bool
    operator==(const xml_attribute&) const = default;
  };

  // One element of a parsed or to-be-rendered document. Character data is
  // held in text(); whitespace between child elements is not kept.
  class xml_node {
    qname name_;
    std::vector<xml_attribute> attributes_;
    std::vector<xml_node> children_;
    std::optional<std::string> text_;

  public:
    xml_node() = default;

    explicit xml_node(qname name) : name_(std::move(name)) {}

    xml_node(qname name, std::vector<xml_attribute> attributes,
             std::vector<xml_node> children,
             std::optional<std::string> text = std::nullopt)
        : name_(std::move(name)), attributes_(std::move(attributes)),
          children_(std::move(children)), text_(std::move(text)) {}

    const qname&
    name() const {
      return name_;
    }

    const std::vector<xml_attribute>&
    attributes() const {
      return attributes_;
    }

    const std::vector<xml_node>&
    children() const {
      return children_;
    }

    const std::optional<std::string>&
    text() const {
      return text_;
    }

    void
    set_text(std::string text) {
      text_ = std::move(text);
    }

    // Sets an unqualified attribute, replacing any previous value.
    void
    set_attribute(std::string_view local_name, std::string value);

    // Value of an unqualified attribute, if present.
    std::optional<std::string_view>
    attribute(std::string_view local_name) const;

    xml_node&
    append_child(xml_node child);

    bool
    operator==(const xml_node&) const;
  };

  // Defined out-of-line: xml_node must be complete before the compiler
  // instantiates equality of std::vector<xml_node>.
  inline bool
  xml_node::operator==(const xml_node& other) const {
    return name_ == other.name_ && attributes_ == other.attributes_ &&
           children_ == other.children_ && text_ == other.text_;
  }

} // namespace ixb
