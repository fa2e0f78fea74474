#pragma once

#include <ixb/element_type.hpp>
#include <ixb/leaf.hpp>
#include <ixb/model_fwd.hpp>
#include <ixb/xml_node.hpp>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace ixb {

  class field_assignment;

  // A composite node: one slot per declared field, in declaration order.
  // Slots are created eagerly; an unset optional field is a null slot.
  class element {
    const element_type* type_;
    std::vector<std::optional<value>> slots_;

  public:
    // The type is referenced, not copied, and must outlive the element.
    explicit element(const element_type& type);
    element(element_type&&) = delete;

    // Unknown field names throw std::invalid_argument.
    element(const element_type& type,
            std::initializer_list<field_assignment> fields);
    element(element_type&&, std::initializer_list<field_assignment>) = delete;

    const element_type&
    type() const {
      return *type_;
    }

    const qname&
    tag() const {
      return type_->tag();
    }

    bool
    has(std::string_view name) const;

    const std::optional<value>&
    slot(std::string_view name) const;

    // The value must be of the kind and carry the tag the field declares.
    void
    set(std::string_view name, value content);

    // Replace the payload of a leaf field, creating the leaf if unset.
    void
    set(std::string_view name, leaf_value payload);

    void
    clear(std::string_view name);

    // Accessors for populating a graph: an unset field is first filled from
    // its default factory. Asking for the wrong kind throws
    // std::invalid_argument.
    leaf&
    leaf_at(std::string_view name);
    element&
    element_at(std::string_view name);
    container&
    container_at(std::string_view name);

    // Read-only accessors; an unset field throws std::invalid_argument.
    const leaf&
    leaf_at(std::string_view name) const;
    const element&
    element_at(std::string_view name) const;
    const container&
    container_at(std::string_view name) const;

    // Convenience for leaf_at(name).as<T>().
    template <typename T>
    const T&
    get(std::string_view name) const {
      return leaf_at(name).as<T>();
    }

    xml_node
    encode() const;

    // Closed-world decode into this element's existing slots. Throws
    // binding_error on the first violation.
    element&
    decode(const xml_node& node);

    bool
    operator==(const element& other) const;

  private:
    std::size_t
    index_of(std::string_view name) const;

    value&
    materialize(std::size_t index);

    // Materializes the named slot only if its field is of the given kind.
    value&
    materialize_as(std::string_view name, value_kind kind, const char* what);
  };

  // Zero or more sibling occurrences of one tag. Items are copies of a
  // prototype (a leaf or an element), so they all share its tag and shape.
  class container {
  public:
    using item = std::variant<leaf, element>;

    explicit container(const element_type& item_type);
    container(element_type&&) = delete;
    explicit container(leaf prototype);

    const qname&
    item_tag() const;

    const item&
    prototype() const {
      return prototype_;
    }

    const std::vector<item>&
    items() const {
      return items_;
    }

    std::size_t
    size() const {
      return items_.size();
    }

    bool
    empty() const {
      return items_.empty();
    }

    // The item must match the prototype's kind and tag.
    item&
    append(item it);

    // Append a copy of the leaf prototype carrying `payload`.
    leaf&
    append(leaf_value payload);

    // Append a fresh copy of the element prototype.
    element&
    append_element();

    item&
    decode_append(const xml_node& node);

    // Appends one child per item to `parent`, no wrapper node.
    void
    encode_into(xml_node& parent) const;

    bool
    operator==(const container& other) const;

  private:
    item prototype_;
    std::vector<item> items_;
  };

  // One entry of an element's initializer list. A bare payload is wrapped in
  // the leaf its field declares.
  class field_assignment {
    std::string_view name_;
    std::variant<leaf_value, value> content_;

  public:
    field_assignment(std::string_view name, leaf_value payload);
    field_assignment(std::string_view name, value content);

    std::string_view
    name() const {
      return name_;
    }

    const std::variant<leaf_value, value>&
    content() const {
      return content_;
    }
  };

  // Tag a value would be serialized under.
  const qname&
  tag_of(const value& v);

  value_kind
  kind_of(const value& v);

} // namespace ixb
