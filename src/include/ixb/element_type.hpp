#pragma once

#include <ixb/model_fwd.hpp>
#include <ixb/qname.hpp>
#include <ixb/xml_node.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ixb {

  struct field_schema {
    std::string name;
    // When set, a fresh element holds default_factory() in this slot;
    // otherwise the slot starts out null.
    bool has_default = false;
    std::function<value()> default_factory;
  };

  // Immutable description of an element type: its tag, the attributes fixed
  // by the schema, and its fields in serialization order. Types are built
  // once (usually as function-local statics) and must outlive every element
  // created from them.
  class element_type {
  public:
    class builder;

    const qname&
    tag() const {
      return tag_;
    }

    const std::vector<xml_attribute>&
    fixed_attributes() const {
      return fixed_attributes_;
    }

    const std::vector<field_schema>&
    fields() const {
      return fields_;
    }

    std::optional<std::size_t>
    field_index(std::string_view name) const;

    // Field whose default value carries `tag`, i.e. the decode target for a
    // child node with that tag.
    std::optional<std::size_t>
    field_for_child(const qname& tag) const;

    // Child tag and value kind produced by field i's default factory.
    const qname&
    child_tag(std::size_t i) const {
      return child_tags_[i];
    }

    value_kind
    kind(std::size_t i) const {
      return kinds_[i];
    }

  private:
    element_type() = default;

    qname tag_;
    std::vector<xml_attribute> fixed_attributes_;
    std::vector<field_schema> fields_;
    std::vector<qname> child_tags_;
    std::vector<value_kind> kinds_;
    std::map<std::string, std::size_t, std::less<>> by_name_;
    std::unordered_map<qname, std::size_t> by_child_tag_;
  };

  // Registers fields in declaration order. inherit() copies the base type's
  // fixed attributes and fields, so a derived type serializes the base fields
  // first.
  class element_type::builder {
    qname tag_;
    std::vector<xml_attribute> fixed_attributes_;
    std::vector<field_schema> fields_;

  public:
    explicit builder(qname tag) : tag_(std::move(tag)) {}

    builder&
    inherit(const element_type& base);

    builder&
    attribute(std::string local_name, std::string value);

    builder&
    field(std::string name, std::function<value()> factory,
          bool has_default = false);

    // Throws std::logic_error when two fields share a name or a child tag.
    element_type
    build() const;
  };

} // namespace ixb
