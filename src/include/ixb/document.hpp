#pragma once

#include <ixb/element.hpp>
#include <ixb/schema_validator.hpp>

#include <string>
#include <string_view>

namespace ixb {

  // Top-level element bound to the schema version it is validated against.
  class document : public element {
    std::string schema_name_;

  public:
    document(const element_type& root_type, std::string schema_name);
    document(element_type&&, std::string) = delete;

    const std::string&
    schema_name() const {
      return schema_name_;
    }

    // Prologue plus rendered tree, without validation.
    std::string
    render() const;

    // render(), then validate; a rejection throws binding_error with kind
    // validation_failed carrying the validator's details.
    std::string
    serialize(const schema_validator& validator) const;

    static document
    parse(std::string_view xml, const element_type& root_type,
          std::string schema_name);
    static document
    parse(std::string_view, element_type&&, std::string) = delete;
  };

} // namespace ixb
