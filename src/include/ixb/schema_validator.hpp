#pragma once

#include <ixb/qname.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ixb {

  struct validation_result {
    bool passed = true;
    std::vector<std::string> details;

    explicit
    operator bool() const {
      return passed;
    }
  };

  // Checks rendered document bytes against a named schema version.
  class schema_validator {
  public:
    virtual ~schema_validator() = default;

    virtual validation_result
    validate(std::string_view xml, std::string_view schema_name) const = 0;
  };

  inline constexpr std::string_view zugferd_1p0 = "ZUGFeRD1p0";

  // Structural description of one exchange format version.
  struct schema_profile {
    std::string name;
    qname root;
    // Namespaces element and attribute names may use; unqualified
    // attributes are always allowed.
    std::vector<std::string> namespaces;
  };

  schema_profile
  zugferd_1p0_profile();

  // Validates well-formedness, the root element, and namespace usage against
  // registered profiles. It is not an XSD engine: content models are enforced
  // by the element types themselves.
  class profile_validator : public schema_validator {
    std::map<std::string, schema_profile, std::less<>> profiles_;

  public:
    // Registers the built-in profiles.
    profile_validator();

    void
    add(schema_profile profile);

    const schema_profile*
    find(std::string_view name) const;

    validation_result
    validate(std::string_view xml, std::string_view schema_name) const override;
  };

} // namespace ixb
