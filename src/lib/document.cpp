#include <ixb/binding_error.hpp>
#include <ixb/document.hpp>
#include <ixb/xml_io.hpp>

#include <sstream>

namespace ixb {

  document::document(const element_type& root_type, std::string schema_name)
      : element(root_type), schema_name_(std::move(schema_name)) {}

  std::string
  document::render() const {
    std::ostringstream os;
    os << xml_prologue;
    render_xml(os, encode());
    return os.str();
  }

  std::string
  document::serialize(const schema_validator& validator) const {
    std::string xml = render();

    auto result = validator.validate(xml, schema_name_);
    if (!result) {
      std::string message = "document rejected by schema " + schema_name_;
      for (const auto& detail : result.details) {
        message += "; ";
        message += detail;
      }
      throw binding_error(error_kind::validation_failed, schema_name_,
                          message);
    }
    return xml;
  }

  document
  document::parse(std::string_view xml, const element_type& root_type,
                  std::string schema_name) {
    document doc(root_type, std::move(schema_name));
    doc.decode(parse_xml(xml));
    return doc;
  }

} // namespace ixb
