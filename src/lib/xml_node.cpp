#include <ixb/xml_node.hpp>

namespace ixb {

  void
  xml_node::set_attribute(std::string_view local_name, std::string value) {
    for (auto& attr : attributes_) {
      if (attr.name().namespace_uri().empty() &&
          attr.name().local_name() == local_name) {
        attr = xml_attribute(attr.name(), std::move(value));
        return;
      }
    }
    attributes_.emplace_back(qname{"", std::string(local_name)},
                             std::move(value));
  }

  std::optional<std::string_view>
  xml_node::attribute(std::string_view local_name) const {
    for (const auto& attr : attributes_) {
      if (attr.name().namespace_uri().empty() &&
          attr.name().local_name() == local_name) {
        return std::string_view(attr.value());
      }
    }
    return std::nullopt;
  }

  xml_node&
  xml_node::append_child(xml_node child) {
    children_.push_back(std::move(child));
    return children_.back();
  }

} // namespace ixb
