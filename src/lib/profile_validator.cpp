#include <ixb/namespaces.hpp>
#include <ixb/schema_validator.hpp>
#include <ixb/xml_io.hpp>

#include <algorithm>
#include <stdexcept>

namespace ixb {

  namespace {

    bool
    allowed(const schema_profile& profile, const std::string& uri) {
      return std::find(profile.namespaces.begin(), profile.namespaces.end(),
                       uri) != profile.namespaces.end();
    }

    void
    check_namespaces(const schema_profile& profile, const xml_node& node,
                     validation_result& result) {
      if (!allowed(profile, node.name().namespace_uri())) {
        result.passed = false;
        result.details.push_back("element " + node.name().to_string() +
                                 " is outside the " + profile.name +
                                 " namespaces");
      }
      for (const auto& attr : node.attributes()) {
        const auto& uri = attr.name().namespace_uri();
        if (!uri.empty() && !allowed(profile, uri)) {
          result.passed = false;
          result.details.push_back("attribute " + attr.name().to_string() +
                                   " on " + node.name().to_string() +
                                   " is outside the " + profile.name +
                                   " namespaces");
        }
      }
      for (const auto& child : node.children()) {
        check_namespaces(profile, child, result);
      }
    }

  } // namespace

  schema_profile
  zugferd_1p0_profile() {
    return schema_profile{
        std::string(zugferd_1p0),
        qname{std::string(ns_rsm), "CrossIndustryDocument"},
        {std::string(ns_rsm), std::string(ns_ram), std::string(ns_udt)},
    };
  }

  profile_validator::profile_validator() {
    add(zugferd_1p0_profile());
  }

  void
  profile_validator::add(schema_profile profile) {
    std::string name = profile.name;
    profiles_.insert_or_assign(std::move(name), std::move(profile));
  }

  const schema_profile*
  profile_validator::find(std::string_view name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) { return nullptr; }
    return &it->second;
  }

  validation_result
  profile_validator::validate(std::string_view xml,
                              std::string_view schema_name) const {
    validation_result result;

    const schema_profile* profile = find(schema_name);
    if (profile == nullptr) {
      result.passed = false;
      result.details.push_back("unknown schema '" + std::string(schema_name) +
                               "'");
      return result;
    }

    xml_node root;
    try {
      root = parse_xml(xml);
    } catch (const std::runtime_error& e) {
      result.passed = false;
      result.details.emplace_back(e.what());
      return result;
    }

    if (root.name() != profile->root) {
      result.passed = false;
      result.details.push_back("root element is " + root.name().to_string() +
                               ", expected " + profile->root.to_string());
    }
    check_namespaces(*profile, root, result);
    return result;
  }

} // namespace ixb
