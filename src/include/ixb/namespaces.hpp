#pragma once

#include <array>
#include <string_view>

namespace ixb {

  // ZUGFeRD 1.0 root message namespace.
  inline constexpr std::string_view ns_rsm =
      "urn:ferd:CrossIndustryDocument:invoice:1p0";

  // Reusable aggregate business information entities.
  inline constexpr std::string_view ns_ram =
      "urn:un:unece:uncefact:data:standard:"
      "ReusableAggregateBusinessInformationEntity:12";

  // Unqualified data types; also the namespace of the DateTimeString and
  // Indicator wrapper children.
  inline constexpr std::string_view ns_udt =
      "urn:un:unece:uncefact:data:standard:UnqualifiedDataType:15";

  struct namespace_binding {
    std::string_view prefix;
    std::string_view uri;
  };

  // Prefixes declared on the document root when rendering.
  inline constexpr std::array<namespace_binding, 3> known_namespaces{{
      {"rsm", ns_rsm},
      {"ram", ns_ram},
      {"udt", ns_udt},
  }};

} // namespace ixb
