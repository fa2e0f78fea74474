#pragma once

#include <ixb/xml_node.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace ixb {

  inline constexpr std::string_view xml_prologue =
      R"(<?xml version="1.0" encoding="UTF-8"?>)";

  // Parse a complete document into its root element. Throws
  // std::runtime_error on malformed input.
  xml_node
  parse_xml(std::string_view xml);

  // Render a tree without prologue. Every namespace used in the tree is
  // declared on the root: known invoice namespaces with their conventional
  // prefixes, anything else as ns0, ns1, ...
  void
  render_xml(std::ostream& os, const xml_node& root);

  std::string
  render_xml(const xml_node& root);

} // namespace ixb
