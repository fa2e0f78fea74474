#pragma once

#include <ixb/leaf.hpp>

#include <variant>

namespace ixb {

  class element;
  class container;
  class element_type;

  // Content of one field slot. The alternative and its tag are fixed by the
  // field's default factory; decode dispatch relies on them.
  using value = std::variant<leaf, element, container>;

  enum class value_kind { leaf, element, container };

} // namespace ixb
