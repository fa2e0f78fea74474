#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>

namespace ixb {

  // Namespace-qualified element or attribute name. Attributes in invoice
  // documents are unqualified, so their namespace_uri is empty.
  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    bool
    empty() const {
      return namespace_uri_.empty() && local_name_.empty();
    }

    // Clark notation: {uri}local, or just local when unqualified.
    std::string
    to_string() const {
      if (namespace_uri_.empty()) { return local_name_; }
      return '{' + namespace_uri_ + '}' + local_name_;
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      return os << q.to_string();
    }
  };

} // namespace ixb

template <>
struct std::hash<ixb::qname> {
  std::size_t
  operator()(const ixb::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
