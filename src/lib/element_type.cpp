#include <ixb/element.hpp>
#include <ixb/element_type.hpp>

#include <stdexcept>

namespace ixb {

  std::optional<std::size_t>
  element_type::field_index(std::string_view name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) { return std::nullopt; }
    return it->second;
  }

  std::optional<std::size_t>
  element_type::field_for_child(const qname& tag) const {
    auto it = by_child_tag_.find(tag);
    if (it == by_child_tag_.end()) { return std::nullopt; }
    return it->second;
  }

  element_type::builder&
  element_type::builder::inherit(const element_type& base) {
    fixed_attributes_.insert(fixed_attributes_.end(),
                             base.fixed_attributes_.begin(),
                             base.fixed_attributes_.end());
    fields_.insert(fields_.end(), base.fields_.begin(), base.fields_.end());
    return *this;
  }

  element_type::builder&
  element_type::builder::attribute(std::string local_name, std::string value) {
    fixed_attributes_.emplace_back(qname{"", std::move(local_name)},
                                   std::move(value));
    return *this;
  }

  element_type::builder&
  element_type::builder::field(std::string name,
                               std::function<value()> factory,
                               bool has_default) {
    fields_.push_back({std::move(name), has_default, std::move(factory)});
    return *this;
  }

  element_type
  element_type::builder::build() const {
    element_type type;
    type.tag_ = tag_;
    type.fixed_attributes_ = fixed_attributes_;
    type.fields_ = fields_;

    for (std::size_t i = 0; i < fields_.size(); ++i) {
      const auto& f = fields_[i];
      if (!f.default_factory) {
        throw std::logic_error(tag_.to_string() + ": field '" + f.name +
                               "' has no default factory");
      }
      if (!type.by_name_.emplace(f.name, i).second) {
        throw std::logic_error(tag_.to_string() + ": duplicate field '" +
                               f.name + "'");
      }

      // The default value decides which child tag this field decodes.
      value probe = f.default_factory();
      const qname& child = tag_of(probe);
      if (!type.by_child_tag_.emplace(child, i).second) {
        throw std::logic_error(tag_.to_string() + ": fields '" +
                               fields_[type.by_child_tag_.at(child)].name +
                               "' and '" + f.name + "' share child tag " +
                               child.to_string());
      }
      type.child_tags_.push_back(child);
      type.kinds_.push_back(kind_of(probe));
    }

    return type;
  }

} // namespace ixb
