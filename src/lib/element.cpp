#include <ixb/binding_error.hpp>
#include <ixb/element.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace ixb {

  namespace {

    std::string
    kind_name(value_kind kind) {
      switch (kind) {
        case value_kind::leaf:
          return "leaf";
        case value_kind::element:
          return "element";
        case value_kind::container:
          return "container";
      }
      return "value";
    }

  } // namespace

  const qname&
  tag_of(const value& v) {
    return std::visit(
        [](const auto& x) -> const qname& {
          using T = std::decay_t<decltype(x)>;
          if constexpr (std::is_same_v<T, container>) {
            return x.item_tag();
          } else {
            return x.tag();
          }
        },
        v);
  }

  value_kind
  kind_of(const value& v) {
    return std::visit(
        [](const auto& x) {
          using T = std::decay_t<decltype(x)>;
          if constexpr (std::is_same_v<T, leaf>) {
            return value_kind::leaf;
          } else if constexpr (std::is_same_v<T, element>) {
            return value_kind::element;
          } else {
            return value_kind::container;
          }
        },
        v);
  }

  // ===== field_assignment =====

  field_assignment::field_assignment(std::string_view name, leaf_value payload)
      : name_(name), content_(std::in_place_index<0>, std::move(payload)) {}

  field_assignment::field_assignment(std::string_view name, value content)
      : name_(name), content_(std::in_place_index<1>, std::move(content)) {}

  // ===== element =====

  element::element(const element_type& type) : type_(&type) {
    slots_.reserve(type.fields().size());
    for (const auto& f : type.fields()) {
      if (f.has_default) {
        slots_.emplace_back(f.default_factory());
      } else {
        slots_.emplace_back(std::nullopt);
      }
    }
  }

  element::element(const element_type& type,
                   std::initializer_list<field_assignment> fields)
      : element(type) {
    for (const auto& f : fields) {
      std::visit(
          [&](const auto& content) {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, leaf_value>) {
              set(f.name(), content);
            } else {
              set(f.name(), value(content));
            }
          },
          f.content());
    }
  }

  std::size_t
  element::index_of(std::string_view name) const {
    auto index = type_->field_index(name);
    if (!index) {
      throw std::invalid_argument(tag().to_string() + ": unknown field '" +
                                  std::string(name) + "'");
    }
    return *index;
  }

  value&
  element::materialize(std::size_t index) {
    auto& slot = slots_[index];
    if (!slot) { slot = type_->fields()[index].default_factory(); }
    return *slot;
  }

  bool
  element::has(std::string_view name) const {
    return slots_[index_of(name)].has_value();
  }

  const std::optional<value>&
  element::slot(std::string_view name) const {
    return slots_[index_of(name)];
  }

  void
  element::set(std::string_view name, value content) {
    std::size_t i = index_of(name);
    if (kind_of(content) != type_->kind(i)) {
      throw std::invalid_argument(
          tag().to_string() + ": field '" + std::string(name) + "' holds a " +
          kind_name(type_->kind(i)) + ", not a " + kind_name(kind_of(content)));
    }
    if (tag_of(content) != type_->child_tag(i)) {
      throw std::invalid_argument(tag().to_string() + ": field '" +
                                  std::string(name) + "' is tagged " +
                                  type_->child_tag(i).to_string() + ", not " +
                                  tag_of(content).to_string());
    }
    slots_[i] = std::move(content);
  }

  value&
  element::materialize_as(std::string_view name, value_kind kind,
                          const char* what) {
    std::size_t i = index_of(name);
    if (type_->kind(i) != kind) {
      throw std::invalid_argument(tag().to_string() + ": field '" +
                                  std::string(name) + "' is not " + what);
    }
    return materialize(i);
  }

  void
  element::set(std::string_view name, leaf_value payload) {
    std::size_t i = index_of(name);
    if (type_->kind(i) != value_kind::leaf) {
      throw std::invalid_argument(tag().to_string() + ": field '" +
                                  std::string(name) + "' is not a leaf");
    }
    auto& slot = slots_[i];
    if (slot) {
      std::get<leaf>(*slot).assign(std::move(payload));
      return;
    }
    value fresh = type_->fields()[i].default_factory();
    std::get<leaf>(fresh).assign(std::move(payload));
    slot = std::move(fresh);
  }

  void
  element::clear(std::string_view name) {
    slots_[index_of(name)].reset();
  }

  leaf&
  element::leaf_at(std::string_view name) {
    return std::get<leaf>(materialize_as(name, value_kind::leaf, "a leaf"));
  }

  element&
  element::element_at(std::string_view name) {
    return std::get<element>(
        materialize_as(name, value_kind::element, "an element"));
  }

  container&
  element::container_at(std::string_view name) {
    return std::get<container>(
        materialize_as(name, value_kind::container, "a container"));
  }

  namespace {

    template <typename T>
    const T&
    get_set_slot(const element& owner, std::string_view name,
                 const std::optional<value>& slot, const char* what) {
      if (!slot) {
        throw std::invalid_argument(owner.tag().to_string() + ": field '" +
                                    std::string(name) + "' is not set");
      }
      if (const T* p = std::get_if<T>(&*slot)) { return *p; }
      throw std::invalid_argument(owner.tag().to_string() + ": field '" +
                                  std::string(name) + "' is not " + what);
    }

  } // namespace

  const leaf&
  element::leaf_at(std::string_view name) const {
    return get_set_slot<leaf>(*this, name, slot(name), "a leaf");
  }

  const element&
  element::element_at(std::string_view name) const {
    return get_set_slot<element>(*this, name, slot(name), "an element");
  }

  const container&
  element::container_at(std::string_view name) const {
    return get_set_slot<container>(*this, name, slot(name), "a container");
  }

  xml_node
  element::encode() const {
    xml_node node(tag(), type_->fixed_attributes(), {});
    for (const auto& slot : slots_) {
      if (!slot) { continue; }
      std::visit(
          [&node](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, container>) {
              v.encode_into(node);
            } else {
              node.append_child(v.encode());
            }
          },
          *slot);
    }
    return node;
  }

  element&
  element::decode(const xml_node& node) {
    if (node.name() != tag()) {
      throw binding_error(error_kind::tag_mismatch, node.name().to_string(),
                          "found tag " + node.name().to_string() + " where " +
                              tag().to_string() + " was expected");
    }

    for (const auto& child : node.children()) {
      auto index = type_->field_for_child(child.name());
      if (!index) {
        throw binding_error(error_kind::unknown_element,
                            child.name().to_string(),
                            "unknown element " + child.name().to_string() +
                                " in " + tag().to_string());
      }

      std::visit(
          [&child](auto& target) {
            using T = std::decay_t<decltype(target)>;
            if constexpr (std::is_same_v<T, container>) {
              target.decode_append(child);
            } else {
              target.decode(child);
            }
          },
          materialize(*index));
    }
    return *this;
  }

  bool
  element::operator==(const element& other) const {
    return type_ == other.type_ && slots_ == other.slots_;
  }

  // ===== container =====

  container::container(const element_type& item_type)
      : prototype_(element(item_type)) {}

  container::container(leaf prototype) : prototype_(std::move(prototype)) {}

  const qname&
  container::item_tag() const {
    return std::visit([](const auto& p) -> const qname& { return p.tag(); },
                      prototype_);
  }

  container::item&
  container::append(item it) {
    const qname& tag =
        std::visit([](const auto& x) -> const qname& { return x.tag(); }, it);
    if (it.index() != prototype_.index() || tag != item_tag()) {
      throw std::invalid_argument("container of " + item_tag().to_string() +
                                  " cannot hold " + tag.to_string());
    }
    items_.push_back(std::move(it));
    return items_.back();
  }

  leaf&
  container::append(leaf_value payload) {
    const auto* proto = std::get_if<leaf>(&prototype_);
    if (proto == nullptr) {
      throw std::invalid_argument("container of " + item_tag().to_string() +
                                  " holds elements, not leaves");
    }
    leaf it = *proto;
    it.assign(std::move(payload));
    items_.emplace_back(std::move(it));
    return std::get<leaf>(items_.back());
  }

  element&
  container::append_element() {
    const auto* proto = std::get_if<element>(&prototype_);
    if (proto == nullptr) {
      throw std::invalid_argument("container of " + item_tag().to_string() +
                                  " holds leaves, not elements");
    }
    items_.emplace_back(*proto);
    return std::get<element>(items_.back());
  }

  container::item&
  container::decode_append(const xml_node& node) {
    item fresh = prototype_;
    std::visit([&node](auto& it) { it.decode(node); }, fresh);
    items_.push_back(std::move(fresh));
    return items_.back();
  }

  void
  container::encode_into(xml_node& parent) const {
    for (const auto& it : items_) {
      std::visit([&parent](const auto& x) { parent.append_child(x.encode()); },
                 it);
    }
  }

  bool
  container::operator==(const container& other) const {
    return item_tag() == other.item_tag() && items_ == other.items_;
  }

} // namespace ixb
