#include <ixb/namespaces.hpp>
#include <ixb/xml_io.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ixb {

  namespace {

    // Reference for a character that would not survive a parse literally,
    // or nullptr. A parser folds a literal CR into LF, and turns tabs and
    // line feeds inside attribute values into spaces.
    const char*
    reference_for(char c, bool in_attribute) {
      switch (c) {
        case '<': return "&lt;";
        case '>': return "&gt;";
        case '&': return "&amp;";
        case '\r': return "&#13;";
        case '"': return in_attribute ? "&quot;" : nullptr;
        case '\t': return in_attribute ? "&#9;" : nullptr;
        case '\n': return in_attribute ? "&#10;" : nullptr;
        default: return nullptr;
      }
    }

    void
    write_escaped(std::ostream& os, std::string_view text, bool in_attribute) {
      std::size_t run = 0;
      for (std::size_t i = 0; i < text.size(); ++i) {
        const char* ref = reference_for(text[i], in_attribute);
        if (!ref) { continue; }
        os.write(text.data() + run, static_cast<std::streamsize>(i - run));
        os << ref;
        run = i + 1;
      }
      os.write(text.data() + run,
               static_cast<std::streamsize>(text.size() - run));
    }

    struct prefix_table {
      // Declaration order on the root element.
      std::vector<std::pair<std::string, std::string>> bindings;
      std::unordered_map<std::string, std::string> by_uri;
      int generated = 0;

      void
      bind(const std::string& uri, std::string prefix) {
        by_uri.emplace(uri, prefix);
        bindings.emplace_back(std::move(prefix), uri);
      }

      void
      collect(const xml_node& node, std::vector<std::string>& unknown) {
        auto note = [&](const std::string& uri) {
          if (uri.empty() || by_uri.count(uri)) { return; }
          for (const auto& known : known_namespaces) {
            if (known.uri == uri) {
              by_uri.emplace(uri, std::string(known.prefix));
              return;
            }
          }
          for (const auto& u : unknown) {
            if (u == uri) { return; }
          }
          unknown.push_back(uri);
        };

        note(node.name().namespace_uri());
        for (const auto& attr : node.attributes()) {
          note(attr.name().namespace_uri());
        }
        for (const auto& child : node.children()) {
          collect(child, unknown);
        }
      }

      void
      write_name(std::ostream& os, const qname& name) const {
        if (!name.namespace_uri().empty()) {
          os << by_uri.at(name.namespace_uri()) << ':';
        }
        os << name.local_name();
      }
    };

    prefix_table
    build_prefix_table(const xml_node& root) {
      prefix_table table;
      std::vector<std::string> unknown;
      table.collect(root, unknown);

      // Known namespaces first, in table order.
      for (const auto& known : known_namespaces) {
        if (table.by_uri.count(std::string(known.uri))) {
          table.bindings.emplace_back(std::string(known.prefix),
                                      std::string(known.uri));
        }
      }

      for (const auto& uri : unknown) {
        table.bind(uri, "ns" + std::to_string(table.generated++));
      }
      return table;
    }

    void
    write_node(std::ostream& os, const xml_node& node,
               const prefix_table& table, bool is_root) {
      os << '<';
      table.write_name(os, node.name());

      if (is_root) {
        for (const auto& [prefix, uri] : table.bindings) {
          os << " xmlns:" << prefix << "=\"";
          write_escaped(os, uri, true);
          os << '"';
        }
      }

      for (const auto& attr : node.attributes()) {
        os << ' ';
        table.write_name(os, attr.name());
        os << "=\"";
        write_escaped(os, attr.value(), true);
        os << '"';
      }

      bool has_text = node.text().has_value() && !node.text()->empty();
      if (!has_text && node.children().empty()) {
        os << "/>";
        return;
      }

      os << '>';
      if (has_text) { write_escaped(os, *node.text(), false); }
      for (const auto& child : node.children()) {
        write_node(os, child, table, false);
      }
      os << "</";
      table.write_name(os, node.name());
      os << '>';
    }

  } // namespace

  void
  render_xml(std::ostream& os, const xml_node& root) {
    auto table = build_prefix_table(root);
    write_node(os, root, table, true);
  }

  std::string
  render_xml(const xml_node& root) {
    std::ostringstream os;
    render_xml(os, root);
    return os.str();
  }

} // namespace ixb
