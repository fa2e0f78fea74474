#include <ixb/xml_io.hpp>

#include <expat.h>

#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ixb {

  namespace {

    // Parse "uri\nlocal" into a qname. Unqualified names have no separator.
    qname
    parse_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) { return qname{"", std::string(expat_name)}; }
      return qname{std::string(expat_name, sep), std::string(sep + 1)};
    }

    bool
    is_whitespace(const std::string& text) {
      for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') { return false; }
      }
      return true;
    }

    struct open_element {
      qname name;
      std::vector<xml_attribute> attributes;
      std::vector<xml_node> children;
      std::optional<std::string> text;
    };

    struct tree_builder {
      std::vector<open_element> stack;
      std::optional<xml_node> root;

      static void XMLCALL
      on_start_element(void* user_data, const char* name, const char** atts) {
        auto* self = static_cast<tree_builder*>(user_data);

        open_element el;
        el.name = parse_expat_name(name);
        for (const char** p = atts; *p != nullptr; p += 2) {
          el.attributes.emplace_back(parse_expat_name(p[0]),
                                     std::string(p[1]));
        }
        self->stack.push_back(std::move(el));
      }

      static void XMLCALL
      on_end_element(void* user_data, const char* /*name*/) {
        auto* self = static_cast<tree_builder*>(user_data);

        open_element el = std::move(self->stack.back());
        self->stack.pop_back();

        // Indentation between child elements is not content.
        if (el.text && !el.children.empty() && is_whitespace(*el.text)) {
          el.text.reset();
        }

        xml_node node(std::move(el.name), std::move(el.attributes),
                      std::move(el.children), std::move(el.text));
        if (self->stack.empty()) {
          self->root = std::move(node);
        } else {
          self->stack.back().children.push_back(std::move(node));
        }
      }

      static void XMLCALL
      on_character_data(void* user_data, const char* s, int len) {
        auto* self = static_cast<tree_builder*>(user_data);
        if (self->stack.empty()) { return; }

        // Expat may split a run of text; coalesce it.
        auto& text = self->stack.back().text;
        if (!text) { text.emplace(); }
        text->append(s, static_cast<std::size_t>(len));
      }
    };

  } // namespace

  xml_node
  parse_xml(std::string_view xml) {
    // '\n' as the namespace separator
    XML_Parser parser = XML_ParserCreateNS(nullptr, '\n');
    if (parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }

    tree_builder builder;
    XML_SetUserData(parser, &builder);
    XML_SetElementHandler(parser, tree_builder::on_start_element,
                          tree_builder::on_end_element);
    XML_SetCharacterDataHandler(parser, tree_builder::on_character_data);

    XML_Status status =
        XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser));
      XML_ParserFree(parser);
      throw std::runtime_error(msg);
    }

    XML_ParserFree(parser);

    if (!builder.root) {
      throw std::runtime_error("XML parse error: no content");
    }
    return std::move(*builder.root);
  }

} // namespace ixb
