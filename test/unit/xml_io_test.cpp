#include <ixb/namespaces.hpp>
#include <ixb/xml_io.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

namespace {

  ixb::qname
  ram(const char* local) {
    return ixb::qname(std::string(ixb::ns_ram), local);
  }

  ixb::qname
  rsm(const char* local) {
    return ixb::qname(std::string(ixb::ns_rsm), local);
  }

} // namespace

TEST_CASE("parse_xml builds a namespace-resolved tree", "[xml_io]") {
  auto root = ixb::parse_xml(
      R"(<?xml version="1.0" encoding="UTF-8"?>
<rsm:HeaderExchangedDocument
    xmlns:rsm="urn:ferd:CrossIndustryDocument:invoice:1p0"
    xmlns:ram="urn:un:unece:uncefact:data:standard:ReusableAggregateBusinessInformationEntity:12">
  <ram:ID>RE-2023-001</ram:ID>
  <ram:Name listID="x">Rechnung</ram:Name>
  <ram:IncludedNote/>
</rsm:HeaderExchangedDocument>)");

  CHECK(root.name() == rsm("HeaderExchangedDocument"));
  CHECK_FALSE(root.text().has_value());
  REQUIRE(root.children().size() == 3);

  const auto& id = root.children()[0];
  CHECK(id.name() == ram("ID"));
  REQUIRE(id.text().has_value());
  CHECK(*id.text() == "RE-2023-001");

  const auto& name = root.children()[1];
  CHECK(name.attribute("listID") == "x");
  CHECK_FALSE(name.attribute("schemeID").has_value());

  const auto& note = root.children()[2];
  CHECK(note.children().empty());
  CHECK_FALSE(note.text().has_value());
}

TEST_CASE("parse_xml resolves a default namespace", "[xml_io]") {
  auto root = ixb::parse_xml(R"(<Root xmlns="urn:x"><Child>1</Child></Root>)");
  CHECK(root.name() == ixb::qname("urn:x", "Root"));
  REQUIRE(root.children().size() == 1);
  CHECK(root.children()[0].name() == ixb::qname("urn:x", "Child"));
}

TEST_CASE("parse_xml text handling", "[xml_io]") {
  SECTION("entities are decoded") {
    auto root = ixb::parse_xml("<a>Fish &amp; Chips &lt;3</a>");
    CHECK(*root.text() == "Fish & Chips <3");
  }
  SECTION("whitespace inside a leaf is kept") {
    auto root = ixb::parse_xml("<a>  padded  </a>");
    CHECK(*root.text() == "  padded  ");
  }
  SECTION("indentation between children is dropped") {
    auto root = ixb::parse_xml("<a>\n  <b/>\n  <c/>\n</a>");
    CHECK(root.children().size() == 2);
    CHECK_FALSE(root.text().has_value());
  }
}

TEST_CASE("parse_xml rejects malformed input", "[xml_io]") {
  CHECK_THROWS_AS(ixb::parse_xml(""), std::runtime_error);
  CHECK_THROWS_AS(ixb::parse_xml("<a><b></a>"), std::runtime_error);
  CHECK_THROWS_AS(ixb::parse_xml("<a>"), std::runtime_error);
  CHECK_THROWS_AS(ixb::parse_xml("<p:a/>"), std::runtime_error);
  CHECK_THROWS_AS(ixb::parse_xml("not xml"), std::runtime_error);
}

TEST_CASE("xml_node attribute helpers", "[xml_io]") {
  ixb::xml_node node(ram("BilledQuantity"));
  node.set_attribute("unitCode", "KGM");
  node.set_attribute("unitCode", "C62");
  REQUIRE(node.attributes().size() == 1);
  CHECK(node.attribute("unitCode") == "C62");

  auto& child = node.append_child(ixb::xml_node(ram("Inner")));
  child.set_text("x");
  CHECK(node.children().at(0).text() == "x");
}

TEST_CASE("render_xml declares known prefixes on the root", "[xml_io]") {
  ixb::xml_node root(rsm("CrossIndustryDocument"));
  auto& header =
      root.append_child(ixb::xml_node(rsm("HeaderExchangedDocument")));
  auto& id = header.append_child(ixb::xml_node(ram("ID")));
  id.set_text("RE-1");

  CHECK(ixb::render_xml(root) ==
        "<rsm:CrossIndustryDocument"
        " xmlns:rsm=\"urn:ferd:CrossIndustryDocument:invoice:1p0\""
        " xmlns:ram=\"urn:un:unece:uncefact:data:standard:"
        "ReusableAggregateBusinessInformationEntity:12\">"
        "<rsm:HeaderExchangedDocument><ram:ID>RE-1</ram:ID>"
        "</rsm:HeaderExchangedDocument></rsm:CrossIndustryDocument>");
}

TEST_CASE("render_xml generates prefixes for other namespaces", "[xml_io]") {
  ixb::xml_node root(ixb::qname("urn:first", "Root"));
  root.append_child(ixb::xml_node(ixb::qname("urn:second", "A")));
  root.append_child(ixb::xml_node(ixb::qname("urn:first", "B")));
  root.append_child(ixb::xml_node(ixb::qname("", "C")));

  CHECK(ixb::render_xml(root) ==
        "<ns0:Root xmlns:ns0=\"urn:first\" xmlns:ns1=\"urn:second\">"
        "<ns1:A/><ns0:B/><C/></ns0:Root>");
}

TEST_CASE("render_xml escapes text and attributes", "[xml_io]") {
  ixb::xml_node node(ixb::qname("", "note"));
  node.set_attribute("title", "a \"quoted\" <b>");
  node.set_text("Fish & Chips <3>");

  std::ostringstream os;
  ixb::render_xml(os, node);
  CHECK(os.str() ==
        "<note title=\"a &quot;quoted&quot; &lt;b&gt;\">"
        "Fish &amp; Chips &lt;3&gt;</note>");

  SECTION("line breaks and tabs") {
    ixb::xml_node spaced(ixb::qname("", "note"));
    spaced.set_attribute("title", "x\ty\nz\r");
    spaced.set_text("a\r\nb\tc");
    CHECK(ixb::render_xml(spaced) ==
          "<note title=\"x&#9;y&#10;z&#13;\">a&#13;\nb\tc</note>");
  }
}

TEST_CASE("render then parse reproduces the tree", "[xml_io]") {
  ixb::xml_node root(rsm("CrossIndustryDocument"));
  auto& amount = root.append_child(ixb::xml_node(ram("GrandTotalAmount")));
  amount.set_attribute("currencyID", "EUR");
  amount.set_text("119.00");
  auto& when = root.append_child(ixb::xml_node(ram("IssueDateTime")));
  auto& dts = when.append_child(
      ixb::xml_node(ixb::qname(std::string(ixb::ns_udt), "DateTimeString")));
  dts.set_attribute("format", "102");
  dts.set_text("20230115");
  auto& note = root.append_child(ixb::xml_node(ram("Content")));
  note.set_attribute("languageID", "x\ty\nz\r");
  note.set_text("line one\r\nline two\r");

  auto xml = std::string(ixb::xml_prologue) + ixb::render_xml(root);
  auto parsed = ixb::parse_xml(xml);
  CHECK(parsed == root);
  CHECK(parsed.children().at(2).text() == "line one\r\nline two\r");
  CHECK(parsed.children().at(2).attribute("languageID") == "x\ty\nz\r");
}
