#include <ixb/namespaces.hpp>
#include <ixb/schema_validator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

  const std::string minimal_invoice =
      R"(<?xml version="1.0" encoding="UTF-8"?>
<rsm:CrossIndustryDocument xmlns:rsm="urn:ferd:CrossIndustryDocument:invoice:1p0" xmlns:ram="urn:un:unece:uncefact:data:standard:ReusableAggregateBusinessInformationEntity:12" xmlns:udt="urn:un:unece:uncefact:data:standard:UnqualifiedDataType:15">
  <rsm:HeaderExchangedDocument>
    <ram:ID>RE-1</ram:ID>
    <ram:IssueDateTime><udt:DateTimeString format="102">20230115</udt:DateTimeString></ram:IssueDateTime>
  </rsm:HeaderExchangedDocument>
</rsm:CrossIndustryDocument>)";

} // namespace

TEST_CASE("built-in ZUGFeRD profile", "[profile_validator]") {
  ixb::profile_validator validator;
  const auto* profile = validator.find(ixb::zugferd_1p0);
  REQUIRE(profile != nullptr);
  CHECK(profile->name == "ZUGFeRD1p0");
  CHECK(profile->root ==
        ixb::qname(std::string(ixb::ns_rsm), "CrossIndustryDocument"));
  CHECK(profile->namespaces.size() == 3);
  CHECK(validator.find("ZUGFeRD2p0") == nullptr);
}

TEST_CASE("profile_validator accepts a conforming document",
          "[profile_validator]") {
  ixb::profile_validator validator;
  auto result = validator.validate(minimal_invoice, ixb::zugferd_1p0);
  CHECK(result.passed);
  CHECK(static_cast<bool>(result));
  CHECK(result.details.empty());
}

TEST_CASE("profile_validator rejections", "[profile_validator]") {
  ixb::profile_validator validator;

  SECTION("unknown schema") {
    auto result = validator.validate(minimal_invoice, "XRechnung");
    CHECK_FALSE(result.passed);
    REQUIRE(result.details.size() == 1);
    CHECK(result.details[0] == "unknown schema 'XRechnung'");
  }
  SECTION("malformed bytes") {
    auto result =
        validator.validate("<rsm:CrossIndustryDocument", "ZUGFeRD1p0");
    CHECK_FALSE(result.passed);
    REQUIRE(result.details.size() == 1);
    CHECK(result.details[0].find("XML parse error") == 0);
  }
  SECTION("wrong root element") {
    auto result = validator.validate(
        R"(<rsm:HeaderExchangedDocument xmlns:rsm="urn:ferd:CrossIndustryDocument:invoice:1p0"/>)",
        ixb::zugferd_1p0);
    CHECK_FALSE(result.passed);
    REQUIRE(result.details.size() == 1);
    CHECK(result.details[0].find("root element is") == 0);
  }
  SECTION("foreign namespaces are reported per occurrence") {
    auto result = validator.validate(
        R"(<rsm:CrossIndustryDocument xmlns:rsm="urn:ferd:CrossIndustryDocument:invoice:1p0" xmlns:x="urn:other">)"
        R"(<x:Extra/><rsm:HeaderExchangedDocument x:flag="1"/></rsm:CrossIndustryDocument>)",
        ixb::zugferd_1p0);
    CHECK_FALSE(result.passed);
    REQUIRE(result.details.size() == 2);
    CHECK(result.details[0].find("element {urn:other}Extra") == 0);
    CHECK(result.details[1].find("attribute {urn:other}flag") == 0);
  }
}

TEST_CASE("profile_validator with a custom profile", "[profile_validator]") {
  ixb::profile_validator validator;
  validator.add(ixb::schema_profile{
      "Orders1", ixb::qname("urn:example:orders", "Order"),
      {"urn:example:orders"}});

  auto accepted = validator.validate(
      R"(<o:Order xmlns:o="urn:example:orders" id="1"/>)", "Orders1");
  CHECK(accepted.passed);

  auto rejected = validator.validate(
      R"(<o:Order xmlns:o="urn:example:orders"/>)", ixb::zugferd_1p0);
  CHECK_FALSE(rejected.passed);
  CHECK(validator.find(ixb::zugferd_1p0) != nullptr);
}
