#include <ixb/element.hpp>
#include <ixb/invoice.hpp>
#include <ixb/namespaces.hpp>

#include <functional>
#include <string>

namespace ixb {

  namespace {

    using type_fn = const element_type& (*)();

    qname
    rsm(std::string local_name) {
      return qname{std::string(ns_rsm), std::move(local_name)};
    }

    qname
    ram(std::string local_name) {
      return qname{std::string(ns_ram), std::move(local_name)};
    }

    template <typename Payload>
    std::function<value()>
    leaf_of(qname tag) {
      return [tag] { return value(leaf(tag, Payload{})); };
    }

    std::function<value()>
    nested(type_fn type) {
      return [type] { return value(element(type())); };
    }

    std::function<value()>
    repeated(type_fn type) {
      return [type] { return value(container(type())); };
    }

    template <typename Payload>
    std::function<value()>
    repeated_leaf(qname tag) {
      return [tag] { return value(container(leaf(tag, Payload{}))); };
    }

    // ===== document context and header =====

    const element_type&
    guideline_parameter_type() {
      static const element_type type =
          element_type::builder(
              ram("GuidelineSpecifiedDocumentContextParameter"))
              .field("id", leaf_of<text_value>(ram("ID")))
              .build();
      return type;
    }

    const element_type&
    note_type() {
      static const element_type type =
          element_type::builder(ram("IncludedNote"))
              .field("content", leaf_of<text_value>(ram("Content")))
              .field("subject_code", leaf_of<text_value>(ram("SubjectCode")))
              .build();
      return type;
    }

    // ===== trade parties =====

    const element_type&
    legal_organization_type() {
      static const element_type type =
          element_type::builder(ram("SpecifiedLegalOrganization"))
              .field("id", leaf_of<agency_code>(ram("ID")))
              .build();
      return type;
    }

    const element_type&
    postal_address_type() {
      static const element_type type =
          element_type::builder(ram("PostalTradeAddress"))
              .field("postcode", leaf_of<text_value>(ram("PostcodeCode")))
              .field("line_one", leaf_of<text_value>(ram("LineOne")))
              .field("city", leaf_of<text_value>(ram("CityName")))
              .field("country_id", leaf_of<text_value>(ram("CountryID")))
              .build();
      return type;
    }

    const element_type&
    tax_registration_type() {
      static const element_type type =
          element_type::builder(ram("SpecifiedTaxRegistration"))
              .field("id", leaf_of<identifier>(ram("ID")))
              .build();
      return type;
    }

    // ===== trade transaction =====

    const element_type&
    agreement_type() {
      static const element_type type =
          element_type::builder(ram("ApplicableSupplyChainTradeAgreement"))
              .field("buyer_reference",
                     leaf_of<text_value>(ram("BuyerReference")))
              .field("seller", nested(seller_trade_party_type))
              .field("buyer", nested(buyer_trade_party_type))
              .build();
      return type;
    }

    const element_type&
    delivery_event_type() {
      static const element_type type =
          element_type::builder(ram("ActualDeliverySupplyChainEvent"))
              .field("occurrence",
                     leaf_of<date_value>(ram("OccurrenceDateTime")))
              .build();
      return type;
    }

    const element_type&
    delivery_type() {
      static const element_type type =
          element_type::builder(ram("ApplicableSupplyChainTradeDelivery"))
              .field("event", nested(delivery_event_type))
              .build();
      return type;
    }

    const element_type&
    payment_means_type() {
      static const element_type type =
          element_type::builder(ram("SpecifiedTradeSettlementPaymentMeans"))
              .field("type_code", leaf_of<text_value>(ram("TypeCode")))
              .field("information", leaf_of<text_value>(ram("Information")))
              .build();
      return type;
    }

    const element_type&
    settlement_type() {
      static const element_type type =
          element_type::builder(ram("ApplicableSupplyChainTradeSettlement"))
              .field("currency_code",
                     leaf_of<text_value>(ram("InvoiceCurrencyCode")))
              .field("payment_means", repeated(payment_means_type), true)
              .field("monetary_summation", nested(monetary_summation_type))
              .build();
      return type;
    }

    // ===== line items =====

    const element_type&
    line_document_type() {
      static const element_type type =
          element_type::builder(ram("AssociatedDocumentLineDocument"))
              .field("line_id", leaf_of<text_value>(ram("LineID")))
              .build();
      return type;
    }

    const element_type&
    gross_price_type() {
      static const element_type type =
          element_type::builder(ram("GrossPriceProductTradePrice"))
              .field("amount", leaf_of<currency_amount>(ram("ChargeAmount")))
              .field("basis_quantity", leaf_of<quantity>(ram("BasisQuantity")))
              .build();
      return type;
    }

    const element_type&
    line_agreement_type() {
      static const element_type type =
          element_type::builder(ram("SpecifiedSupplyChainTradeAgreement"))
              .field("gross_price", nested(gross_price_type))
              .build();
      return type;
    }

    const element_type&
    line_delivery_type() {
      static const element_type type =
          element_type::builder(ram("SpecifiedSupplyChainTradeDelivery"))
              .field("billed_quantity",
                     leaf_of<quantity>(ram("BilledQuantity")))
              .build();
      return type;
    }

    const element_type&
    line_summation_type() {
      static const element_type type =
          element_type::builder(
              ram("SpecifiedTradeSettlementMonetarySummation"))
              .field("line_total",
                     leaf_of<currency_amount>(ram("LineTotalAmount")))
              .build();
      return type;
    }

    const element_type&
    line_settlement_type() {
      static const element_type type =
          element_type::builder(ram("SpecifiedSupplyChainTradeSettlement"))
              .field("monetary_summation", nested(line_summation_type))
              .build();
      return type;
    }

    const element_type&
    product_classification_type() {
      static const element_type type =
          element_type::builder(ram("DesignatedProductClassification"))
              .field("class_code", leaf_of<classification>(ram("ClassCode")))
              .build();
      return type;
    }

    const element_type&
    product_type() {
      static const element_type type =
          element_type::builder(ram("SpecifiedTradeProduct"))
              .field("global_id", leaf_of<identifier>(ram("GlobalID")))
              .field("seller_assigned_id",
                     leaf_of<text_value>(ram("SellerAssignedID")))
              .field("name", leaf_of<text_value>(ram("Name")))
              .field("classifications", repeated(product_classification_type),
                     true)
              .build();
      return type;
    }

  } // namespace

  const element_type&
  invoice_document_type() {
    static const element_type type =
        element_type::builder(rsm("CrossIndustryDocument"))
            .field("context", nested(document_context_type), true)
            .field("header", nested(header_type), true)
            .field("trade", nested(trade_transaction_type), true)
            .build();
    return type;
  }

  const element_type&
  document_context_type() {
    static const element_type type =
        element_type::builder(rsm("SpecifiedExchangedDocumentContext"))
            .field("test_indicator", leaf_of<indicator>(ram("TestIndicator")))
            .field("guideline_parameter", nested(guideline_parameter_type))
            .build();
    return type;
  }

  const element_type&
  header_type() {
    static const element_type type =
        element_type::builder(rsm("HeaderExchangedDocument"))
            .field("id", leaf_of<text_value>(ram("ID")))
            .field("name", leaf_of<text_value>(ram("Name")))
            .field("type_code", leaf_of<text_value>(ram("TypeCode")))
            .field("issue_date_time", leaf_of<date_value>(ram("IssueDateTime")))
            .field("notes", repeated(note_type), true)
            .build();
    return type;
  }

  const element_type&
  trade_transaction_type() {
    static const element_type type =
        element_type::builder(rsm("SpecifiedSupplyChainTradeTransaction"))
            .field("agreement", nested(agreement_type))
            .field("delivery", nested(delivery_type))
            .field("settlement", nested(settlement_type))
            .field("line_items", repeated(line_item_type), true)
            .build();
    return type;
  }

  const element_type&
  trade_party_type() {
    static const element_type type =
        element_type::builder(ram("TradeParty"))
            .field("id", leaf_of<text_value>(ram("ID")))
            .field("global_ids", repeated_leaf<identifier>(ram("GlobalID")),
                   true)
            .field("name", leaf_of<text_value>(ram("Name")))
            .field("legal_organization", nested(legal_organization_type))
            .field("address", nested(postal_address_type))
            .field("tax_registrations", repeated(tax_registration_type), true)
            .build();
    return type;
  }

  const element_type&
  seller_trade_party_type() {
    static const element_type type =
        element_type::builder(ram("SellerTradeParty"))
            .inherit(trade_party_type())
            .build();
    return type;
  }

  const element_type&
  buyer_trade_party_type() {
    static const element_type type =
        element_type::builder(ram("BuyerTradeParty"))
            .inherit(trade_party_type())
            .build();
    return type;
  }

  const element_type&
  monetary_summation_type() {
    static const element_type type =
        element_type::builder(ram("SpecifiedTradeSettlementMonetarySummation"))
            .field("line_total",
                   leaf_of<currency_amount>(ram("LineTotalAmount")))
            .field("tax_basis_total",
                   leaf_of<currency_amount>(ram("TaxBasisTotalAmount")))
            .field("tax_total", leaf_of<currency_amount>(ram("TaxTotalAmount")))
            .field("grand_total",
                   leaf_of<currency_amount>(ram("GrandTotalAmount")))
            .build();
    return type;
  }

  const element_type&
  line_item_type() {
    static const element_type type =
        element_type::builder(ram("IncludedSupplyChainTradeLineItem"))
            .field("document", nested(line_document_type))
            .field("agreement", nested(line_agreement_type))
            .field("delivery", nested(line_delivery_type))
            .field("settlement", nested(line_settlement_type))
            .field("product", nested(product_type))
            .build();
    return type;
  }

  document
  make_invoice_document() {
    return document(invoice_document_type(), std::string(zugferd_1p0));
  }

} // namespace ixb
