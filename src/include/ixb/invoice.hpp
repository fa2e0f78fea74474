#pragma once

#include <ixb/document.hpp>
#include <ixb/element_type.hpp>

namespace ixb {

  // ZUGFeRD 1.0 (Cross Industry Invoice) element types. Field names are the
  // keys accepted by element::set / leaf_at / element_at / container_at.

  // rsm:CrossIndustryDocument
  //   context: SpecifiedExchangedDocumentContext
  //   header:  HeaderExchangedDocument
  //   trade:   SpecifiedSupplyChainTradeTransaction
  const element_type&
  invoice_document_type();

  // test_indicator, guideline_parameter{id}
  const element_type&
  document_context_type();

  // id, name, type_code, issue_date_time, notes[content, subject_code]
  const element_type&
  header_type();

  // agreement{buyer_reference, seller, buyer}, delivery{event{occurrence}},
  // settlement{currency_code, payment_means[], monetary_summation},
  // line_items[]
  const element_type&
  trade_transaction_type();

  // id, global_ids[], name, legal_organization{id}, address{postcode,
  // line_one, city, country_id}, tax_registrations[{id}]
  const element_type&
  trade_party_type();
  const element_type&
  seller_trade_party_type();
  const element_type&
  buyer_trade_party_type();

  // line_total, tax_basis_total, tax_total, grand_total
  const element_type&
  monetary_summation_type();

  // document{line_id}, agreement{gross_price{amount, basis_quantity}},
  // delivery{billed_quantity}, settlement{monetary_summation{line_total}},
  // product{global_id, seller_assigned_id, name, classifications[]}
  const element_type&
  line_item_type();

  // A fresh invoice bound to the ZUGFeRD 1.0 profile.
  document
  make_invoice_document();

} // namespace ixb
