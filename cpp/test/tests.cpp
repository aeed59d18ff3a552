#include "invoice_check.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using namespace invoice_check;

static InvoiceHeader sample_header() {
  InvoiceHeader h;
  h.invoice_number = "INV-2024-0042";
  h.invoice_date = "05-Jan-24";
  h.place_of_supply = "29";
  h.place_of_origin = 29;
  h.receiver_name = "Acme Traders";
  h.gstin_supplier = "29ABCDE1234F1Z5";
  h.taxable_value = 1000;
  h.invoice_value = "1180";
  h.tax_amount = 180;
  return h;
}

static LineItem sample_line() {
  LineItem l;
  l.quantity = 10;
  l.rate_per_item_after_discount = 100;
  l.taxable_value = 1000;
  l.sgst_rate = 9;
  l.cgst_rate = 9;
  l.igst_rate = 0;
  l.tax_amount = 180;
  l.final_amount = 1180;
  return l;
}

static SummaryTotals sample_summary() {
  SummaryTotals s;
  s.total_taxable_value = 1000;
  s.total_cgst_amount = 90;
  s.total_sgst_amount = 90;
  s.total_igst_amount = 0;
  s.total_tax_amount = 180;
  s.total_invoice_value = 1180;
  s.rounding_adjustment = 0;
  return s;
}

static InvoiceDocument sample_document() {
  InvoiceDocument doc;
  doc.invoice_details.push_back(sample_header());
  doc.line_items.push_back(sample_line());
  doc.total_summary.push_back(sample_summary());
  return doc;
}

static InvoiceDocument one_line(const LineItem& item) {
  InvoiceDocument doc = sample_document();
  doc.line_items = {item};
  return doc;
}

static void test_valid_document_passes() {
  Verdict v = validate_invoice(sample_document());
  assert(v.passed);
  assert(v.step == "All Steps");
  assert(v.details == "Validation successful");
  assert(!v.error.has_value());
}

static void test_header_relation_consistent() {
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].invoice_value = 118;
  doc.invoice_details[0].taxable_value = 100;
  doc.invoice_details[0].tax_amount = 18;
  check_types(doc);
  check_relations(doc);
}

static void test_header_relation_mismatch() {
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].invoice_value = 120;
  doc.invoice_details[0].taxable_value = 100;
  doc.invoice_details[0].tax_amount = 18;

  Verdict v = validate_invoice(doc);
  assert(!v.passed);
  assert(v.step == "Step 3: Relations");
  assert(v.details == "Invoice value mismatch at row 0: 120 != 100 + 18");
  assert(v.error->relation == "invoice_value");
  assert(*v.error->lhs == 120);
  assert(*v.error->rhs == 118);
  assert(v.error->path == "$.invoice_details[0].invoice_value");
}

static void test_line_rates_agree_with_amount() {
  LineItem l;
  l.taxable_value = 1000;
  l.sgst_rate = 9;
  l.cgst_rate = 9;
  l.igst_rate = 0;
  l.tax_amount = 180;

  InvoiceDocument doc = one_line(l);
  check_types(doc);
  auto est = line_tax_estimates(doc.line_items[0], 1000);
  assert(est.size() == 2);
  assert(est[0] == 180 && est[1] == 180);
  assert(validate_invoice(one_line(l)).passed);
}

static void test_missing_gstin_supplier() {
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].gstin_supplier = nullptr;

  Verdict v = validate_invoice(doc);
  assert(!v.passed);
  assert(v.step == "Step 1: Missing Values");
  assert(v.details == "Missing required values in invoice_details: gstin_supplier at row 0");
  assert(v.error->fields.size() == 1 && v.error->fields[0] == "gstin_supplier");
  assert(v.error->collection == "invoice_details");
  assert(*v.error->row == 0);
}

static void test_summary_total_mismatch() {
  InvoiceDocument doc = sample_document();
  SummaryTotals s;
  s.total_taxable_value = 5000;
  s.total_cgst_amount = 450;
  s.total_sgst_amount = 450;
  s.total_igst_amount = 0;
  s.total_invoice_value = 5900;
  doc.total_summary = {s};

  Verdict v = validate_invoice(doc);
  assert(!v.passed);
  assert(v.step == "Step 3: Relations");
  assert(v.details == "Total invoice value mismatch at row 0: 5900 != 5000 + 900");
  assert(v.error->relation == "total_invoice_value");
}

static void test_normalizer_null_tokens() {
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].receiver_name = "None";
  doc.invoice_details[0].place_of_origin = "NaN";
  doc.line_items[0].quantity = "";
  doc.line_items[0].igst_rate = "NULL";
  doc.line_items[0].tax_rate = std::numeric_limits<double>::quiet_NaN();
  doc.line_items[0].sgst_amount = "  ";
  doc.total_summary[0].rounding_adjustment = "nan ";

  InvoiceDocument out = normalize_nulls(doc);
  assert(out.invoice_details[0].receiver_name.is_null());
  assert(out.invoice_details[0].place_of_origin.is_null());
  assert(out.line_items[0].quantity.is_null());
  assert(out.line_items[0].igst_rate.is_null());
  assert(out.line_items[0].tax_rate.is_null());
  // Only exact tokens are null-like.
  assert(out.line_items[0].sgst_amount.as_string() == "  ");
  assert(out.total_summary[0].rounding_adjustment.as_string() == "nan ");
  // Everything else is untouched.
  assert(out.invoice_details[0].invoice_number.as_string() == "INV-2024-0042");
  assert(out.invoice_details[0].taxable_value.as_number() == 1000);

  InvoiceDocument again = normalize_nulls(out);
  assert(dumps_json(document_to_json(again)) == dumps_json(document_to_json(out)));
}

static void test_null_token_fails_presence() {
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].invoice_number = "none";
  doc.invoice_details[0].tax_amount = "";

  Verdict v = validate_invoice(doc);
  assert(v.step == "Step 1: Missing Values");
  assert(v.details == "Missing required values in invoice_details: invoice_number, tax_amount at row 0");
}

static void test_custom_null_tokens() {
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].receiver_name = "N/A";
  assert(validate_invoice(doc).passed);

  CheckConfig cfg;
  cfg.null_tokens.push_back("n/a");
  Verdict v = validate_invoice(doc, cfg);
  assert(v.step == "Step 1: Missing Values");
  assert(v.error->fields[0] == "receiver_name");
}

static void test_presence_order_and_short_circuit() {
  InvoiceDocument doc = sample_document();
  LineItem incomplete;
  incomplete.taxable_value = 500;  // no tax representation
  doc.line_items.push_back(incomplete);
  doc.line_items.push_back(incomplete);
  doc.total_summary[0] = SummaryTotals{};

  Verdict v = validate_invoice(doc);
  assert(v.step == "Step 1: Missing Values");
  assert(v.details == "Missing required values in line_items at row 1");
  assert(v.error->path == "$.line_items[1]");

  auto all = check_presence_all(normalize_nulls(doc));
  assert(all.size() == 3);
  assert(all[0].path == "$.line_items[1]");
  assert(all[1].path == "$.line_items[2]");
  assert(all[2].path == "$.total_summary[0]");
}

static void test_header_value_alternatives() {
  InvoiceHeader h = sample_header();
  h.taxable_value = nullptr;
  assert(header_is_complete(h));

  h.invoice_value = nullptr;
  assert(!header_is_complete(h));
  auto missing = missing_header_fields(h);
  assert(missing.size() == 2);
  assert(missing[0] == "taxable_value");
  assert(missing[1] == "invoice_value");

  // A failing row lists every absent field, alternatives included.
  h.invoice_value = 1180;
  h.place_of_supply = nullptr;
  missing = missing_header_fields(h);
  assert(missing.size() == 2);
  assert(missing[0] == "place_of_supply");
  assert(missing[1] == "taxable_value");

  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].gstin_supplier = nullptr;
  doc.invoice_details[0].taxable_value = nullptr;
  doc.invoice_details[0].invoice_value = 118;
  Verdict v = validate_invoice(doc);
  assert(v.details == "Missing required values in invoice_details: gstin_supplier, taxable_value at row 0");
  assert(v.error->fields.size() == 2);
}

static void test_line_item_presence_groups() {
  LineItem l;
  l.taxable_value = 100;
  assert(!line_item_is_complete(l));

  l.sgst_amount = 9;
  assert(!line_item_is_complete(l));
  l.cgst_amount = 9;
  assert(line_item_is_complete(l));

  LineItem r;
  r.igst_rate = 18;
  r.rate_per_item_after_discount = 10;
  assert(!line_item_is_complete(r));
  r.quantity = 3;
  assert(line_item_is_complete(r));

  LineItem f;
  f.final_amount = 118;
  f.sgst_rate = 9;
  assert(!line_item_is_complete(f));
  f.cgst_rate = 9;
  assert(line_item_is_complete(f));
}

static void test_summary_presence_groups() {
  SummaryTotals s;
  s.total_invoice_value = 1180;
  s.total_cgst_amount = 90;
  assert(!summary_is_complete(s));
  s.total_sgst_amount = 90;
  assert(summary_is_complete(s));

  SummaryTotals t;
  t.total_igst_amount = 180;
  assert(!summary_is_complete(t));
  t.total_taxable_value = 1000;
  assert(summary_is_complete(t));
}

static void test_invoice_date_parsing() {
  auto d = parse_invoice_date("05-Jan-24");
  assert(d && d->year == 2024 && d->month == 1 && d->day == 5);
  assert(format_iso_date(*d) == "2024-01-05");

  auto lower = parse_invoice_date("5-jan-24");
  assert(lower && lower->day == 5);

  auto leap = parse_invoice_date("29-Feb-24");
  assert(leap && leap->month == 2);
  assert(!parse_invoice_date("29-Feb-23"));
  assert(!parse_invoice_date("31-Apr-24"));
  assert(!parse_invoice_date("00-Jan-24"));

  auto old = parse_invoice_date("31-Dec-69");
  assert(old && old->year == 1969);
  auto edge = parse_invoice_date("01-Jan-68");
  assert(edge && edge->year == 2068);

  assert(!parse_invoice_date("2024-01-05"));
  assert(!parse_invoice_date("05-Jan-2024"));
  assert(!parse_invoice_date("05/Jan/24"));
  assert(!parse_invoice_date("05-January-24"));
  assert(!parse_invoice_date(" 05-Jan-24"));
}

static void test_decimal_parsing() {
  assert(*parse_decimal("1000") == 1000);
  assert(*parse_decimal(" 1000.50 ") == 1000.5);
  assert(*parse_decimal("-2.5e2") == -250);
  assert(*parse_decimal(".5") == 0.5);
  assert(*parse_decimal("+7") == 7);
  assert(!parse_decimal(""));
  assert(!parse_decimal("."));
  assert(!parse_decimal("1,000"));
  assert(!parse_decimal("12 pcs"));
  assert(!parse_decimal("0x1A"));
  assert(!parse_decimal("inf"));
  assert(!parse_decimal("1e"));
  assert(!parse_decimal("1e999"));
}

static void test_type_failure_reports_field() {
  InvoiceDocument doc = sample_document();
  doc.line_items[0].quantity = "12 pcs";

  Verdict v = validate_invoice(doc);
  assert(!v.passed);
  assert(v.step == "Step 2: Data Types");
  assert(v.details == "Data type conversion failed: line_items.quantity \"12 pcs\" at row 0 is not a number");
  assert(v.error->path == "$.line_items[0].quantity");
  assert(v.error->fields[0] == "quantity");
}

static void test_type_coercion_rewrites_cells() {
  InvoiceDocument doc = sample_document();
  doc.line_items[0].taxable_value = " 1000.00 ";
  check_types(doc);
  assert(doc.invoice_details[0].invoice_date.as_string() == "2024-01-05");
  assert(doc.invoice_details[0].place_of_supply.as_number() == 29);
  assert(doc.invoice_details[0].invoice_value.as_number() == 1180);
  assert(doc.line_items[0].taxable_value.as_number() == 1000);
  // Text fields are left alone.
  assert(doc.invoice_details[0].gstin_supplier.as_string() == "29ABCDE1234F1Z5");
}

static void test_type_check_order() {
  InvoiceDocument doc = sample_document();
  LineItem second = sample_line();
  second.quantity = "ten";
  doc.line_items.push_back(second);
  doc.line_items[0].sgst_rate = "nine";
  doc.invoice_details[0].place_of_supply = "KA";
  doc.invoice_details[0].invoice_date = "2024-01-05";

  // Dates first.
  Verdict v = validate_invoice(doc);
  assert(v.error->path == "$.invoice_details[0].invoice_date");
  assert(v.details.find("does not match format DD-Mon-YY") != std::string::npos);

  // Then header numerics.
  doc.invoice_details[0].invoice_date = "05-Jan-24";
  v = validate_invoice(doc);
  assert(v.error->path == "$.invoice_details[0].place_of_supply");

  // Then line items column by column: quantity precedes sgst_rate even on a later row.
  doc.invoice_details[0].place_of_supply = 29;
  v = validate_invoice(doc);
  assert(v.error->path == "$.line_items[1].quantity");

  auto all = validate_invoice_all(doc);
  assert(all.size() == 2);
  assert(all[0].path == "$.line_items[1].quantity");
  assert(all[1].path == "$.line_items[0].sgst_rate");
}

static void test_non_scalar_types_rejected() {
  InvoiceDocument doc = sample_document();
  doc.total_summary[0].rounding_adjustment = true;
  Verdict v = validate_invoice(doc);
  assert(v.step == "Step 2: Data Types");
  assert(v.error->path == "$.total_summary[0].rounding_adjustment");

  doc = sample_document();
  doc.invoice_details[0].invoice_date = 45296;
  v = validate_invoice(doc);
  assert(v.step == "Step 2: Data Types");
  assert(v.details.find("is not a DD-Mon-YY date") != std::string::npos);
}

static void test_is_close_relative() {
  assert(is_close(100, 100));
  assert(is_close(100, 100.0009));
  assert(!is_close(100, 100.0011));
  assert(!is_close(0, 1e-9));

  CheckConfig cfg;
  cfg.absolute_tolerance = 1e-8;
  assert(is_close(0, 1e-9, cfg));

  // Differences sitting on the threshold agree.
  assert(is_close(100000, 100001));
  CheckConfig half;
  half.relative_tolerance = 0.5;
  assert(is_close(1, 2, half));
  assert(!is_close(1, 2.5, half));
  CheckConfig abs_only;
  abs_only.relative_tolerance = 0;
  abs_only.absolute_tolerance = 0.5;
  assert(is_close(0, 0.5, abs_only));
  assert(!is_close(0, 0.75, abs_only));
}

static void test_overflow_never_agrees() {
  const double inf = std::numeric_limits<double>::infinity();
  assert(!is_close(inf, 5));
  assert(!is_close(5, -inf));
  assert(!is_close(1e308, inf));

  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].invoice_value = 1e308;
  doc.invoice_details[0].taxable_value = 1e308;
  doc.invoice_details[0].tax_amount = 1e308;
  Verdict v = validate_invoice(doc);
  assert(!v.passed);
  assert(v.step == "Step 3: Relations");
  assert(v.error->relation == "invoice_value");

  LineItem l;
  l.rate_per_item_after_discount = 1e200;
  l.quantity = 1e200;
  l.tax_rate = 18;
  l.tax_amount = 5;
  l.final_amount = 7;
  v = validate_invoice(one_line(l));
  assert(!v.passed);
  assert(v.step == "Step 3: Relations");
  assert(v.error->relation == "line_tax");

  auto all = validate_invoice_all(one_line(l));
  assert(all.size() == 2);
  assert(all[1].relation == "final_amount");
}

static LineItem split_tax_line(double component, double tax_amount) {
  LineItem l;
  l.taxable_value = component * 1000 / 90;
  l.sgst_amount = component;
  l.cgst_amount = component;
  l.igst_amount = 0;
  l.tax_amount = tax_amount;
  return l;
}

static void test_tolerance_scales_with_magnitude() {
  // Threshold is 1e-5 of 180.0017 (about 0.0018).
  assert(validate_invoice(one_line(split_tax_line(90, 180.0017))).passed);
  Verdict v = validate_invoice(one_line(split_tax_line(90, 180.0019)));
  assert(!v.passed);
  assert(v.details == "Tax amount mismatch at row 0: Different tax calculations yield different results");
  assert(v.error->relation == "line_tax");

  // Same ratios a thousand times larger keep the same verdicts.
  assert(validate_invoice(one_line(split_tax_line(90000, 180001.7))).passed);
  assert(!validate_invoice(one_line(split_tax_line(90000, 180001.9))).passed);
}

static void test_successive_estimates_compared() {
  LineItem l;
  l.taxable_value = 1000;
  l.sgst_amount = 90;
  l.cgst_amount = 90;
  l.igst_amount = 0;
  l.tax_amount = 180;
  l.tax_rate = 12;  // 120, disagrees with the third estimate

  Verdict v = validate_invoice(one_line(l));
  assert(v.step == "Step 3: Relations");
  assert(*v.error->lhs == 180);
  assert(*v.error->rhs == 120);
}

static void test_absent_fields_skip_arithmetic() {
  // sgst + cgst satisfy presence but without igst the component estimate is unavailable.
  LineItem l;
  l.taxable_value = 1000;
  l.sgst_amount = 1;
  l.cgst_amount = 2;
  l.final_amount = 99999;
  InvoiceDocument doc = one_line(l);
  assert(validate_invoice(doc).passed);

  // No base value: the row's relations are skipped entirely.
  LineItem m;
  m.final_amount = 1180;
  m.sgst_amount = 90;
  m.cgst_amount = 90;
  m.igst_amount = 0;
  m.tax_amount = 5;
  assert(!line_base_value(m).defined());
  assert(validate_invoice(one_line(m)).passed);
}

static void test_final_amount_from_rate_and_quantity() {
  LineItem l;
  l.rate_per_item_after_discount = "50";
  l.quantity = "20";
  l.tax_rate = 18;
  l.final_amount = 1180;
  assert(validate_invoice(one_line(l)).passed);

  l.final_amount = 1200;
  Verdict v = validate_invoice(one_line(l));
  assert(v.step == "Step 3: Relations");
  assert(v.details == "Final amount mismatch at row 0: 1200 != 1000 + 180");
  assert(v.error->path == "$.line_items[0].final_amount");
}

static void test_final_amount_uses_first_estimate() {
  LineItem l;
  l.taxable_value = 200;
  l.igst_rate = 5;
  l.sgst_rate = 0;
  l.cgst_rate = 0;
  l.final_amount = 210;
  InvoiceDocument doc = one_line(l);
  check_types(doc);
  Resolved base = line_base_value(doc.line_items[0]);
  assert(base.defined() && base.value == 200);
  auto est = line_tax_estimates(doc.line_items[0], base.value);
  assert(est.size() == 1 && est[0] == 10);
  check_relations(doc);
}

static void test_summary_total_tax_resolution() {
  SummaryTotals s;
  s.total_tax_amount = 180;
  s.total_cgst_amount = 1;
  assert(summary_total_tax(s).defined() && summary_total_tax(s).value == 180);

  SummaryTotals t;
  t.total_cgst_amount = 90;
  t.total_sgst_amount = 90;
  t.total_igst_amount = 0;
  assert(summary_total_tax(t).value == 180);

  // Incomplete triple: not applicable, and the invoice-total relation is skipped.
  t.total_igst_amount = nullptr;
  assert(summary_total_tax(t).state == Resolved::State::NotApplicable);
  t.total_taxable_value = 1000;
  t.total_invoice_value = 99999;
  InvoiceDocument doc = sample_document();
  doc.total_summary = {t};
  assert(validate_invoice(doc).passed);
}

static void test_collect_all_mode() {
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].invoice_value = 2000;
  doc.line_items.push_back(sample_line());
  doc.line_items[1].final_amount = 1;
  doc.total_summary[0].total_invoice_value = 3;
  doc.total_summary[0].rounding_adjustment = "round";

  Verdict first = validate_invoice(doc);
  assert(first.step == "Step 2: Data Types");

  auto all = validate_invoice_all(doc);
  assert(all.size() == 4);
  assert(all[0].kind == "type");
  assert(all[1].relation == "invoice_value");
  assert(all[2].relation == "final_amount");
  assert(*all[2].row == 1);
  assert(all[3].relation == "total_invoice_value");
  assert(step_for_kind(all[3].kind) == "Step 3: Relations");

  assert(validate_invoice_all(sample_document()).empty());
}

static void test_repeat_runs_and_input_untouched() {
  InvoiceDocument doc = sample_document();
  doc.line_items[0].final_amount = 1190;
  Verdict a = validate_invoice(doc);
  Verdict b = validate_invoice(doc);
  assert(a.passed == b.passed && a.step == b.step && a.details == b.details);
  assert(doc.invoice_details[0].invoice_date.as_string() == "05-Jan-24");
  assert(doc.invoice_details[0].invoice_value.as_string() == "1180");
}

static void test_cross_totals_opt_in() {
  InvoiceDocument doc = sample_document();
  doc.line_items.push_back(sample_line());  // lines now sum to 2000 taxable

  assert(validate_invoice(doc).passed);

  CheckConfig cfg;
  cfg.cross_check_totals = true;
  Verdict v = validate_invoice(doc, cfg);
  assert(!v.passed);
  assert(v.error->relation == "line_taxable_total");
  assert(v.details == "Total taxable value mismatch at row 0: 1000 != sum of line items 2000");

  auto all = validate_invoice_all(doc, cfg);
  assert(all.size() == 2);
  assert(all[1].relation == "line_tax_total");

  InvoiceDocument ok = sample_document();
  assert(validate_invoice(ok, cfg).passed);
  ok.invoice_details[0].invoice_value = 1180.5;
  ok.invoice_details[0].taxable_value = 1000.5;
  v = validate_invoice(ok, cfg);
  assert(v.error->relation == "header_invoice_total");
}

static void test_config_validation() {
  CheckConfig cfg;
  cfg.relative_tolerance = -1;
  try {
    (void)validate_invoice(sample_document(), cfg);
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.kind == "config");
    assert(e.path == "$.relative_tolerance");
  }

  cfg = CheckConfig{};
  cfg.absolute_tolerance = std::numeric_limits<double>::infinity();
  try {
    validate_config(cfg);
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.path == "$.absolute_tolerance");
  }
}

static const char* kExtractionResponse =
    "Here is the extracted invoice:\n"
    "```json\n"
    "{\n"
    "  \"Invoice Details\": {\"invoice_number\": \"INV-7\", \"invoice_date\": \"05-Jan-24\",\n"
    "    \"place_of_supply\": \"29\", \"place_of_origin\": \"29\", \"receiver_name\": \"Acme\",\n"
    "    \"gstin_supplier\": \"29ABCDE1234F1Z5\", \"taxable_value\": \"1000\", \"invoice_value\": \"1180\",\n"
    "    \"tax_amount\": \"180\", \"irn\": \"ignored\"},\n"
    "  \"Line Items\": [\n"
    "    {\"quantity\": 10, \"rate_per_item_after_discount\": 100, \"taxable_value\": None,\n"
    "     \"sgst_rate\": 9, \"cgst_rate\": 9, \"igst_rate\": 0, \"tax_amount\": 180, \"final_amount\": 1180,},\n"
    "  ],\n"
    "  \"Total Summary\": {\"total_taxable_value\": 1000, \"total_cgst_amount\": 90, \"total_sgst_amount\": 90,\n"
    "    \"total_igst_amount\": \"\", \"total_tax_amount\": \"nan\", \"total_invoice_value\": 1180,\n"
    "    \"rounding_adjustment\": null}\n"
    "}\n"
    "```\n";

static void test_payload_materialization() {
  InvoiceDocument doc = document_from_json(loads_jsonish(kExtractionResponse));
  assert(doc.invoice_details.size() == 1);
  assert(doc.line_items.size() == 1);
  assert(doc.total_summary.size() == 1);
  assert(doc.invoice_details[0].invoice_number.as_string() == "INV-7");
  assert(doc.line_items[0].taxable_value.is_null());
  assert(doc.line_items[0].quantity.as_number() == 10);
  assert(doc.total_summary[0].total_tax_amount.as_string() == "nan");

  Verdict v = validate_invoice_json(kExtractionResponse);
  assert(v.passed);

  // Schema fields survive a trip through document_to_json().
  InvoiceDocument back = document_from_json(document_to_json(doc));
  assert(dumps_json(document_to_json(back)) == dumps_json(document_to_json(doc)));
}

static void test_payload_missing_sections() {
  InvoiceDocument doc = document_from_json(loads_jsonish("{\"Invoice Details\": {}, \"Line Items\": []}"));
  assert(doc.invoice_details.size() == 1);
  assert(doc.line_items.empty());
  assert(doc.total_summary.size() == 1);

  Verdict v = validate_invoice_json(
      "{\"Invoice Details\": {\"invoice_number\": \"A1\", \"invoice_date\": \"01-Feb-24\", \"place_of_supply\": 7,"
      " \"place_of_origin\": 7, \"receiver_name\": \"R\", \"gstin_supplier\": \"G\", \"invoice_value\": 10,"
      " \"tax_amount\": 1}}");
  assert(v.step == "Step 1: Missing Values");
  assert(v.details == "Missing required values in total_summary at row 0");
}

static void test_payload_shape_errors() {
  auto expect_parse_error = [](const std::string& text, const std::string& path) {
    try {
      (void)document_from_json(loads_jsonish(text));
      assert(false && "expected ValidationError");
    } catch (const ValidationError& e) {
      assert(e.kind == "parse");
      assert(e.path == path);
    }
  };

  expect_parse_error("[1, 2]", "$");
  expect_parse_error("{\"Line Items\": {\"quantity\": 1}}", "$.Line Items");
  expect_parse_error("{\"Line Items\": [{\"quantity\": 1}, 5]}", "$.Line Items[1]");
  expect_parse_error("{\"Line Items\": [{\"quantity\": [1, 2]}]}", "$.Line Items[0].quantity");
  expect_parse_error("{\"Total Summary\": \"none\"}", "$.Total Summary");
  expect_parse_error("{\"Invoice Details\": {\"tax_amount\": {}}}", "$.Invoice Details.tax_amount");
  expect_parse_error("{\"Invoice Details\": [{}, {\"tax_amount\": []}]}", "$.Invoice Details[1].tax_amount");
}

static void test_payload_errors_share_reader_paths() {
  std::string reader_path;
  std::string shape_path;
  try {
    (void)validate_invoice_json("{\"Line Items\": [{\"quantity\": 1 \"rate\": 2}]}");
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    reader_path = e.path;
  }
  try {
    (void)validate_invoice_json("{\"Line Items\": [7]}");
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    shape_path = e.path;
  }
  assert(reader_path == "$.Line Items[0]");
  assert(shape_path == "$.Line Items[0]");
  assert(json_pointer_from_path(shape_path) == "/Line Items/0");
}

static void test_strict_json_rejects_repairs() {
  const std::string text =
      "{\"Invoice Details\": {\"invoice_number\": \"A1\", \"invoice_date\": \"01-Feb-24\", \"place_of_supply\": 7,"
      " \"place_of_origin\": 7, \"receiver_name\": \"R\", \"gstin_supplier\": \"G\", \"invoice_value\": 11,"
      " \"taxable_value\": None, \"tax_amount\": 1},"
      " \"Total Summary\": {\"total_invoice_value\": 11, \"total_taxable_value\": 10, \"total_tax_amount\": 1}}";

  assert(validate_invoice_json(text).passed);

  try {
    (void)validate_invoice_json(text, CheckConfig{}, strict_repair_config());
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.kind == "parse");
    assert(e.path == "$.Invoice Details.taxable_value");
  }
}

static void test_jsonish_reader() {
  Json v = loads_jsonish("// extracted\n{\"a\": NaN, \"b\": \"caf\\u00e9\", 'c': True, \"d\": [1, 2,],}");
  const auto& o = v.as_object();
  assert(std::isnan(o.at("a").as_number()));
  assert(o.at("b").as_string() == "caf\xC3\xA9");
  assert(o.at("c").as_bool());
  assert(o.at("d").as_array().size() == 2);

  // NaN from the extractor is an absent cell.
  InvoiceDocument doc = sample_document();
  doc.invoice_details[0].tax_amount = o.at("a");
  Verdict verdict = validate_invoice(doc);
  assert(verdict.details == "Missing required values in invoice_details: tax_amount at row 0");

  try {
    (void)loads_jsonish("{\"a\": 1, \"a\": 2}", strict_repair_config());
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.kind == "parse");
    assert(e.path == "$.a");
  }

  assert(loads_jsonish("{\"a\": 1, \"a\": 2}").as_object().at("a").as_number() == 1);

  try {
    (void)loads_jsonish("{'a': 1}", strict_repair_config());
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(std::string(e.what()).find("offset") != std::string::npos);
  }

  try {
    (void)loads_jsonish("{\"Line Items\": [{\"quantity\": 1 \"rate\": 2}]}");
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.path == "$.Line Items[0]");
  }
}

static void test_dumps_and_pointer() {
  Json v = Json(JsonObject{{"b", Json(2.5)}, {"a", Json(JsonArray{Json(1), Json(nullptr), Json("x\"y")})}});
  assert(dumps_json(v) == "{\"a\":[1,null,\"x\\\"y\"],\"b\":2.5}");
  assert(format_number(118) == "118");
  assert(format_number(0.1) == "0.1");
  assert(json_pointer_from_path("$.line_items[2].quantity") == "/line_items/2/quantity");
  assert(json_pointer_from_path("$.invoice_details[0]") == "/invoice_details/0");
}

int main() {
  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("valid_document_passes", test_valid_document_passes);
    run("header_relation_consistent", test_header_relation_consistent);
    run("header_relation_mismatch", test_header_relation_mismatch);
    run("line_rates_agree_with_amount", test_line_rates_agree_with_amount);
    run("missing_gstin_supplier", test_missing_gstin_supplier);
    run("summary_total_mismatch", test_summary_total_mismatch);
    run("normalizer_null_tokens", test_normalizer_null_tokens);
    run("null_token_fails_presence", test_null_token_fails_presence);
    run("custom_null_tokens", test_custom_null_tokens);
    run("presence_order_and_short_circuit", test_presence_order_and_short_circuit);
    run("header_value_alternatives", test_header_value_alternatives);
    run("line_item_presence_groups", test_line_item_presence_groups);
    run("summary_presence_groups", test_summary_presence_groups);
    run("invoice_date_parsing", test_invoice_date_parsing);
    run("decimal_parsing", test_decimal_parsing);
    run("type_failure_reports_field", test_type_failure_reports_field);
    run("type_coercion_rewrites_cells", test_type_coercion_rewrites_cells);
    run("type_check_order", test_type_check_order);
    run("non_scalar_types_rejected", test_non_scalar_types_rejected);
    run("is_close_relative", test_is_close_relative);
    run("overflow_never_agrees", test_overflow_never_agrees);
    run("tolerance_scales_with_magnitude", test_tolerance_scales_with_magnitude);
    run("successive_estimates_compared", test_successive_estimates_compared);
    run("absent_fields_skip_arithmetic", test_absent_fields_skip_arithmetic);
    run("final_amount_from_rate_and_quantity", test_final_amount_from_rate_and_quantity);
    run("final_amount_uses_first_estimate", test_final_amount_uses_first_estimate);
    run("summary_total_tax_resolution", test_summary_total_tax_resolution);
    run("collect_all_mode", test_collect_all_mode);
    run("repeat_runs_and_input_untouched", test_repeat_runs_and_input_untouched);
    run("cross_totals_opt_in", test_cross_totals_opt_in);
    run("config_validation", test_config_validation);
    run("payload_materialization", test_payload_materialization);
    run("payload_missing_sections", test_payload_missing_sections);
    run("payload_shape_errors", test_payload_shape_errors);
    run("payload_errors_share_reader_paths", test_payload_errors_share_reader_paths);
    run("strict_json_rejects_repairs", test_strict_json_rejects_repairs);
    run("jsonish_reader", test_jsonish_reader);
    run("dumps_and_pointer", test_dumps_and_pointer);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
