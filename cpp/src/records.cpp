#include "invoice_check.hpp"

namespace invoice_check {

// ---------------- Invoice records ----------------

bool is_present(const Cell& cell) { return !cell.is_null(); }

const char* collection_name(Collection c) {
  switch (c) {
    case Collection::InvoiceDetails: return "invoice_details";
    case Collection::LineItems: return "line_items";
    case Collection::TotalSummary: return "total_summary";
  }
  return "unknown";
}

const std::vector<FieldSpec<InvoiceHeader>>& RecordSchema<InvoiceHeader>::fields() {
  using H = InvoiceHeader;
  static const std::vector<FieldSpec<H>> kFields = {
      {"invoice_number", &H::invoice_number, FieldKind::Text},
      {"invoice_date", &H::invoice_date, FieldKind::Date},
      {"place_of_supply", &H::place_of_supply, FieldKind::Number},
      {"place_of_origin", &H::place_of_origin, FieldKind::Number},
      {"receiver_name", &H::receiver_name, FieldKind::Text},
      {"gstin_supplier", &H::gstin_supplier, FieldKind::Text},
      {"taxable_value", &H::taxable_value, FieldKind::Number},
      {"invoice_value", &H::invoice_value, FieldKind::Number},
      {"tax_amount", &H::tax_amount, FieldKind::Number},
  };
  return kFields;
}

const std::vector<FieldSpec<LineItem>>& RecordSchema<LineItem>::fields() {
  using L = LineItem;
  static const std::vector<FieldSpec<L>> kFields = {
      {"quantity", &L::quantity, FieldKind::Number},
      {"rate_per_item_after_discount", &L::rate_per_item_after_discount, FieldKind::Number},
      {"taxable_value", &L::taxable_value, FieldKind::Number},
      {"sgst_amount", &L::sgst_amount, FieldKind::Number},
      {"cgst_amount", &L::cgst_amount, FieldKind::Number},
      {"igst_amount", &L::igst_amount, FieldKind::Number},
      {"sgst_rate", &L::sgst_rate, FieldKind::Number},
      {"cgst_rate", &L::cgst_rate, FieldKind::Number},
      {"igst_rate", &L::igst_rate, FieldKind::Number},
      {"tax_amount", &L::tax_amount, FieldKind::Number},
      {"tax_rate", &L::tax_rate, FieldKind::Number},
      {"final_amount", &L::final_amount, FieldKind::Number},
  };
  return kFields;
}

const std::vector<FieldSpec<SummaryTotals>>& RecordSchema<SummaryTotals>::fields() {
  using S = SummaryTotals;
  static const std::vector<FieldSpec<S>> kFields = {
      {"total_taxable_value", &S::total_taxable_value, FieldKind::Number},
      {"total_cgst_amount", &S::total_cgst_amount, FieldKind::Number},
      {"total_sgst_amount", &S::total_sgst_amount, FieldKind::Number},
      {"total_igst_amount", &S::total_igst_amount, FieldKind::Number},
      {"total_tax_amount", &S::total_tax_amount, FieldKind::Number},
      {"total_invoice_value", &S::total_invoice_value, FieldKind::Number},
      {"rounding_adjustment", &S::rounding_adjustment, FieldKind::Number},
  };
  return kFields;
}

// ---------------- Extraction payload ----------------

template <typename Record>
static Record record_from_json(const Json& row, const std::string& path) {
  if (!row.is_object()) throw ValidationError("row must be an object", path, "parse");
  const auto& obj = row.as_object();

  Record rec;
  for (const auto& f : RecordSchema<Record>::fields()) {
    auto it = obj.find(f.name);
    if (it == obj.end()) continue;
    const Json& v = it->second;
    if (v.is_array() || v.is_object()) {
      throw ValidationError(std::string("cell must be a scalar: ") + f.name, path + "." + f.name, "parse");
    }
    rec.*f.cell = v;
  }
  return rec;
}

// Payload errors point into the extraction response itself, keyed the way the reader reports them.
static std::string section_path(const char* key) { return std::string("$.") + key; }

// Header and summary sections arrive as one object; arrays are accepted as several rows.
// A missing section becomes a single all-absent row so the presence check reports it.
template <typename Record>
static std::vector<Record> single_row_section(const JsonObject& payload, const char* key) {
  const std::string path = section_path(key);
  std::vector<Record> rows;
  auto it = payload.find(key);
  if (it == payload.end() || it->second.is_null()) {
    rows.emplace_back();
    return rows;
  }
  const Json& section = it->second;
  if (section.is_object()) {
    rows.push_back(record_from_json<Record>(section, path));
  } else if (section.is_array()) {
    const auto& arr = section.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      rows.push_back(record_from_json<Record>(arr[i], path + "[" + std::to_string(i) + "]"));
    }
  } else {
    throw ValidationError(std::string("section must be an object or array: ") + key, path, "parse");
  }
  return rows;
}

InvoiceDocument document_from_json(const Json& payload) {
  if (!payload.is_object()) throw ValidationError("payload must be an object", "$", "parse");
  const auto& obj = payload.as_object();

  InvoiceDocument doc;
  doc.invoice_details = single_row_section<InvoiceHeader>(obj, kInvoiceDetailsKey);
  doc.total_summary = single_row_section<SummaryTotals>(obj, kTotalSummaryKey);

  auto it = obj.find(kLineItemsKey);
  if (it != obj.end() && !it->second.is_null()) {
    const std::string path = section_path(kLineItemsKey);
    if (!it->second.is_array()) {
      throw ValidationError(std::string("section must be an array: ") + kLineItemsKey, path, "parse");
    }
    const auto& arr = it->second.as_array();
    doc.line_items.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
      doc.line_items.push_back(record_from_json<LineItem>(arr[i], path + "[" + std::to_string(i) + "]"));
    }
  }
  return doc;
}

template <typename Record>
static Json record_to_json(const Record& rec) {
  JsonObject obj;
  for (const auto& f : RecordSchema<Record>::fields()) obj[f.name] = rec.*f.cell;
  return Json(std::move(obj));
}

template <typename Record>
static Json rows_to_json(const std::vector<Record>& rows) {
  JsonArray arr;
  arr.reserve(rows.size());
  for (const auto& r : rows) arr.push_back(record_to_json(r));
  return Json(std::move(arr));
}

Json document_to_json(const InvoiceDocument& doc) {
  JsonObject obj;
  obj[kInvoiceDetailsKey] = doc.invoice_details.size() == 1 ? record_to_json(doc.invoice_details[0])
                                                            : rows_to_json(doc.invoice_details);
  obj[kLineItemsKey] = rows_to_json(doc.line_items);
  obj[kTotalSummaryKey] = doc.total_summary.size() == 1 ? record_to_json(doc.total_summary[0])
                                                        : rows_to_json(doc.total_summary);
  return Json(std::move(obj));
}

}  // namespace invoice_check
