#include "invoice_check.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace invoice_check {

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

static std::string row_path(Collection c, size_t row) {
  return std::string("$.") + collection_name(c) + "[" + std::to_string(row) + "]";
}

static ValidationError row_error(const std::string& message,
                                 const std::string& kind,
                                 Collection c,
                                 size_t row,
                                 const std::string& field = "") {
  ValidationError e(message, field.empty() ? row_path(c, row) : row_path(c, row) + "." + field, kind);
  e.collection = collection_name(c);
  e.row = row;
  if (!field.empty()) e.fields.push_back(field);
  return e;
}

struct CheckOptions {
  bool collect_all{false};
  std::vector<ValidationError>* errors{nullptr};
};

static void report_or_throw(const CheckOptions& opt, ValidationError err) {
  if (opt.collect_all && opt.errors) {
    opt.errors->push_back(std::move(err));
    return;
  }
  throw err;
}

// ---------------- Normalizer ----------------

template <typename Record>
static void normalize_rows(std::vector<Record>& rows, const std::vector<std::string>& tokens) {
  for (auto& rec : rows) {
    for (const auto& f : RecordSchema<Record>::fields()) {
      Cell& cell = rec.*f.cell;
      bool null_like = false;
      if (cell.is_string()) {
        null_like = std::find(tokens.begin(), tokens.end(), to_lower(cell.as_string())) != tokens.end();
      } else if (cell.is_number()) {
        null_like = std::isnan(cell.as_number());
      }
      if (null_like) cell = Json(nullptr);
    }
  }
}

InvoiceDocument normalize_nulls(InvoiceDocument doc, const CheckConfig& config) {
  std::vector<std::string> tokens;
  tokens.reserve(config.null_tokens.size());
  for (const auto& t : config.null_tokens) tokens.push_back(to_lower(t));

  normalize_rows(doc.invoice_details, tokens);
  normalize_rows(doc.line_items, tokens);
  normalize_rows(doc.total_summary, tokens);
  return doc;
}

// ---------------- Presence ----------------

static bool header_has_required(const InvoiceHeader& h) {
  // Every header field is required except the taxable_value / invoice_value pair,
  // where either one satisfies the requirement.
  for (const auto& f : RecordSchema<InvoiceHeader>::fields()) {
    if (f.cell == &InvoiceHeader::taxable_value || f.cell == &InvoiceHeader::invoice_value) continue;
    if (!is_present(h.*f.cell)) return false;
  }
  return is_present(h.taxable_value) || is_present(h.invoice_value);
}

std::vector<std::string> missing_header_fields(const InvoiceHeader& header) {
  std::vector<std::string> out;
  if (header_has_required(header)) return out;
  for (const auto& f : RecordSchema<InvoiceHeader>::fields()) {
    if (!is_present(header.*f.cell)) out.push_back(f.name);
  }
  return out;
}

bool header_is_complete(const InvoiceHeader& header) { return header_has_required(header); }

bool line_item_is_complete(const LineItem& item) {
  auto p = [](const Cell& c) { return is_present(c); };
  const bool has_tax = p(item.tax_amount) || p(item.tax_rate) || (p(item.sgst_amount) && p(item.cgst_amount)) ||
                       p(item.igst_amount) || (p(item.sgst_rate) && p(item.cgst_rate)) || p(item.igst_rate);
  const bool has_value =
      p(item.final_amount) || p(item.taxable_value) || (p(item.rate_per_item_after_discount) && p(item.quantity));
  return has_tax && has_value;
}

bool summary_is_complete(const SummaryTotals& totals) {
  auto p = [](const Cell& c) { return is_present(c); };
  const bool has_value = p(totals.total_taxable_value) || p(totals.total_invoice_value);
  const bool has_tax = p(totals.total_tax_amount) || p(totals.total_igst_amount) ||
                       (p(totals.total_cgst_amount) && p(totals.total_sgst_amount));
  return has_value && has_tax;
}

static void presence_impl(const InvoiceDocument& doc, const CheckOptions& opt) {
  for (size_t r = 0; r < doc.invoice_details.size(); ++r) {
    auto missing = missing_header_fields(doc.invoice_details[r]);
    if (missing.empty()) continue;
    ValidationError e = row_error(
        "Missing required values in invoice_details: " + join(missing, ", ") + " at row " + std::to_string(r),
        "missing", Collection::InvoiceDetails, r);
    e.fields = std::move(missing);
    report_or_throw(opt, std::move(e));
  }

  for (size_t r = 0; r < doc.line_items.size(); ++r) {
    if (line_item_is_complete(doc.line_items[r])) continue;
    report_or_throw(opt, row_error("Missing required values in line_items at row " + std::to_string(r), "missing",
                                   Collection::LineItems, r));
  }

  for (size_t r = 0; r < doc.total_summary.size(); ++r) {
    if (summary_is_complete(doc.total_summary[r])) continue;
    report_or_throw(opt, row_error("Missing required values in total_summary at row " + std::to_string(r), "missing",
                                   Collection::TotalSummary, r));
  }
}

void check_presence(const InvoiceDocument& doc) { presence_impl(doc, CheckOptions{}); }

std::vector<ValidationError> check_presence_all(const InvoiceDocument& doc) {
  std::vector<ValidationError> errors;
  presence_impl(doc, CheckOptions{true, &errors});
  return errors;
}

// ---------------- Types ----------------

std::optional<double> parse_decimal(const std::string& text) {
  size_t b = 0;
  size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  const std::string s = text.substr(b, e - b);

  // [+-]digits[.digits][(e|E)[+-]digits], with digits on at least one side of the point.
  size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
  size_t mantissa = 0;
  for (; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) ++mantissa;
  if (i < s.size() && s[i] == '.') {
    for (++i; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) ++mantissa;
  }
  if (mantissa == 0) return std::nullopt;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    size_t exp = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == exp) return std::nullopt;
  }
  if (i != s.size()) return std::nullopt;

  double v = std::strtod(s.c_str(), nullptr);
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

static bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

std::optional<CalendarDate> parse_invoice_date(const std::string& text) {
  static const char* kMonths[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                  "jul", "aug", "sep", "oct", "nov", "dec"};
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

  auto digit = [&](size_t k) { return k < text.size() && std::isdigit(static_cast<unsigned char>(text[k])); };

  size_t i = 0;
  int day = 0;
  while (i < 2 && digit(i)) day = day * 10 + (text[i++] - '0');
  if (i == 0 || i >= text.size() || text[i] != '-') return std::nullopt;
  ++i;

  if (i + 4 > text.size() || text[i + 3] != '-') return std::nullopt;
  const std::string mon = to_lower(text.substr(i, 3));
  int month = 0;
  for (int m = 0; m < 12; ++m) {
    if (mon == kMonths[m]) month = m + 1;
  }
  if (month == 0) return std::nullopt;
  i += 4;

  if (i + 2 != text.size() || !digit(i) || !digit(i + 1)) return std::nullopt;
  const int yy = (text[i] - '0') * 10 + (text[i + 1] - '0');
  const int year = yy < 69 ? 2000 + yy : 1900 + yy;

  int max_day = kDays[month - 1];
  if (month == 2 && is_leap_year(year)) max_day = 29;
  if (day < 1 || day > max_day) return std::nullopt;

  return CalendarDate{year, month, day};
}

std::string format_iso_date(const CalendarDate& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
  return buf;
}

// Rewrites the cell to its coerced form; returns the failure reason otherwise.
static std::optional<std::string> coerce_cell(Cell& cell, FieldKind kind) {
  if (kind == FieldKind::Date) {
    if (!cell.is_string()) return std::string("is not a DD-Mon-YY date");
    auto d = parse_invoice_date(cell.as_string());
    if (!d) return std::string("does not match format DD-Mon-YY");
    cell = Json(format_iso_date(*d));
    return std::nullopt;
  }

  if (cell.is_number()) {
    if (!std::isfinite(cell.as_number())) return std::string("is not a finite number");
    return std::nullopt;
  }
  if (cell.is_string()) {
    auto v = parse_decimal(cell.as_string());
    if (!v) return std::string("is not a number");
    cell = Json(*v);
    return std::nullopt;
  }
  return std::string("is not a number");
}

// Field by field, then row by row, so the first reported failure matches a column-wise scan.
template <typename Record>
static void coerce_rows(std::vector<Record>& rows, FieldKind kind, const CheckOptions& opt) {
  constexpr Collection collection = RecordSchema<Record>::collection;
  for (const auto& f : RecordSchema<Record>::fields()) {
    if (f.kind != kind) continue;
    for (size_t r = 0; r < rows.size(); ++r) {
      Cell& cell = rows[r].*f.cell;
      if (!is_present(cell)) continue;
      const std::string raw = dumps_json(cell);
      if (auto reason = coerce_cell(cell, kind)) {
        report_or_throw(opt, row_error("Data type conversion failed: " + std::string(collection_name(collection)) +
                                           "." + f.name + " " + raw + " at row " + std::to_string(r) + " " + *reason,
                                       "type", collection, r, f.name));
      }
    }
  }
}

static void types_impl(InvoiceDocument& doc, const CheckOptions& opt) {
  coerce_rows(doc.invoice_details, FieldKind::Date, opt);
  coerce_rows(doc.invoice_details, FieldKind::Number, opt);
  coerce_rows(doc.line_items, FieldKind::Number, opt);
  coerce_rows(doc.total_summary, FieldKind::Number, opt);
}

void check_types(InvoiceDocument& doc) { types_impl(doc, CheckOptions{}); }

std::vector<ValidationError> check_types_all(InvoiceDocument& doc) {
  std::vector<ValidationError> errors;
  types_impl(doc, CheckOptions{true, &errors});
  return errors;
}

// ---------------- Relations ----------------

bool is_close(double a, double b, const CheckConfig& config) {
  if (a == b) return true;
  // An overflowed sum or product never agrees with anything.
  if (!std::isfinite(a) || !std::isfinite(b)) return false;
  const double diff = std::fabs(a - b);
  const double scale = std::max(std::fabs(a), std::fabs(b));
  return diff <= std::max(config.absolute_tolerance, config.relative_tolerance * scale);
}

std::optional<double> amount(const Cell& cell) {
  if (!cell.is_number()) return std::nullopt;
  return cell.as_number();
}

Resolved line_base_value(const LineItem& item) {
  if (auto tv = amount(item.taxable_value)) return Resolved::of(*tv);
  auto rate = amount(item.rate_per_item_after_discount);
  auto qty = amount(item.quantity);
  if (rate && qty) return Resolved::of(*rate * *qty);
  return Resolved::not_applicable();
}

std::vector<double> line_tax_estimates(const LineItem& item, double base_value) {
  std::vector<double> out;
  auto sgst = amount(item.sgst_amount);
  auto cgst = amount(item.cgst_amount);
  auto igst = amount(item.igst_amount);
  if (sgst && cgst && igst) out.push_back(*sgst + *cgst + *igst);

  auto sgst_rate = amount(item.sgst_rate);
  auto cgst_rate = amount(item.cgst_rate);
  auto igst_rate = amount(item.igst_rate);
  if (sgst_rate && cgst_rate && igst_rate) out.push_back(base_value * (*sgst_rate + *cgst_rate + *igst_rate) / 100);

  if (auto tax = amount(item.tax_amount)) out.push_back(*tax);
  if (auto rate = amount(item.tax_rate)) out.push_back(base_value * *rate / 100);
  return out;
}

Resolved summary_total_tax(const SummaryTotals& totals) {
  if (auto t = amount(totals.total_tax_amount)) return Resolved::of(*t);
  auto cgst = amount(totals.total_cgst_amount);
  auto sgst = amount(totals.total_sgst_amount);
  auto igst = amount(totals.total_igst_amount);
  if (cgst && sgst && igst) return Resolved::of(*cgst + *sgst + *igst);
  return Resolved::not_applicable();
}

static ValidationError mismatch(const std::string& message,
                                const std::string& relation,
                                Collection c,
                                size_t row,
                                const std::string& field,
                                double lhs,
                                double rhs) {
  ValidationError e = row_error(message, "relation", c, row, field);
  e.relation = relation;
  e.lhs = lhs;
  e.rhs = rhs;
  return e;
}

static void cross_totals_impl(const InvoiceDocument& doc, const CheckConfig& config, const CheckOptions& opt) {
  if (doc.total_summary.size() != 1) return;
  const SummaryTotals& totals = doc.total_summary[0];
  const std::string at = " at row 0: ";

  if (!doc.line_items.empty()) {
    bool all_bases = true;
    bool all_taxes = true;
    double base_sum = 0.0;
    double tax_sum = 0.0;
    for (const auto& item : doc.line_items) {
      Resolved base = line_base_value(item);
      if (!base.defined()) {
        all_bases = false;
        all_taxes = false;
        break;
      }
      base_sum += base.value;
      auto est = line_tax_estimates(item, base.value);
      if (est.empty()) {
        all_taxes = false;
      } else {
        tax_sum += est.front();
      }
    }

    auto ttv = amount(totals.total_taxable_value);
    if (all_bases && ttv && !is_close(*ttv, base_sum, config)) {
      report_or_throw(opt, mismatch("Total taxable value mismatch" + at + format_number(*ttv) +
                                        " != sum of line items " + format_number(base_sum),
                                    "line_taxable_total", Collection::TotalSummary, 0, "total_taxable_value", *ttv,
                                    base_sum));
    }

    Resolved total_tax = summary_total_tax(totals);
    if (all_taxes && total_tax.defined() && !is_close(total_tax.value, tax_sum, config)) {
      report_or_throw(opt, mismatch("Total tax mismatch" + at + format_number(total_tax.value) +
                                        " != sum of line items " + format_number(tax_sum),
                                    "line_tax_total", Collection::TotalSummary, 0, "total_tax_amount",
                                    total_tax.value, tax_sum));
    }
  }

  if (doc.invoice_details.size() == 1) {
    auto iv = amount(doc.invoice_details[0].invoice_value);
    auto tiv = amount(totals.total_invoice_value);
    if (iv && tiv && !is_close(*iv, *tiv, config)) {
      report_or_throw(opt, mismatch("Invoice value mismatch against total_summary" + at + format_number(*iv) +
                                        " != " + format_number(*tiv),
                                    "header_invoice_total", Collection::InvoiceDetails, 0, "invoice_value", *iv,
                                    *tiv));
    }
  }
}

static void relations_impl(const InvoiceDocument& doc, const CheckConfig& config, const CheckOptions& opt) {
  for (size_t r = 0; r < doc.invoice_details.size(); ++r) {
    const auto& h = doc.invoice_details[r];
    auto iv = amount(h.invoice_value);
    auto tv = amount(h.taxable_value);
    auto ta = amount(h.tax_amount);
    if (!(iv && tv && ta)) continue;
    if (!is_close(*iv, *tv + *ta, config)) {
      report_or_throw(opt, mismatch("Invoice value mismatch at row " + std::to_string(r) + ": " + format_number(*iv) +
                                        " != " + format_number(*tv) + " + " + format_number(*ta),
                                    "invoice_value", Collection::InvoiceDetails, r, "invoice_value", *iv, *tv + *ta));
    }
  }

  for (size_t r = 0; r < doc.line_items.size(); ++r) {
    const auto& item = doc.line_items[r];
    Resolved base = line_base_value(item);
    if (!base.defined()) continue;

    auto est = line_tax_estimates(item, base.value);
    for (size_t k = 0; k + 1 < est.size(); ++k) {
      if (!is_close(est[k], est[k + 1], config)) {
        report_or_throw(opt, mismatch("Tax amount mismatch at row " + std::to_string(r) +
                                          ": Different tax calculations yield different results",
                                      "line_tax", Collection::LineItems, r, "", est[k], est[k + 1]));
        break;
      }
    }

    auto final_amount = amount(item.final_amount);
    if (final_amount && !est.empty() && !is_close(*final_amount, base.value + est.front(), config)) {
      report_or_throw(opt, mismatch("Final amount mismatch at row " + std::to_string(r) + ": " +
                                        format_number(*final_amount) + " != " + format_number(base.value) + " + " +
                                        format_number(est.front()),
                                    "final_amount", Collection::LineItems, r, "final_amount", *final_amount,
                                    base.value + est.front()));
    }
  }

  for (size_t r = 0; r < doc.total_summary.size(); ++r) {
    const auto& totals = doc.total_summary[r];
    Resolved total_tax = summary_total_tax(totals);
    auto ttv = amount(totals.total_taxable_value);
    auto tiv = amount(totals.total_invoice_value);
    if (!(ttv && tiv && total_tax.defined())) continue;
    if (!is_close(*tiv, *ttv + total_tax.value, config)) {
      report_or_throw(opt, mismatch("Total invoice value mismatch at row " + std::to_string(r) + ": " +
                                        format_number(*tiv) + " != " + format_number(*ttv) + " + " +
                                        format_number(total_tax.value),
                                    "total_invoice_value", Collection::TotalSummary, r, "total_invoice_value", *tiv,
                                    *ttv + total_tax.value));
    }
  }

  if (config.cross_check_totals) cross_totals_impl(doc, config, opt);
}

void check_relations(const InvoiceDocument& doc, const CheckConfig& config) {
  relations_impl(doc, config, CheckOptions{});
}

std::vector<ValidationError> check_relations_all(const InvoiceDocument& doc, const CheckConfig& config) {
  std::vector<ValidationError> errors;
  relations_impl(doc, config, CheckOptions{true, &errors});
  return errors;
}

}  // namespace invoice_check
