#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace invoice_check {

struct ValidationError : public std::runtime_error {
  std::string path;
  std::string message;
  std::string kind;  // missing | type | relation | parse | config

  std::string collection;           // invoice_details | line_items | total_summary
  std::optional<size_t> row;        // collection-local, 0-based
  std::vector<std::string> fields;  // missing header fields, or the field that failed coercion
  std::string relation;             // which relation disagreed (kind == "relation")
  std::optional<double> lhs;
  std::optional<double> rhs;

  explicit ValidationError(std::string message, std::string path_ = "$", std::string kind_ = "parse")
      : std::runtime_error(message), path(std::move(path_)), message(std::move(message)), kind(std::move(kind_)) {}

  const char* what() const noexcept override { return message.c_str(); }
};

// Best-effort conversion from a JSONPath-ish string like "$.line_items[0].quantity" to a JSON Pointer
// like "/line_items/0/quantity".
std::string json_pointer_from_path(const std::string& json_path);

struct Json;
using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int n) : value(static_cast<double>(n)) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();
};

// ---------------- JSON-ish ----------------

// Extracts the payload from extraction-service text: the body of a ```json fence, else the first
// balanced {...} / [...], else the trimmed text itself.
std::string extract_json_candidate(const std::string& text);

struct RepairConfig {
  // The extraction service is an LLM pipeline; these repairs are on by default.
  bool fix_smart_quotes{true};
  bool strip_json_comments{true};
  bool replace_python_literals{true};
  bool drop_trailing_commas{true};
  bool allow_single_quotes{true};

  enum class DuplicateKeyPolicy {
    Error,
    FirstWins,
    LastWins,
  };

  DuplicateKeyPolicy duplicate_key_policy{DuplicateKeyPolicy::FirstWins};
};

// Returns a RepairConfig with every repair disabled and duplicate keys rejected.
RepairConfig strict_repair_config();

// Applies the enabled repairs and parses. Throws ValidationError (kind "parse").
Json loads_jsonish(const std::string& text, const RepairConfig& repair = RepairConfig{});

// Integral values print without a fraction, others with up to 15 significant digits.
std::string format_number(double n);

std::string dumps_json(const Json& value);

// ---------------- Invoice records ----------------

// One extracted value. Null means absent; otherwise the scalar as the extractor produced it
// (string, number or bool). The type checker rewrites cells to their coerced form in place.
using Cell = Json;

bool is_present(const Cell& cell);

struct InvoiceHeader {
  Cell invoice_number;
  Cell invoice_date;  // DD-Mon-YY as extracted, YYYY-MM-DD once coerced
  Cell place_of_supply;
  Cell place_of_origin;
  Cell receiver_name;
  Cell gstin_supplier;
  Cell taxable_value;
  Cell invoice_value;
  Cell tax_amount;
};

struct LineItem {
  Cell quantity;
  Cell rate_per_item_after_discount;
  Cell taxable_value;
  Cell sgst_amount;
  Cell cgst_amount;
  Cell igst_amount;
  Cell sgst_rate;
  Cell cgst_rate;
  Cell igst_rate;
  Cell tax_amount;
  Cell tax_rate;
  Cell final_amount;
};

struct SummaryTotals {
  Cell total_taxable_value;
  Cell total_cgst_amount;
  Cell total_sgst_amount;
  Cell total_igst_amount;
  Cell total_tax_amount;
  Cell total_invoice_value;
  Cell rounding_adjustment;
};

struct InvoiceDocument {
  std::vector<InvoiceHeader> invoice_details;
  std::vector<LineItem> line_items;
  std::vector<SummaryTotals> total_summary;
};

enum class Collection { InvoiceDetails, LineItems, TotalSummary };

// "invoice_details" | "line_items" | "total_summary"
const char* collection_name(Collection c);

enum class FieldKind { Text, Date, Number };

template <typename Record>
struct FieldSpec {
  const char* name;
  Cell Record::*cell;
  FieldKind kind;
};

// Static schema per record type, in declaration order.
template <typename Record>
struct RecordSchema;

template <>
struct RecordSchema<InvoiceHeader> {
  static constexpr Collection collection = Collection::InvoiceDetails;
  static const std::vector<FieldSpec<InvoiceHeader>>& fields();
};

template <>
struct RecordSchema<LineItem> {
  static constexpr Collection collection = Collection::LineItems;
  static const std::vector<FieldSpec<LineItem>>& fields();
};

template <>
struct RecordSchema<SummaryTotals> {
  static constexpr Collection collection = Collection::TotalSummary;
  static const std::vector<FieldSpec<SummaryTotals>>& fields();
};

// ---------------- Extraction payload ----------------

// Top-level keys of the extraction service response.
inline constexpr const char* kInvoiceDetailsKey = "Invoice Details";
inline constexpr const char* kLineItemsKey = "Line Items";
inline constexpr const char* kTotalSummaryKey = "Total Summary";

// Materializes the three record collections. Throws ValidationError (kind "parse") with the
// JSONPath of the offending value when a section, row or cell has the wrong shape. Like the
// reader's errors, the path uses the payload's own keys ("$.Line Items[1]").
InvoiceDocument document_from_json(const Json& payload);

// Inverse of document_from_json(); every schema field is emitted, absent cells as null.
Json document_to_json(const InvoiceDocument& doc);

// ---------------- Checks ----------------

struct CheckConfig {
  // Close-enough comparator: |a-b| <= max(absolute_tolerance, relative_tolerance * max(|a|, |b|)).
  double relative_tolerance{1e-5};
  double absolute_tolerance{0.0};

  // Strings treated as absent, compared case-insensitively.
  std::vector<std::string> null_tokens{"", "nan", "null", "none"};

  // Also reconcile line-item sums and the header against the summary row.
  bool cross_check_totals{false};
};

// Throws ValidationError (kind "config") on negative or non-finite tolerances.
void validate_config(const CheckConfig& config);

bool is_close(double a, double b, const CheckConfig& config = CheckConfig{});

// An aggregate that is either derivable from the present fields or not applicable to the row.
struct Resolved {
  enum class State { Defined, NotApplicable };

  State state{State::NotApplicable};
  double value{0.0};

  bool defined() const { return state == State::Defined; }

  static Resolved of(double v) { return Resolved{State::Defined, v}; }
  static Resolved not_applicable() { return Resolved{}; }
};

// Numeric value of a coerced cell; nullopt for absent or non-numeric cells.
std::optional<double> amount(const Cell& cell);

// taxable_value, else rate_per_item_after_discount * quantity.
Resolved line_base_value(const LineItem& item);

// Independent tax derivations in fixed order: component amounts, base * component rates,
// tax_amount, base * tax_rate. Only derivations whose inputs are all present are included.
std::vector<double> line_tax_estimates(const LineItem& item, double base_value);

// total_tax_amount, else cgst + sgst + igst when all three are present.
Resolved summary_total_tax(const SummaryTotals& totals);

struct CalendarDate {
  int year{0};
  int month{0};
  int day{0};
};

// Parses day-abbreviatedMonth-2digitYear ("05-Jan-24"). Years 00-68 map to 20xx, 69-99 to 19xx.
std::optional<CalendarDate> parse_invoice_date(const std::string& text);

std::string format_iso_date(const CalendarDate& date);

// Whole-string decimal parse after trimming surrounding whitespace; rejects non-finite results.
std::optional<double> parse_decimal(const std::string& text);

// Presence predicates.
bool header_is_complete(const InvoiceHeader& header);
bool line_item_is_complete(const LineItem& item);
bool summary_is_complete(const SummaryTotals& totals);

// Every absent header field, in schema order, when the row fails its presence predicate; empty otherwise.
std::vector<std::string> missing_header_fields(const InvoiceHeader& header);

// Replaces null-like cells with null. Pure and total.
InvoiceDocument normalize_nulls(InvoiceDocument doc, const CheckConfig& config = CheckConfig{});

// Each check throws the first ValidationError in evaluation order; the *_all variant returns every
// violation instead (empty means the stage passed).
void check_presence(const InvoiceDocument& doc);
std::vector<ValidationError> check_presence_all(const InvoiceDocument& doc);

void check_types(InvoiceDocument& doc);
std::vector<ValidationError> check_types_all(InvoiceDocument& doc);

void check_relations(const InvoiceDocument& doc, const CheckConfig& config = CheckConfig{});
std::vector<ValidationError> check_relations_all(const InvoiceDocument& doc, const CheckConfig& config = CheckConfig{});

// ---------------- Engine ----------------

inline constexpr const char* kStepMissingValues = "Step 1: Missing Values";
inline constexpr const char* kStepDataTypes = "Step 2: Data Types";
inline constexpr const char* kStepRelations = "Step 3: Relations";
inline constexpr const char* kStepAll = "All Steps";

// Verdict label of the stage that reports errors of this kind; empty for unknown kinds.
std::string step_for_kind(const std::string& kind);

struct Verdict {
  bool passed{false};
  std::string step;
  std::string details;
  std::optional<ValidationError> error;  // set when passed is false
};

// Normalize, then gate through presence, types and relations. Reports only the first failure.
// The document is taken by value; the caller's copy is never mutated.
Verdict validate_invoice(InvoiceDocument doc, const CheckConfig& config = CheckConfig{});

// Opt-in variant: runs every stage regardless of earlier failures and returns every violation.
std::vector<ValidationError> validate_invoice_all(InvoiceDocument doc, const CheckConfig& config = CheckConfig{});

// Convenience: parse the extraction service response, materialize, then validate_invoice().
// Malformed payloads throw ValidationError (kind "parse").
Verdict validate_invoice_json(const std::string& text,
                              const CheckConfig& config = CheckConfig{},
                              const RepairConfig& repair = RepairConfig{});

}  // namespace invoice_check
