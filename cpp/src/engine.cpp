#include "invoice_check.hpp"

#include <cmath>

namespace invoice_check {

void validate_config(const CheckConfig& config) {
  if (!std::isfinite(config.relative_tolerance) || config.relative_tolerance < 0.0) {
    throw ValidationError("relative_tolerance must be a finite non-negative number", "$.relative_tolerance", "config");
  }
  if (!std::isfinite(config.absolute_tolerance) || config.absolute_tolerance < 0.0) {
    throw ValidationError("absolute_tolerance must be a finite non-negative number", "$.absolute_tolerance", "config");
  }
}

std::string step_for_kind(const std::string& kind) {
  if (kind == "missing") return kStepMissingValues;
  if (kind == "type") return kStepDataTypes;
  if (kind == "relation") return kStepRelations;
  return "";
}

// Runs one stage and hands back its first failure, so nothing thrown by a check leaves the engine.
template <typename Fn>
static std::optional<ValidationError> run_stage(Fn&& fn) {
  try {
    fn();
    return std::nullopt;
  } catch (const ValidationError& e) {
    return e;
  }
}

static Verdict failed(const ValidationError& e) {
  Verdict v;
  v.passed = false;
  v.step = step_for_kind(e.kind);
  v.details = e.message;
  v.error = e;
  return v;
}

Verdict validate_invoice(InvoiceDocument doc, const CheckConfig& config) {
  validate_config(config);
  doc = normalize_nulls(std::move(doc), config);

  if (auto err = run_stage([&] { check_presence(doc); })) return failed(*err);
  if (auto err = run_stage([&] { check_types(doc); })) return failed(*err);
  if (auto err = run_stage([&] { check_relations(doc, config); })) return failed(*err);

  Verdict v;
  v.passed = true;
  v.step = kStepAll;
  v.details = "Validation successful";
  return v;
}

std::vector<ValidationError> validate_invoice_all(InvoiceDocument doc, const CheckConfig& config) {
  validate_config(config);
  doc = normalize_nulls(std::move(doc), config);

  std::vector<ValidationError> errors = check_presence_all(doc);
  for (auto& e : check_types_all(doc)) errors.push_back(std::move(e));
  for (auto& e : check_relations_all(doc, config)) errors.push_back(std::move(e));
  return errors;
}

Verdict validate_invoice_json(const std::string& text, const CheckConfig& config, const RepairConfig& repair) {
  return validate_invoice(document_from_json(loads_jsonish(text, repair)), config);
}

}  // namespace invoice_check
