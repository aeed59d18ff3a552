#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "invoice_check.hpp"

namespace py = pybind11;

using invoice_check::CheckConfig;
using invoice_check::Json;
using invoice_check::JsonArray;
using invoice_check::JsonObject;
using invoice_check::RepairConfig;
using invoice_check::ValidationError;
using invoice_check::Verdict;

static py::object ToPy(const Json& v);

static bool FromPy(py::handle v, Json& out);

static py::object ToPyNumber(double n) {
  if (std::isfinite(n)) {
    const double ip = std::trunc(n);
    if (ip == n && ip >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        ip <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return py::int_(static_cast<int64_t>(ip));
    }
  }
  return py::float_(n);
}

static py::object ToPy(const Json& v) {
  if (v.is_null()) return py::none();
  if (v.is_bool()) return py::bool_(v.as_bool());
  if (v.is_number()) return ToPyNumber(v.as_number());
  if (v.is_string()) return py::str(v.as_string());
  if (v.is_array()) {
    py::list out;
    for (const auto& el : v.as_array()) out.append(ToPy(el));
    return std::move(out);
  }
  py::dict d;
  for (const auto& kv : v.as_object()) d[py::str(kv.first)] = ToPy(kv.second);
  return std::move(d);
}

static bool FromPy(py::handle v, Json& out) {
  if (v.is_none()) {
    out = Json(nullptr);
    return true;
  }
  if (py::isinstance<py::bool_>(v)) {
    out = Json(py::cast<bool>(v));
    return true;
  }
  if (py::isinstance<py::int_>(v)) {
    out = Json(py::cast<int64_t>(v));
    return true;
  }
  if (py::isinstance<py::float_>(v)) {
    // pandas hands missing cells over as float('nan'); the normalizer treats it as absent.
    out = Json(py::cast<double>(v));
    return true;
  }
  if (py::isinstance<py::str>(v)) {
    out = Json(py::cast<std::string>(v));
    return true;
  }
  if (py::isinstance<py::dict>(v)) {
    JsonObject obj;
    for (auto item : py::reinterpret_borrow<py::dict>(v)) {
      if (!py::isinstance<py::str>(item.first)) return false;
      Json child;
      if (!FromPy(item.second, child)) return false;
      obj.emplace(py::cast<std::string>(item.first), std::move(child));
    }
    out = Json(std::move(obj));
    return true;
  }
  if (py::isinstance<py::list>(v) || py::isinstance<py::tuple>(v)) {
    JsonArray arr;
    for (auto item : py::reinterpret_borrow<py::sequence>(v)) {
      Json child;
      if (!FromPy(item, child)) return false;
      arr.push_back(std::move(child));
    }
    out = Json(std::move(arr));
    return true;
  }
  return false;
}

static Json SectionFromPy(py::handle rows, const char* name) {
  Json out;
  if (!FromPy(rows, out)) {
    throw std::runtime_error(std::string(name) + " must be a list of dicts with JSON-serializable values");
  }
  return out;
}

static CheckConfig CheckConfigFromPy(py::object o) {
  CheckConfig cfg;
  if (o.is_none()) return cfg;
  py::dict d = o.cast<py::dict>();
  if (d.contains("relativeTolerance")) cfg.relative_tolerance = d["relativeTolerance"].cast<double>();
  if (d.contains("absoluteTolerance")) cfg.absolute_tolerance = d["absoluteTolerance"].cast<double>();
  if (d.contains("nullTokens")) cfg.null_tokens = d["nullTokens"].cast<std::vector<std::string>>();
  if (d.contains("crossCheckTotals")) cfg.cross_check_totals = d["crossCheckTotals"].cast<bool>();
  return cfg;
}

// strict starts from strict_repair_config(); keys in the repair dict then override single flags.
static RepairConfig RepairConfigFromPy(py::object o, bool strict) {
  RepairConfig cfg = strict ? invoice_check::strict_repair_config() : RepairConfig{};
  if (o.is_none()) return cfg;
  py::dict d = o.cast<py::dict>();
  auto set_bool = [&](const char* key, bool& field) {
    if (d.contains(key)) field = d[key].cast<bool>();
  };
  set_bool("fixSmartQuotes", cfg.fix_smart_quotes);
  set_bool("stripJsonComments", cfg.strip_json_comments);
  set_bool("replacePythonLiterals", cfg.replace_python_literals);
  set_bool("dropTrailingCommas", cfg.drop_trailing_commas);
  set_bool("allowSingleQuotes", cfg.allow_single_quotes);

  if (d.contains("duplicateKeyPolicy")) {
    const std::string raw = py::cast<std::string>(d["duplicateKeyPolicy"]);
    std::string s;
    s.reserve(raw.size());
    for (char c : raw) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (s == "error") {
      cfg.duplicate_key_policy = RepairConfig::DuplicateKeyPolicy::Error;
    } else if (s == "firstwins" || s == "first_wins" || s == "first") {
      cfg.duplicate_key_policy = RepairConfig::DuplicateKeyPolicy::FirstWins;
    } else if (s == "lastwins" || s == "last_wins" || s == "last") {
      cfg.duplicate_key_policy = RepairConfig::DuplicateKeyPolicy::LastWins;
    } else {
      throw std::runtime_error("duplicateKeyPolicy must be one of: error | firstWins | lastWins");
    }
  }
  return cfg;
}

static invoice_check::InvoiceDocument DocumentFromPy(py::handle invoice_details,
                                                     py::handle line_items,
                                                     py::handle total_summary) {
  JsonObject payload;
  payload[invoice_check::kInvoiceDetailsKey] = SectionFromPy(invoice_details, "invoice_details");
  payload[invoice_check::kLineItemsKey] = SectionFromPy(line_items, "line_items");
  payload[invoice_check::kTotalSummaryKey] = SectionFromPy(total_summary, "total_summary");
  return invoice_check::document_from_json(Json(std::move(payload)));
}

static py::tuple VerdictToPy(const Verdict& v) { return py::make_tuple(v.passed, v.step, v.details); }

static py::dict ErrorToPy(const ValidationError& e) {
  py::dict d;
  d["step"] = invoice_check::step_for_kind(e.kind);
  d["kind"] = e.kind;
  d["message"] = e.message;
  d["path"] = e.path;
  d["jsonPointer"] = invoice_check::json_pointer_from_path(e.path);
  if (!e.collection.empty()) d["collection"] = e.collection;
  if (e.row) d["row"] = *e.row;
  if (!e.fields.empty()) d["fields"] = e.fields;
  if (!e.relation.empty()) d["relation"] = e.relation;
  if (e.lhs) d["lhs"] = *e.lhs;
  if (e.rhs) d["rhs"] = *e.rhs;
  return d;
}

static py::object ValidationErrorType;

static void TranslateValidationError(const ValidationError& e) {
  const std::string full = e.path.empty() ? e.message : (e.path + ": " + e.message);
  py::object exc = ValidationErrorType(py::str(full));
  exc.attr("message") = py::str(e.message);
  exc.attr("path") = py::str(e.path);
  exc.attr("kind") = py::str(e.kind);
  exc.attr("jsonPointer") = py::str(invoice_check::json_pointer_from_path(e.path));
  PyErr_SetObject(ValidationErrorType.ptr(), exc.ptr());
}

PYBIND11_MODULE(_native, m) {
  m.doc() = "C++17-backed invoice extraction validation (pybind11)";

  ValidationErrorType =
      py::reinterpret_steal<py::object>(PyErr_NewException("invoice_check.ValidationError", PyExc_Exception, nullptr));
  m.attr("ValidationError") = ValidationErrorType;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const ValidationError& e) {
      TranslateValidationError(e);
    }
  });

  m.def("json_pointer_from_path", &invoice_check::json_pointer_from_path);

  m.def(
      "validate_invoice",
      [](py::object invoice_details, py::object line_items, py::object total_summary, py::object config) {
        CheckConfig cfg = CheckConfigFromPy(std::move(config));
        return VerdictToPy(invoice_check::validate_invoice(DocumentFromPy(invoice_details, line_items, total_summary), cfg));
      },
      py::arg("invoice_details"), py::arg("line_items"), py::arg("total_summary"), py::arg("config") = py::none());

  m.def(
      "validate_invoice_all",
      [](py::object invoice_details, py::object line_items, py::object total_summary, py::object config) {
        CheckConfig cfg = CheckConfigFromPy(std::move(config));
        auto errors =
            invoice_check::validate_invoice_all(DocumentFromPy(invoice_details, line_items, total_summary), cfg);
        py::list out;
        for (const auto& e : errors) out.append(ErrorToPy(e));
        return out;
      },
      py::arg("invoice_details"), py::arg("line_items"), py::arg("total_summary"), py::arg("config") = py::none());

  m.def(
      "validate_invoice_json",
      [](const std::string& text, py::object config, bool strict, py::object repair) {
        CheckConfig cfg = CheckConfigFromPy(std::move(config));
        RepairConfig rep = RepairConfigFromPy(std::move(repair), strict);
        return VerdictToPy(invoice_check::validate_invoice_json(text, cfg, rep));
      },
      py::arg("text"), py::arg("config") = py::none(), py::arg("strict") = false, py::arg("repair") = py::none());

  m.def("normalize_rows", [](py::object invoice_details, py::object line_items, py::object total_summary) {
    auto doc = invoice_check::normalize_nulls(DocumentFromPy(invoice_details, line_items, total_summary));
    return ToPy(invoice_check::document_to_json(doc));
  });
}
