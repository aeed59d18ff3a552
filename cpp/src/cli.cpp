#include "invoice_check.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using namespace invoice_check;

static std::string read_all_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

static std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static bool parse_tolerance(const std::string& text, double& out) {
  auto v = parse_decimal(text);
  if (!v) return false;
  out = *v;
  return true;
}

static void usage() {
  std::cerr
      << "invoice_check_cli [--input <file>] [--all] [--rtol <x>] [--atol <x>] [--cross-totals] [--strict-json]\n"
      << "  Reads an extraction service response from --input or stdin, prints the verdict as JSON to stdout.\n"
      << "  Exit status: 0 passed, 1 failed or malformed input, 2 usage.\n";
}

static JsonObject error_to_json(const ValidationError& e) {
  JsonObject o;
  o["step"] = step_for_kind(e.kind);
  o["kind"] = e.kind;
  o["path"] = e.path;
  o["jsonPointer"] = json_pointer_from_path(e.path);
  o["message"] = e.message;
  return o;
}

int main(int argc, char** argv) {
  try {
    std::string input_path;
    bool collect_all = false;
    CheckConfig config;
    RepairConfig repair;

    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--input" && i + 1 < argc) {
        input_path = argv[++i];
      } else if (a == "--rtol" && i + 1 < argc) {
        if (!parse_tolerance(argv[++i], config.relative_tolerance)) {
          usage();
          return 2;
        }
      } else if (a == "--atol" && i + 1 < argc) {
        if (!parse_tolerance(argv[++i], config.absolute_tolerance)) {
          usage();
          return 2;
        }
      } else if (a == "--all") {
        collect_all = true;
      } else if (a == "--cross-totals") {
        config.cross_check_totals = true;
      } else if (a == "--strict-json") {
        repair = strict_repair_config();
      } else {
        usage();
        return 2;
      }
    }

    std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);
    InvoiceDocument doc = document_from_json(loads_jsonish(input, repair));

    if (collect_all) {
      auto errs = validate_invoice_all(std::move(doc), config);
      JsonArray violations;
      for (const auto& e : errs) violations.push_back(Json(error_to_json(e)));
      JsonObject o;
      o["passed"] = errs.empty();
      o["violations"] = std::move(violations);
      std::cout << dumps_json(Json(o)) << "\n";
      return errs.empty() ? 0 : 1;
    }

    Verdict v = validate_invoice(std::move(doc), config);
    JsonObject o;
    o["passed"] = v.passed;
    o["step"] = v.step;
    o["details"] = v.details;
    if (v.error) {
      o["path"] = v.error->path;
      o["jsonPointer"] = json_pointer_from_path(v.error->path);
    }
    std::cout << dumps_json(Json(o)) << "\n";
    return v.passed ? 0 : 1;
  } catch (const ValidationError& e) {
    if (e.kind == "config") {
      std::cerr << "error: " << e.what() << "\n";
      usage();
      return 2;
    }
    JsonObject o;
    o["error"] = std::string(e.what());
    o["path"] = e.path;
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
