#include "invoice_check.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace invoice_check {

// ---------------- Json helpers ----------------

bool Json::is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
bool Json::is_bool() const { return std::holds_alternative<bool>(value); }
bool Json::is_number() const { return std::holds_alternative<double>(value); }
bool Json::is_string() const { return std::holds_alternative<std::string>(value); }
bool Json::is_array() const { return std::holds_alternative<JsonArray>(value); }
bool Json::is_object() const { return std::holds_alternative<JsonObject>(value); }

const bool& Json::as_bool() const { return std::get<bool>(value); }
const double& Json::as_number() const { return std::get<double>(value); }
const std::string& Json::as_string() const { return std::get<std::string>(value); }
const JsonArray& Json::as_array() const { return std::get<JsonArray>(value); }
const JsonObject& Json::as_object() const { return std::get<JsonObject>(value); }

JsonArray& Json::as_array() { return std::get<JsonArray>(value); }
JsonObject& Json::as_object() { return std::get<JsonObject>(value); }

static std::string trim_copy(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out.push_back(hex[(c >> 4) & 0xF]);
          out.push_back(hex[c & 0xF]);
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

std::string json_pointer_from_path(const std::string& json_path) {
  if (json_path.empty() || json_path[0] != '$') return "";

  std::string out;
  auto append_segment = [&out](const std::string& seg) {
    out.push_back('/');
    for (char c : seg) {
      if (c == '~') {
        out += "~0";
      } else if (c == '/') {
        out += "~1";
      } else {
        out.push_back(c);
      }
    }
  };

  size_t i = 1;
  while (i < json_path.size()) {
    if (json_path[i] == '.') {
      size_t start = ++i;
      while (i < json_path.size() && json_path[i] != '.' && json_path[i] != '[') ++i;
      if (i > start) append_segment(json_path.substr(start, i - start));
    } else if (json_path[i] == '[') {
      size_t start = ++i;
      while (i < json_path.size() && json_path[i] != ']') ++i;
      std::string inner = json_path.substr(start, i - start);
      if (inner.size() >= 2 && (inner.front() == '"' || inner.front() == '\'') && inner.back() == inner.front()) {
        inner = inner.substr(1, inner.size() - 2);
      }
      if (!inner.empty()) append_segment(inner);
      if (i < json_path.size()) ++i;
    } else {
      ++i;
    }
  }
  return out;
}

std::string format_number(double n) {
  if (!std::isfinite(n)) return "null";
  double intpart;
  std::ostringstream oss;
  if (std::modf(n, &intpart) == 0.0) {
    oss.setf(std::ios::fixed);
    oss.precision(0);
  } else {
    oss.precision(15);
  }
  oss << n;
  return oss.str();
}

std::string dumps_json(const Json& value) {
  if (value.is_null()) return "null";
  if (value.is_bool()) return value.as_bool() ? "true" : "false";
  if (value.is_number()) return format_number(value.as_number());
  if (value.is_string()) return "\"" + json_escape(value.as_string()) + "\"";
  if (value.is_array()) {
    std::string out = "[";
    const auto& arr = value.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",";
      out += dumps_json(arr[i]);
    }
    return out + "]";
  }
  std::string out = "{";
  bool first = true;
  for (const auto& kv : value.as_object()) {
    if (!first) out += ",";
    first = false;
    out += "\"" + json_escape(kv.first) + "\":" + dumps_json(kv.second);
  }
  return out + "}";
}

// ---------------- JSON-ish repairs ----------------

namespace {

// Tracks whether the scanned byte sits inside a '...' or "..." literal.
struct LiteralTracker {
  bool in_str{false};
  char quote{0};
  bool escape{false};

  // Returns true when c is part of a string literal, quotes included.
  bool step(char c) {
    if (in_str) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == quote) {
        in_str = false;
      }
      return true;
    }
    if (c == '"' || c == '\'') {
      in_str = true;
      quote = c;
      return true;
    }
    return false;
  }
};

bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

}  // namespace

static std::string fix_smart_quotes(std::string s) {
  static const std::pair<const char*, const char*> kQuotes[] = {
      {"\xE2\x80\x9C", "\""},
      {"\xE2\x80\x9D", "\""},
      {"\xE2\x80\x98", "'"},
      {"\xE2\x80\x99", "'"},
  };
  for (const auto& q : kQuotes) {
    const std::string from = q.first;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
      s.replace(pos, from.size(), q.second);
      pos += 1;
    }
  }
  return s;
}

static std::string strip_json_comments(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  LiteralTracker lit;

  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    char n = (i + 1 < s.size()) ? s[i + 1] : '\0';
    if (!lit.in_str && c == '/' && n == '/') {
      while (i < s.size() && s[i] != '\n') ++i;
      if (i < s.size()) out.push_back('\n');
      continue;
    }
    if (!lit.in_str && c == '/' && n == '*') {
      size_t end = s.find("*/", i + 2);
      i = (end == std::string::npos) ? s.size() : end + 1;
      continue;
    }
    lit.step(c);
    out.push_back(c);
  }
  return out;
}

static std::string replace_python_literals(const std::string& s) {
  static const std::pair<std::string, const char*> kLiterals[] = {
      {"True", "true"},
      {"False", "false"},
      {"None", "null"},
  };

  std::string out;
  out.reserve(s.size());
  LiteralTracker lit;

  for (size_t i = 0; i < s.size();) {
    if (!lit.in_str && (i == 0 || !is_ident_char(s[i - 1]))) {
      bool replaced = false;
      for (const auto& l : kLiterals) {
        const size_t len = l.first.size();
        if (s.compare(i, len, l.first) == 0 && (i + len >= s.size() || !is_ident_char(s[i + len]))) {
          out += l.second;
          i += len;
          replaced = true;
          break;
        }
      }
      if (replaced) continue;
    }
    lit.step(s[i]);
    out.push_back(s[i]);
    ++i;
  }
  return out;
}

static std::string drop_trailing_commas(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  LiteralTracker lit;

  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (!lit.step(c) && c == ',') {
      size_t j = i + 1;
      while (j < s.size() && std::isspace(static_cast<unsigned char>(s[j]))) ++j;
      if (j < s.size() && (s[j] == '}' || s[j] == ']')) continue;
    }
    out.push_back(c);
  }
  return out;
}

// ---------------- JSON parser ----------------

namespace {

constexpr int kMaxDepth = 128;

struct Parser {
  const std::string& s;
  const RepairConfig& repair;
  size_t i{0};
  int depth{0};

  Parser(const std::string& in, const RepairConfig& cfg) : s(in), repair(cfg) {}

  [[noreturn]] void fail(const std::string& msg, const std::string& path) const {
    throw ValidationError("JSON parse error at offset " + std::to_string(i) + ": " + msg, path, "parse");
  }

  void skip_ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  bool consume(char c) {
    skip_ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  bool consume_word(const char* word) {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) return false;
    if (i + w.size() < s.size() && is_ident_char(s[i + w.size()])) return false;
    i += w.size();
    return true;
  }

  Json parse_value(const std::string& path) {
    skip_ws();
    if (i >= s.size()) fail("unexpected end", path);
    char c = s[i];
    if (c == '{' || c == '[') {
      if (++depth > kMaxDepth) fail("nesting too deep", path);
      Json v = (c == '{') ? parse_object(path) : parse_array(path);
      --depth;
      return v;
    }
    if (c == '"' || c == '\'') return Json(parse_string(path));
    if (consume_word("true")) return Json(true);
    if (consume_word("false")) return Json(false);
    if (consume_word("null")) return Json(nullptr);
    if (consume_word("NaN")) return Json(std::numeric_limits<double>::quiet_NaN());
    if (consume_word("Infinity")) return Json(std::numeric_limits<double>::infinity());
    if (c == '-' && s.compare(i + 1, 8, "Infinity") == 0) {
      i += 9;
      return Json(-std::numeric_limits<double>::infinity());
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return Json(parse_number(path));
    fail(std::string("unexpected char '") + c + "'", path);
  }

  Json parse_object(const std::string& path) {
    ++i;  // '{'
    JsonObject obj;
    if (consume('}')) return Json(std::move(obj));
    while (true) {
      skip_ws();
      if (i >= s.size()) fail("unterminated object", path);
      if (s[i] != '"' && s[i] != '\'') fail("expected string key", path);
      std::string key = parse_string(path);
      if (!consume(':')) fail("expected :", path);
      const std::string child = path + "." + key;
      Json val = parse_value(child);

      auto it = obj.find(key);
      if (it == obj.end()) {
        obj.emplace(std::move(key), std::move(val));
      } else if (repair.duplicate_key_policy == RepairConfig::DuplicateKeyPolicy::Error) {
        throw ValidationError("duplicate key: " + key, child, "parse");
      } else if (repair.duplicate_key_policy == RepairConfig::DuplicateKeyPolicy::LastWins) {
        it->second = std::move(val);
      }

      if (consume('}')) break;
      if (!consume(',')) fail("expected , or }", path);
    }
    return Json(std::move(obj));
  }

  Json parse_array(const std::string& path) {
    ++i;  // '['
    JsonArray arr;
    if (consume(']')) return Json(std::move(arr));
    while (true) {
      arr.push_back(parse_value(path + "[" + std::to_string(arr.size()) + "]"));
      if (consume(']')) break;
      if (!consume(',')) fail("expected , or ]", path);
    }
    return Json(std::move(arr));
  }

  unsigned parse_hex4(const std::string& path) {
    if (i + 4 > s.size()) fail("bad \\u escape", path);
    unsigned v = 0;
    for (int k = 0; k < 4; ++k) {
      char h = s[i++];
      v <<= 4;
      if (h >= '0' && h <= '9') {
        v |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        v |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        v |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad \\u escape", path);
      }
    }
    return v;
  }

  static void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string parse_string(const std::string& path) {
    skip_ws();
    char q = s[i];
    if (q == '\'' && !repair.allow_single_quotes) fail("single-quoted strings are forbidden", path);
    ++i;
    std::string out;
    while (i < s.size()) {
      char c = s[i++];
      if (c == q) return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= s.size()) break;
      char e = s[i++];
      switch (e) {
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          unsigned cp = parse_hex4(path);
          if (cp >= 0xD800 && cp <= 0xDBFF && s.compare(i, 2, "\\u") == 0) {
            i += 2;
            unsigned lo = parse_hex4(path);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            } else {
              append_utf8(out, cp);
              cp = lo;
            }
          }
          append_utf8(out, cp);
          break;
        }
        default:
          out.push_back(e);
      }
    }
    fail("unterminated string", path);
  }

  double parse_number(const std::string& path) {
    size_t start = i;
    if (s[i] == '-') ++i;
    size_t digits = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == digits) fail("expected digits", path);
    if (i < s.size() && s[i] == '.') {
      ++i;
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      size_t exp = i;
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
      if (i == exp) fail("expected exponent digits", path);
    }
    return std::strtod(s.substr(start, i - start).c_str(), nullptr);
  }
};

}  // namespace

std::string extract_json_candidate(const std::string& text) {
  // 1) ```json (or bare ```) fenced block
  {
    std::istringstream in(text);
    std::string line;
    std::ostringstream body;
    bool inside = false;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      std::string t = trim_copy(line);
      if (!inside) {
        std::string low = t;
        std::transform(low.begin(), low.end(), low.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (low == "```" || low == "```json") inside = true;
      } else if (t.rfind("```", 0) == 0) {
        return trim_copy(body.str());
      } else {
        body << line << "\n";
      }
    }
  }

  // 2) first balanced {...} or [...]
  LiteralTracker lit;
  int depth = 0;
  size_t start = std::string::npos;
  char open = 0;
  char close = 0;
  for (size_t idx = 0; idx < text.size(); ++idx) {
    char c = text[idx];
    if (start == std::string::npos) {
      if (c == '{' || c == '[') {
        start = idx;
        open = c;
        close = (c == '{') ? '}' : ']';
        depth = 1;
      }
      continue;
    }
    if (lit.step(c)) continue;
    if (c == open) {
      ++depth;
    } else if (c == close && --depth == 0) {
      return text.substr(start, idx - start + 1);
    }
  }

  return trim_copy(text);
}

RepairConfig strict_repair_config() {
  RepairConfig cfg;
  cfg.fix_smart_quotes = false;
  cfg.strip_json_comments = false;
  cfg.replace_python_literals = false;
  cfg.drop_trailing_commas = false;
  cfg.allow_single_quotes = false;
  cfg.duplicate_key_policy = RepairConfig::DuplicateKeyPolicy::Error;
  return cfg;
}

Json loads_jsonish(const std::string& text, const RepairConfig& repair) {
  std::string fixed = extract_json_candidate(text);
  if (repair.fix_smart_quotes) fixed = fix_smart_quotes(fixed);
  if (repair.strip_json_comments) fixed = strip_json_comments(fixed);
  if (repair.replace_python_literals) fixed = replace_python_literals(fixed);
  if (repair.drop_trailing_commas) fixed = drop_trailing_commas(fixed);

  Parser p(fixed, repair);
  Json v = p.parse_value("$");
  p.skip_ws();
  if (p.i != fixed.size()) p.fail("trailing data", "$");
  return v;
}

}  // namespace invoice_check
