#include "atlas/Json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace atlas {

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

JsonValue& JsonValue::set(std::string key, JsonValue v)
{
  if (isObject()) objectValue.emplace_back(std::move(key), std::move(v));
  return *this;
}

JsonValue& JsonValue::push(JsonValue v)
{
  if (isArray()) arrayValue.push_back(std::move(v));
  return *this;
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  std::string out;
  out.reserve(s.size() + 2);
  for (const char c : s) {
    const unsigned char uc = static_cast<unsigned char>(c);
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    default:
      if (uc < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(uc));
        out += buf;
      } else {
        out += c;
      }
    }
  }
  return out;
}

namespace {

constexpr int kMaxDepth = 64;

class Parser {
public:
  explicit Parser(const std::string& text) : m_s(text) {}

  bool document(JsonValue& out)
  {
    if (!value(out, 0)) return false;
    ws();
    if (m_i != m_s.size()) return fail("trailing characters after document");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  bool fail(const std::string& msg)
  {
    // 1-based line/column make config mistakes easy to find.
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < m_i && k < m_s.size(); ++k) {
      if (m_s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    m_err = "JSON error at line " + std::to_string(line) + ", column " + std::to_string(col) + ": " + msg;
    return false;
  }

  void ws()
  {
    while (m_i < m_s.size() && (m_s[m_i] == ' ' || m_s[m_i] == '\t' || m_s[m_i] == '\n' || m_s[m_i] == '\r')) ++m_i;
  }

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }

  bool literal(const char* word)
  {
    const std::size_t n = std::char_traits<char>::length(word);
    if (m_s.compare(m_i, n, word) != 0) return fail(std::string("expected '") + word + "'");
    m_i += n;
    return true;
  }

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    ws();
    switch (peek()) {
    case '\0': return fail("unexpected end of input");
    case 'n':
      out = JsonValue::MakeNull();
      return literal("null");
    case 't':
      out = JsonValue::MakeBool(true);
      return literal("true");
    case 'f':
      out = JsonValue::MakeBool(false);
      return literal("false");
    case '"': {
      std::string s;
      if (!string(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return array(out, depth);
    case '{': return object(out, depth);
    default: break;
    }
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) return number(out);
    return fail(std::string("unexpected character '") + peek() + "'");
  }

  bool digits()
  {
    if (!(peek() >= '0' && peek() <= '9')) return fail("expected digit");
    while (peek() >= '0' && peek() <= '9') ++m_i;
    return true;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_i;
    if (peek() == '-') ++m_i;
    if (peek() == '0') {
      ++m_i;
    } else if (!digits()) {
      return false;
    }
    if (peek() == '.') {
      ++m_i;
      if (!digits()) return false;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (!digits()) return false;
    }

    const std::string tok = m_s.substr(start, m_i - start);
    char* end = nullptr;
    const double v = std::strtod(tok.c_str(), &end);
    if (end != tok.c_str() + tok.size()) return fail("malformed number");
    out = JsonValue::MakeNumber(v);
    return true;
  }

  static void appendUtf8(std::string& out, std::uint32_t cp)
  {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool hex4(std::uint32_t& out)
  {
    if (m_s.size() - m_i < 4) return fail("truncated \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = m_s[m_i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(10 + c - 'a');
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(10 + c - 'A');
      else return fail("bad hex digit in \\u escape");
    }
    return true;
  }

  bool string(std::string& out)
  {
    ++m_i; // opening quote
    for (;;) {
      if (m_i >= m_s.size()) return fail("unterminated string");
      const char c = m_s[m_i++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        out += c;
        continue;
      }

      if (m_i >= m_s.size()) return fail("unterminated escape");
      const char e = m_s[m_i++];
      switch (e) {
      case '"': out += '"'; break;
      case '\\': out += '\\'; break;
      case '/': out += '/'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!hex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          if (m_s.compare(m_i, 2, "\\u") != 0) return fail("unpaired surrogate");
          m_i += 2;
          std::uint32_t lo = 0;
          if (!hex4(lo)) return false;
          if (lo < 0xDC00 || lo > 0xDFFF) return fail("bad low surrogate");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }
        appendUtf8(out, cp);
        break;
      }
      default: return fail(std::string("bad escape '\\") + e + "'");
      }
    }
  }

  bool array(JsonValue& out, int depth)
  {
    ++m_i;
    out = JsonValue::MakeArray();
    ws();
    if (peek() == ']') {
      ++m_i;
      return true;
    }
    for (;;) {
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.arrayValue.push_back(std::move(v));
      ws();
      if (peek() == ',') {
        ++m_i;
        ws();
        if (peek() == ']') return fail("trailing comma in array");
        continue;
      }
      if (peek() == ']') {
        ++m_i;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  bool object(JsonValue& out, int depth)
  {
    ++m_i;
    out = JsonValue::MakeObject();
    ws();
    if (peek() == '}') {
      ++m_i;
      return true;
    }
    for (;;) {
      ws();
      if (peek() != '"') return fail(peek() == '}' ? "trailing comma in object" : "expected member name");
      std::string key;
      if (!string(key)) return false;
      ws();
      if (peek() != ':') return fail("expected ':'");
      ++m_i;
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.objectValue.emplace_back(std::move(key), std::move(v));
      ws();
      if (peek() == ',') {
        ++m_i;
        continue;
      }
      if (peek() == '}') {
        ++m_i;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

std::string NumberText(double v)
{
  if (!std::isfinite(v)) return "null";
  if (v == std::floor(v) && std::fabs(v) < 9.0e15) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0f", v);
    return buf;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  // Prefer the shortest form that reads back exactly.
  for (int prec = 6; prec < 17; ++prec) {
    char tmp[32];
    std::snprintf(tmp, sizeof(tmp), "%.*g", prec, v);
    if (std::strtod(tmp, nullptr) == v) return tmp;
  }
  return buf;
}

void Write(std::string& out, const JsonValue& v, const JsonWriteOptions& opt, int depth)
{
  auto newline = [&](int d) {
    if (!opt.pretty) return;
    out += '\n';
    out.append(static_cast<std::size_t>(std::max(0, d * opt.indent)), ' ');
  };

  switch (v.type) {
  case JsonValue::Type::Null: out += "null"; return;
  case JsonValue::Type::Bool: out += v.boolValue ? "true" : "false"; return;
  case JsonValue::Type::Number: out += NumberText(v.numberValue); return;
  case JsonValue::Type::String:
    out += '"';
    out += JsonEscape(v.stringValue);
    out += '"';
    return;
  case JsonValue::Type::Array:
    if (v.arrayValue.empty()) {
      out += "[]";
      return;
    }
    out += '[';
    for (std::size_t i = 0; i < v.arrayValue.size(); ++i) {
      if (i) out += ',';
      newline(depth + 1);
      Write(out, v.arrayValue[i], opt, depth + 1);
    }
    newline(depth);
    out += ']';
    return;
  case JsonValue::Type::Object: {
    if (v.objectValue.empty()) {
      out += "{}";
      return;
    }
    std::vector<const std::pair<std::string, JsonValue>*> members;
    members.reserve(v.objectValue.size());
    for (const auto& kv : v.objectValue) members.push_back(&kv);
    if (opt.sortKeys) {
      std::stable_sort(members.begin(), members.end(), [](const auto* a, const auto* b) { return a->first < b->first; });
    }

    out += '{';
    for (std::size_t i = 0; i < members.size(); ++i) {
      if (i) out += ',';
      newline(depth + 1);
      out += '"';
      out += JsonEscape(members[i]->first);
      out += opt.pretty ? "\": " : "\":";
      Write(out, members[i]->second, opt, depth + 1);
    }
    newline(depth);
    out += '}';
    return;
  }
  }
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  outError.clear();
  Parser p(text);
  JsonValue v;
  if (!p.document(v)) {
    outError = p.error();
    return false;
  }
  outValue = std::move(v);
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::string out;
  Write(out, value, opt, 0);
  return out;
}

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  outError.clear();
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    outError = "failed to open for writing: " + path;
    return false;
  }
  f << JsonStringify(value, opt) << "\n";
  if (!f) {
    outError = "write failed: " + path;
    return false;
  }
  return true;
}

bool ReadTextFile(const std::string& path, std::string& outText, std::string& outError)
{
  outError.clear();
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "read failed: " + path;
    return false;
  }
  outText = oss.str();
  return true;
}

} // namespace atlas
