#include "fleetfeast/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ostream>
#include <sstream>

namespace fleetfeast {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

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

void JsonValue::add(std::string key, JsonValue v)
{
  objectValue.emplace_back(std::move(key), std::move(v));
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

bool GetJsonString(const JsonValue& obj, const std::string& key, std::string& out)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || !v->isString()) return false;
  out = v->stringValue;
  return true;
}

bool GetJsonNumber(const JsonValue& obj, const std::string& key, double& out)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || !v->isNumber() || !std::isfinite(v->numberValue)) return false;
  out = v->numberValue;
  return true;
}

std::string JsonEscape(const std::string& s)
{
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned int>(ch));
        out += buf;
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
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

struct Parser {
  const std::string& s;
  std::size_t i = 0;
  int depth = 0;
  std::string err;

  explicit Parser(const std::string& str) : s(str) {}

  void skipWs()
  {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
  }

  char peek() const { return i < s.size() ? s[i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    if (err.empty()) {
      std::ostringstream oss;
      oss << "JSON parse error @" << i << ": " << msg;
      err = oss.str();
    }
    return false;
  }

  bool parseValue(JsonValue& out)
  {
    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') return parseLiteral("null", JsonValue::MakeNull(), out);
    if (c == 't') return parseLiteral("true", JsonValue::MakeBool(true), out);
    if (c == 'f') return parseLiteral("false", JsonValue::MakeBool(false), out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = JsonValue::MakeString(std::move(tmp));
      return true;
    }
    if (c == '[' || c == '{') {
      if (++depth > kMaxJsonDepth) return fail("nesting too deep");
      const bool ok = (c == '[') ? parseArray(out) : parseObject(out);
      --depth;
      return ok;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseLiteral(const char* word, JsonValue value, JsonValue& out)
  {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) return fail("expected '" + w + "'");
    i += w.size();
    out = std::move(value);
    return true;
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = i;

    consume('-');
    if (!consume('0') && !digits()) return fail("expected digit");
    if (consume('.') && !digits()) return fail("expected digit after '.'");
    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string numStr = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno == ERANGE || end == numStr.c_str() || (end && *end != '\0')) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (i + 4 > s.size()) return fail("invalid \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (i >= s.size()) return fail("unterminated escape sequence");
      const char e = s[i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parseHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate: must be followed by a low surrogate.
          std::uint32_t lo = 0;
          if (!consume('\\') || !consume('u') || !parseHex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
            return fail("unpaired surrogate in \\u escape");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate in \\u escape");
        }
        AppendUtf8(result, cp);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out)
  {
    consume('[');
    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (!consume(']')) {
      while (true) {
        JsonValue v;
        if (!parseValue(v)) return false;
        arr.arrayValue.push_back(std::move(v));

        skipWs();
        if (consume(']')) break;
        if (!consume(',')) return fail("expected ',' or ']'");
      }
    }
    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out)
  {
    consume('{');
    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (!consume('}')) {
      while (true) {
        skipWs();
        std::string key;
        if (!parseString(key)) return false;

        skipWs();
        if (!consume(':')) return fail("expected ':'");

        JsonValue val;
        if (!parseValue(val)) return false;
        obj.objectValue.emplace_back(std::move(key), std::move(val));

        skipWs();
        if (consume('}')) break;
        if (!consume(',')) return fail("expected ',' or '}'");
      }
    }
    out = std::move(obj);
    return true;
  }
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseValue(v)) {
    outError = p.err;
    return false;
  }
  p.skipWs();
  if (p.i != text.size()) {
    outError = "JSON parse error @" + std::to_string(p.i) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  JsonWriter w(oss, opt);
  w.value(value);
  return oss.str();
}

// -----------------------------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt)
    : m_os(&os)
    , m_opt(opt)
{
}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

void JsonWriter::newline(std::size_t depth)
{
  if (!m_opt.pretty) return;
  *m_os << '\n';
  for (std::size_t i = 0; i < depth * static_cast<std::size_t>(m_opt.indent); ++i) *m_os << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_stack.empty()) {
    if (m_finished) return setError("JsonWriter: multiple top-level values");
    return true;
  }

  Frame& f = m_stack.back();
  if (f.kind == Frame::Kind::Object) {
    if (f.expectingKey) return setError("JsonWriter: value written where a key was expected");
    return true;
  }

  if (!f.first) *m_os << ',';
  newline(m_stack.size());
  return true;
}

void JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    return;
  }
  Frame& f = m_stack.back();
  f.first = false;
  if (f.kind == Frame::Kind::Object) f.expectingKey = true;
}

bool JsonWriter::beginContainer(Frame::Kind kind, char openChar)
{
  if (!prepareValue()) return false;
  *m_os << openChar;
  m_stack.push_back(Frame{kind, true, true});
  return true;
}

bool JsonWriter::endContainer(Frame::Kind kind, char closeChar)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: mismatched container end");
  if (kind == Frame::Kind::Object && !m_stack.back().expectingKey) {
    return setError("JsonWriter: object closed after a dangling key");
  }

  const bool empty = m_stack.back().first;
  m_stack.pop_back();
  if (!empty) newline(m_stack.size());
  *m_os << closeChar;
  finishValue();
  return static_cast<bool>(*m_os) || setError("JsonWriter: stream failure");
}

bool JsonWriter::beginObject() { return beginContainer(Frame::Kind::Object, '{'); }
bool JsonWriter::endObject() { return endContainer(Frame::Kind::Object, '}'); }
bool JsonWriter::beginArray() { return beginContainer(Frame::Kind::Array, '['); }
bool JsonWriter::endArray() { return endContainer(Frame::Kind::Array, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Frame::Kind::Object || !m_stack.back().expectingKey) {
    return setError("JsonWriter: key outside of an object");
  }

  Frame& f = m_stack.back();
  if (!f.first) *m_os << ',';
  newline(m_stack.size());
  *m_os << '"' << JsonEscape(k) << "\":";
  if (m_opt.pretty) *m_os << ' ';
  f.expectingKey = false;
  return true;
}

bool JsonWriter::nullValue()
{
  if (!prepareValue()) return false;
  *m_os << "null";
  finishValue();
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  *m_os << (b ? "true" : "false");
  finishValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return nullValue();
  if (!prepareValue()) return false;

  // Integral values print without a fraction; everything else keeps 17 significant
  // digits so a parse of the output yields the same double.
  if (std::fabs(n) < 1e15 && n == std::floor(n)) {
    *m_os << static_cast<long long>(n);
  } else {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", n);
    *m_os << buf;
  }
  finishValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  *m_os << n;
  finishValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  *m_os << '"' << JsonEscape(s) << '"';
  finishValue();
  return true;
}

bool JsonWriter::value(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::Null: return nullValue();
  case JsonValue::Type::Bool: return boolValue(v.boolValue);
  case JsonValue::Type::Number: return numberValue(v.numberValue);
  case JsonValue::Type::String: return stringValue(v.stringValue);
  case JsonValue::Type::Array:
    if (!beginArray()) return false;
    for (const JsonValue& e : v.arrayValue) {
      if (!value(e)) return false;
    }
    return endArray();
  case JsonValue::Type::Object:
    if (!beginObject()) return false;
    for (const auto& kv : v.objectValue) {
      if (!key(kv.first) || !value(kv.second)) return false;
    }
    return endObject();
  }
  return setError("JsonWriter: unknown value type");
}

} // namespace fleetfeast
