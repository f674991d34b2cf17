#include "avfcomp/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdlib>

namespace avfcomp {

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
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(s.size() + 2);
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
        out += "\\u00";
        out.push_back(kHex[ch >> 4]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

bool IsDigit(char c)
{
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void AppendUtf8(std::string& out, unsigned int cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

class Parser {
public:
  explicit Parser(const std::string& text) : m_s(text) {}

  bool parseDocument(JsonValue& out)
  {
    if (!parseValue(out, 0)) return false;
    skipWs();
    if (m_i != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  // Config files are shallow; this only guards against pathological input.
  static constexpr int kMaxDepth = 64;

  void skipWs()
  {
    while (m_i < m_s.size() && std::isspace(static_cast<unsigned char>(m_s[m_i])) != 0) ++m_i;
  }

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++m_i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    m_err = "JSON parse error @" + std::to_string(m_i) + ": " + msg;
    return false;
  }

  bool literal(const char* word, std::size_t len)
  {
    if (m_s.compare(m_i, len, word) != 0) return fail(std::string("expected '") + word + "'");
    m_i += len;
    return true;
  }

  bool parseValue(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWs();
    const char c = peek();
    out = JsonValue{};
    switch (c) {
    case '\0': return fail("unexpected end of input");
    case 'n': return literal("null", 4);
    case 't':
      out.type = JsonValue::Type::Bool;
      out.boolValue = true;
      return literal("true", 4);
    case 'f':
      out.type = JsonValue::Type::Bool;
      return literal("false", 5);
    case '"':
      out.type = JsonValue::Type::String;
      return parseString(out.stringValue);
    case '[': return parseArray(out, depth);
    case '{': return parseObject(out, depth);
    default: break;
    }
    if (c == '-' || IsDigit(c)) return parseNumber(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = m_i;
    consume('-');
    if (!consume('0')) {
      if (!IsDigit(peek())) return fail("expected digit");
      while (IsDigit(peek())) ++m_i;
    }
    if (consume('.')) {
      if (!IsDigit(peek())) return fail("expected digit after '.'");
      while (IsDigit(peek())) ++m_i;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (!IsDigit(peek())) return fail("expected exponent digits");
      while (IsDigit(peek())) ++m_i;
    }

    const std::string num = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(num.c_str(), &end);
    if (errno != 0 || end != num.c_str() + num.size()) return fail("invalid number");

    out.type = JsonValue::Type::Number;
    out.numberValue = v;
    return true;
  }

  bool parseHex4(unsigned int& out)
  {
    if (m_i + 4 > m_s.size()) return fail("invalid \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<unsigned int>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<unsigned int>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<unsigned int>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    if (!consume('"')) return fail("expected string");
    out.clear();
    while (m_i < m_s.size()) {
      const char c = m_s[m_i++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (m_i >= m_s.size()) break;
      const char e = m_s[m_i++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        // BMP only; surrogate halves are kept as '?'.
        unsigned int cp = 0;
        if (!parseHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) out.push_back('?');
        else AppendUtf8(out, cp);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }
    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out, int depth)
  {
    consume('[');
    out.type = JsonValue::Type::Array;
    skipWs();
    if (consume(']')) return true;

    while (true) {
      out.arrayValue.emplace_back();
      if (!parseValue(out.arrayValue.back(), depth + 1)) return false;
      skipWs();
      if (consume(']')) return true;
      if (!consume(',')) return fail("expected ',' or ']'");
    }
  }

  bool parseObject(JsonValue& out, int depth)
  {
    consume('{');
    out.type = JsonValue::Type::Object;
    skipWs();
    if (consume('}')) return true;

    while (true) {
      skipWs();
      std::string key;
      if (!parseString(key)) return false;
      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val, depth + 1)) return false;
      out.objectValue.emplace_back(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) return true;
      if (!consume(',')) return fail("expected ',' or '}'");
    }
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseDocument(v)) {
    outError = p.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

} // namespace avfcomp
