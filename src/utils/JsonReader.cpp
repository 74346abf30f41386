/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Lattice {

namespace {

const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

constexpr int MAX_DEPTH = 128;

} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *v = std::get_if<bool>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *v = std::get_if<double>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *v = std::get_if<std::string>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = std::get_if<JsonObject>(&m_value);
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (const JsonObject *obj = std::get_if<JsonObject>(&m_value)) {
    auto it = obj->find(key);
    if (it != obj->end()) {
      return it->second;
    }
  }
  return nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (const JsonArray *arr = std::get_if<JsonArray>(&m_value)) {
    if (index < arr->size()) {
      return (*arr)[index];
    }
  }
  return nullValue();
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = std::get_if<JsonArray>(&m_value)) {
    return arr->size();
  }
  if (const JsonObject *obj = std::get_if<JsonObject>(&m_value)) {
    return obj->size();
  }
  return 0;
}

// Single pass over the text; errors are reported by throwing
// std::runtime_error, which JsonReader::parse() turns into getLastError()
class JsonReader::Parser {
public:
  explicit Parser(const std::string &text) : m_text(text) {}

  JsonValue parseDocument() {
    skipWhitespace();
    JsonValue value = parseValue(0);
    skipWhitespace();
    if (!atEnd()) {
      fail("Unexpected trailing content");
    }
    return value;
  }

private:
  bool atEnd() const { return m_pos >= m_text.size(); }
  char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }

  char advance() {
    const char c = m_text[m_pos++];
    if (c == '\n') {
      ++m_line;
      m_column = 1;
    } else {
      ++m_column;
    }
    return c;
  }

  [[noreturn]] void fail(const std::string &message) const {
    throw std::runtime_error(message + " at line " + std::to_string(m_line) +
                             ", column " + std::to_string(m_column));
  }

  void skipWhitespace() {
    while (!atEnd()) {
      const char c = peek();
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        break;
      }
      advance();
    }
  }

  void expect(char c) {
    if (peek() != c) {
      fail(std::string("Expected '") + c + "'");
    }
    advance();
  }

  void expectLiteral(const char *literal) {
    for (const char *p = literal; *p; ++p) {
      if (peek() != *p) {
        fail(std::string("Invalid literal, expected '") + literal + "'");
      }
      advance();
    }
  }

  JsonValue parseValue(int depth) {
    if (depth > MAX_DEPTH) {
      fail("Nesting too deep");
    }
    switch (peek()) {
    case '{':
      return JsonValue(parseObject(depth));
    case '[':
      return JsonValue(parseArray(depth));
    case '"':
      return JsonValue(parseString());
    case 't':
      expectLiteral("true");
      return JsonValue(true);
    case 'f':
      expectLiteral("false");
      return JsonValue(false);
    case 'n':
      expectLiteral("null");
      return JsonValue();
    default:
      if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
        return JsonValue(parseNumber());
      }
      if (atEnd()) {
        fail("Unexpected end of input");
      }
      fail(std::string("Unexpected character '") + peek() + "'");
    }
  }

  JsonObject parseObject(int depth) {
    JsonObject object;
    expect('{');
    skipWhitespace();
    if (peek() == '}') {
      advance();
      return object;
    }
    while (true) {
      skipWhitespace();
      if (peek() != '"') {
        fail("Expected string key");
      }
      std::string key = parseString();
      skipWhitespace();
      expect(':');
      skipWhitespace();
      object[std::move(key)] = parseValue(depth + 1);
      skipWhitespace();
      if (peek() == ',') {
        advance();
        continue;
      }
      expect('}');
      return object;
    }
  }

  JsonArray parseArray(int depth) {
    JsonArray array;
    expect('[');
    skipWhitespace();
    if (peek() == ']') {
      advance();
      return array;
    }
    while (true) {
      skipWhitespace();
      array.push_back(parseValue(depth + 1));
      skipWhitespace();
      if (peek() == ',') {
        advance();
        continue;
      }
      expect(']');
      return array;
    }
  }

  double parseNumber() {
    const size_t start = m_pos;
    if (peek() == '-') {
      advance();
    }
    if (peek() == '0') {
      advance();
    } else if (peek() >= '1' && peek() <= '9') {
      while (peek() >= '0' && peek() <= '9') {
        advance();
      }
    } else {
      fail("Invalid number");
    }
    if (peek() == '.') {
      advance();
      if (!(peek() >= '0' && peek() <= '9')) {
        fail("Expected digit after decimal point");
      }
      while (peek() >= '0' && peek() <= '9') {
        advance();
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      advance();
      if (peek() == '+' || peek() == '-') {
        advance();
      }
      if (!(peek() >= '0' && peek() <= '9')) {
        fail("Expected digit in exponent");
      }
      while (peek() >= '0' && peek() <= '9') {
        advance();
      }
    }

    const std::string literal = m_text.substr(start, m_pos - start);
    errno = 0;
    char *end = nullptr;
    const double value = std::strtod(literal.c_str(), &end);
    if (errno == ERANGE) {
      fail("Number out of range");
    }
    return value;
  }

  uint32_t parseHex4() {
    uint32_t code = 0;
    for (int i = 0; i < 4; ++i) {
      const char c = peek();
      code <<= 4;
      if (c >= '0' && c <= '9') {
        code |= static_cast<uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        code |= static_cast<uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        code |= static_cast<uint32_t>(c - 'A' + 10);
      } else {
        fail("Invalid unicode escape");
      }
      advance();
    }
    return code;
  }

  static void appendUtf8(std::string &out, uint32_t cp) {
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

  std::string parseString() {
    std::string out;
    expect('"');
    while (true) {
      if (atEnd()) {
        fail("Unterminated string");
      }
      const char c = advance();
      if (c == '"') {
        return out;
      }
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("Control character in string");
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (atEnd()) {
        fail("Unterminated escape");
      }
      const char esc = advance();
      switch (esc) {
      case '"': out += '"'; break;
      case '\\': out += '\\'; break;
      case '/': out += '/'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;
      case 'u': {
        uint32_t cp = parseHex4();
        // Surrogate pair
        if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\') {
          advance();
          expect('u');
          const uint32_t low = parseHex4();
          if (low < 0xDC00 || low > 0xDFFF) {
            fail("Invalid surrogate pair");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        appendUtf8(out, cp);
        break;
      }
      default:
        fail(std::string("Invalid escape '\\") + esc + "'");
      }
    }
  }

  const std::string &m_text;
  size_t m_pos{0};
  size_t m_line{1};
  size_t m_column{1};
};

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  try {
    Parser parser(jsonString);
    JsonValue root = parser.parseDocument();
    m_root = std::move(root);
    m_lastError.clear();
    return true;
  } catch (const std::runtime_error &e) {
    m_lastError = e.what();
    return false;
  }
}

} // namespace Lattice
