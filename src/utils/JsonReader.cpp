/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <charconv>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace Vantage {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}
} // namespace

// JsonValue implementation
std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().find(key) != asObject().end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size())
    return nullValue();
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Cannot open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position != m_input.size()) {
    return fail("Unexpected trailing characters");
  }
  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string value;
    if (!parseString(value)) {
      return false;
    }
    out = JsonValue(std::move(value));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
      return parseNumber(out);
    }
    return fail(std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }
    skipWhitespace();
    if (!expect(':')) {
      return false;
    }
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    object[key] = std::move(value);
    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect('}')) {
      return false;
    }
    break;
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    array.push_back(std::move(value));
    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect(']')) {
      return false;
    }
    break;
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();
  while (true) {
    if (m_position >= m_input.size()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out.push_back(escaped);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u':
      if (!appendUnicodeEscape(out)) {
        return false;
      }
      break;
    default:
      return fail("Invalid escape sequence");
    }
  }
}

// Encodes one \uXXXX escape as UTF-8 (surrogate pairs are not combined)
bool JsonReader::appendUnicodeEscape(std::string &out) {
  if (m_position + 4 > m_input.size()) {
    return fail("Truncated unicode escape");
  }
  uint32_t codePoint = 0;
  const char *first = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, first + 4, codePoint, 16);
  if (ec != std::errc() || ptr != first + 4) {
    return fail("Invalid unicode escape");
  }
  for (int i = 0; i < 4; ++i) {
    advance();
  }

  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  auto isDigit = [this]() { return std::isdigit(static_cast<unsigned char>(peek())) != 0; };

  if (peek() == '-') {
    advance();
  }
  if (!isDigit()) {
    return fail("Invalid number");
  }
  while (isDigit()) {
    advance();
  }
  if (peek() == '.') {
    advance();
    if (!isDigit()) {
      return fail("Expected digit after decimal point");
    }
    while (isDigit()) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!isDigit()) {
      return fail("Expected digit in exponent");
    }
    while (isDigit()) {
      advance();
    }
  }

  double value = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return fail("Number out of range");
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value, JsonValue &out) {
  const size_t length = std::strlen(literal);
  if (m_input.compare(m_position, length, literal) != 0) {
    return fail(std::format("Expected '{}'", literal));
  }
  for (size_t i = 0; i < length; ++i) {
    advance();
  }
  out = std::move(value);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size()) {
    return '\0';
  }
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r') {
    advance();
  }
}

bool JsonReader::expect(char c) {
  if (peek() != c) {
    return fail(std::format("Expected '{}'", c));
  }
  advance();
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("{} at line {}, column {}", message, m_line, m_column);
  return false;
}

} // namespace Vantage
