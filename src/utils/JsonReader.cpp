/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

namespace SwarmForge {

// ============================================================================
// JsonValue
// ============================================================================

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<float> JsonValue::tryAsFloat() const {
  if (isNumber())
    return static_cast<float>(asNumber());
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

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  writeTo(out);
  return out;
}

namespace {

void writeEscaped(std::string &out, const std::string &text) {
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

} // namespace

void JsonValue::writeTo(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    const double num = asNumber();
    if (!std::isfinite(num)) {
      out += "null";
    } else if (std::floor(num) == num && std::abs(num) < 1e15) {
      out += std::to_string(static_cast<long long>(num));
    } else {
      // Shortest form that parses back to the same double
      out += std::format("{}", num);
    }
    break;
  }
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first)
        out += ',';
      first = false;
      element.writeTo(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        out += ',';
      first = false;
      writeEscaped(out, key);
      out += ':';
      value.writeTo(out);
    }
    out += '}';
    break;
  }
  }
}

// ============================================================================
// JsonReader
// ============================================================================

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position < m_input.size()) {
    return fail("Unexpected trailing characters");
  }
  m_root = std::move(root);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
  return false;
}

char JsonReader::peek() const {
  return (m_position < m_input.size()) ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

bool JsonReader::consume(char expected) {
  skipWhitespace();
  if (peek() != expected) {
    return false;
  }
  advance();
  return true;
}

bool JsonReader::consumeLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      return fail(std::format("Invalid literal, expected '{}'", literal));
    }
    advance();
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  const char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!consumeLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!consumeLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!consumeLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber(out);
    }
    return fail(std::format("Unexpected character: '{}'", c));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;

  if (consume('}')) {
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key))
      return false;
    if (!consume(':')) {
      return fail("Expected ':' after object key");
    }
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object.insert_or_assign(std::move(key), std::move(value));

    if (consume(','))
      continue;
    if (consume('}'))
      break;
    return fail("Expected ',' or '}' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;

  if (consume(']')) {
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth))
      return false;
    array.push_back(std::move(element));

    if (consume(','))
      continue;
    if (consume(']'))
      break;
    return fail("Expected ',' or ']' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (m_position < m_input.size()) {
    const char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    const char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseUnicodeEscape(codepoint))
        return false;
      // Combine surrogate pairs
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        uint32_t low = 0;
        if (advance() != '\\' || advance() != 'u' || !parseUnicodeEscape(low) ||
            low < 0xDC00 || low > 0xDFFF) {
          return fail("Invalid unicode surrogate pair");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail(std::format("Invalid escape sequence: '\\{}'", escaped));
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  if (m_position + 4 > m_input.size()) {
    return fail("Incomplete unicode escape");
  }
  const char *begin = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(begin, begin + 4, codepoint, 16);
  if (ec != std::errc() || ptr != begin + 4) {
    return fail("Invalid unicode escape");
  }
  for (int i = 0; i < 4; ++i)
    advance();
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    return fail("Invalid number");
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9'))
      return fail("Expected digit after decimal point");
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9'))
      return fail("Expected digit in exponent");
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  double value = 0.0;
  const char *begin = m_input.data() + start;
  const char *end = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return fail("Number out of range");
  }
  out = JsonValue(value);
  return true;
}

} // namespace SwarmForge
