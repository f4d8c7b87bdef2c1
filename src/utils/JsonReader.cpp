/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace HexCrawl {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}
} // anonymous namespace

// JsonValue

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

// Only whole numbers that fit an int; fractions and out of range values are rejected
std::optional<int> JsonValue::tryAsInt() const {
  const double *v = std::get_if<double>(&m_value);
  if (v == nullptr || !std::isfinite(*v) || std::floor(*v) != *v) {
    return std::nullopt;
  }
  if (*v < static_cast<double>(std::numeric_limits<int>::min()) ||
      *v > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(*v);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *v = std::get_if<std::string>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *object = std::get_if<JsonObject>(&m_value);
  return object != nullptr && object->find(key) != object->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *object = std::get_if<JsonObject>(&m_value);
  if (object == nullptr) {
    return nullValue();
  }
  auto it = object->find(key);
  return it != object->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *array = std::get_if<JsonArray>(&m_value);
  if (array == nullptr || index >= array->size()) {
    return nullValue();
  }
  return (*array)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *array = std::get_if<JsonArray>(&m_value)) {
    return array->size();
  }
  if (const JsonObject *object = std::get_if<JsonObject>(&m_value)) {
    return object->size();
  }
  return 0;
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
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
  if (!atEnd()) {
    return setError("Unexpected trailing content");
  }

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const { return atEnd() ? '\0' : m_input[m_position]; }

char JsonReader::advance() {
  if (atEnd()) {
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
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

bool JsonReader::expect(char c) {
  skipWhitespace();
  if (peek() != c) {
    return setError(std::string("Expected '") + c + "'");
  }
  advance();
  return true;
}

bool JsonReader::setError(const std::string &message) {
  m_lastError = message + " at line " + std::to_string(m_line) + ", column " +
                std::to_string(m_column);
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return setError("Nesting too deep");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return setError("Unexpected end of input");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return setError(std::string("Unexpected character '") + peek() + "'");
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
      return setError("Expected string key");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }
    if (!expect(':')) {
      return false;
    }

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
    if (peek() == '}') {
      advance();
      break;
    }
    return setError("Expected ',' or '}' in object");
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
    JsonValue element;
    if (!parseValue(element, depth)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (peek() == ']') {
      advance();
      break;
    }
    return setError("Expected ',' or ']' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (atEnd()) {
      return setError("Unterminated string");
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return setError("Control character in string");
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    char escape = advance();
    switch (escape) {
    case '"':
    case '\\':
    case '/':
      out.push_back(escape);
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
    case 'u': {
      uint32_t codePoint = 0;
      if (!parseUnicodeEscape(codePoint)) {
        return false;
      }
      // Surrogate pair
      if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          return setError("Unpaired surrogate in string");
        }
        uint32_t low = 0;
        if (!parseUnicodeEscape(low)) {
          return false;
        }
        if (low < 0xDC00 || low > 0xDFFF) {
          return setError("Invalid low surrogate in string");
        }
        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codePoint);
      break;
    }
    default:
      return setError("Invalid escape sequence");
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    codePoint <<= 4;
    if (c >= '0' && c <= '9') {
      codePoint |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      codePoint |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      codePoint |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return setError("Invalid unicode escape");
    }
  }
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codePoint) {
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

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
    return setError("Invalid number");
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return setError("Expected digit after decimal point");
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
      return setError("Expected digit in exponent");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  errno = 0;
  const double value = std::strtod(text.c_str(), nullptr);
  if (errno == ERANGE && std::isinf(value)) {
    return setError("Number out of range");
  }

  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      return setError(std::string("Invalid literal, expected '") + literal +
                      "'");
    }
    advance();
  }
  out = std::move(value);
  return true;
}

} // namespace HexCrawl
