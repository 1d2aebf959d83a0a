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

namespace PhantomMaze {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}
} // namespace

// JsonValue implementation
JsonType JsonValue::getType() const {
  if (isBool())
    return JsonType::Boolean;
  if (isNumber())
    return JsonType::Number;
  if (isString())
    return JsonType::String;
  if (isArray())
    return JsonType::Array;
  if (isObject())
    return JsonType::Object;
  return JsonType::Null;
}

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
  if (!isObject())
    return false;
  const auto &obj = asObject();
  return obj.find(key) != obj.end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : nullValue();
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
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = std::format("Could not open file: {}", path);
    m_root = JsonValue();
    return false;
  }

  std::stringstream buffer;
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

  skipWhitespace();
  auto value = parseValue();
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(*value);
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
  while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError =
        std::format("{} at line {}, column {}", message, m_line, m_column);
  }
}

std::optional<JsonValue> JsonReader::parseValue() {
  switch (peek()) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"': {
    auto str = parseString();
    if (!str) {
      return std::nullopt;
    }
    return JsonValue(std::move(*str));
  }
  case 't':
    if (parseLiteral("true"))
      return JsonValue(true);
    return std::nullopt;
  case 'f':
    if (parseLiteral("false"))
      return JsonValue(false);
    return std::nullopt;
  case 'n':
    if (parseLiteral("null"))
      return JsonValue();
    return std::nullopt;
  case '\0':
    setError("Unexpected end of input");
    return std::nullopt;
  default:
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
      return parseNumber();
    }
    setError(std::format("Unexpected character '{}'", peek()));
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject() {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key) {
      return std::nullopt;
    }

    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key");
      return std::nullopt;
    }

    skipWhitespace();
    auto value = parseValue();
    if (!value) {
      return std::nullopt;
    }
    object[*key] = std::move(*value);

    skipWhitespace();
    char c = advance();
    if (c == '}') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray() {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    skipWhitespace();
    auto value = parseValue();
    if (!value) {
      return std::nullopt;
    }
    array.push_back(std::move(*value));

    skipWhitespace();
    char c = advance();
    if (c == ']') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(array));
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (true) {
    if (atEnd()) {
      setError("Unterminated string");
      return std::nullopt;
    }
    char c = advance();
    if (c == '"') {
      break;
    }
    if (c != '\\') {
      result.push_back(c);
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result.push_back(escaped);
      break;
    case 'b':
      result.push_back('\b');
      break;
    case 'f':
      result.push_back('\f');
      break;
    case 'n':
      result.push_back('\n');
      break;
    case 'r':
      result.push_back('\r');
      break;
    case 't':
      result.push_back('\t');
      break;
    default:
      // \u escapes never appear in game data files
      setError(std::format("Unsupported escape sequence '\\{}'", escaped));
      return std::nullopt;
    }
  }

  return result;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;
  if (peek() == '-') {
    advance();
  }
  while (!atEnd()) {
    char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' ||
        c == 'E' || c == '+' || c == '-') {
      advance();
    } else {
      break;
    }
  }

  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    setError(std::format("Invalid number '{}'",
                         m_input.substr(start, m_position - start)));
    return std::nullopt;
  }
  return JsonValue(value);
}

bool JsonReader::parseLiteral(const char *literal) {
  const size_t length = std::strlen(literal);
  if (m_input.compare(m_position, length, literal) != 0) {
    setError(std::format("Invalid literal, expected '{}'", literal));
    return false;
  }
  for (size_t i = 0; i < length; ++i) {
    advance();
  }
  return true;
}

} // namespace PhantomMaze
