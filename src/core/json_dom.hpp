#ifndef MODELPUSH_CORE_JSON_DOM_HPP_
#define MODELPUSH_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modelpush::core::json {

// Small STL-only DOM shared by config loading, checkpoint resume and registry
// response parsing. Object keys are ordered so serialized output is stable.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  static Value MakeObject() {
    Value value;
    value.type = Type::kObject;
    return value;
  }

  static Value MakeArray() {
    Value value;
    value.type = Type::kArray;
    return value;
  }

  static Value MakeString(std::string text) {
    Value value;
    value.type = Type::kString;
    value.string_value = std::move(text);
    return value;
  }

  static Value MakeNumber(double number) {
    Value value;
    value.type = Type::kNumber;
    value.number_value = number;
    return value;
  }

  static Value MakeBool(bool flag) {
    Value value;
    value.type = Type::kBool;
    value.bool_value = flag;
    return value;
  }

  bool IsObject() const {
    return type == Type::kObject;
  }
};

inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

namespace detail {

inline void SerializeNumber(double number, std::ostringstream& out) {
  if (!std::isfinite(number)) {
    out << "null";
    return;
  }
  // Integral values (sizes, counts, versions) print without a fraction.
  if (std::floor(number) == number && std::fabs(number) < 9.007199254740992e15) {
    out << static_cast<std::int64_t>(number);
    return;
  }
  std::ostringstream precise;
  precise << std::setprecision(17) << number;
  out << precise.str();
}

inline void SerializeInto(const Value& value, std::ostringstream& out) {
  switch (value.type) {
  case Value::Type::kObject: {
    out << '{';
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out << ',';
      }
      first = false;
      out << '"' << EscapeJson(key) << "\":";
      SerializeInto(item, out);
    }
    out << '}';
    return;
  }
  case Value::Type::kArray: {
    out << '[';
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i > 0U) {
        out << ',';
      }
      SerializeInto(value.array_value[i], out);
    }
    out << ']';
    return;
  }
  case Value::Type::kString:
    out << '"' << EscapeJson(value.string_value) << '"';
    return;
  case Value::Type::kNumber:
    SerializeNumber(value.number_value, out);
    return;
  case Value::Type::kBool:
    out << (value.bool_value ? "true" : "false");
    return;
  case Value::Type::kNull:
    out << "null";
    return;
  }
}

} // namespace detail

// Compact single-line serialization with sorted object keys.
inline std::string Serialize(const Value& value) {
  std::ostringstream out;
  detail::SerializeInto(value, out);
  return out.str();
}

// Parser with line/column diagnostics so a malformed config or an unexpected
// registry response is actionable without a debugger.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (ConsumeKeyword("true")) {
      value = Value::MakeBool(true);
      return true;
    }
    if (ConsumeKeyword("false")) {
      value = Value::MakeBool(false);
      return true;
    }
    if (ConsumeKeyword("null")) {
      value = Value{};
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value::MakeObject();
    Advance();
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value::MakeArray();
    Advance();
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }

      if (AtEnd()) {
        return Fail("unterminated escape sequence in string", error);
      }
      const char esc = Advance();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        output.push_back(esc);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u':
        if (!ParseUnicodeEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Basic-plane code points only; surrogate pairs are rejected.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char hex = Advance();
      code_point <<= 4U;
      if (hex >= '0' && hex <= '9') {
        code_point |= static_cast<std::uint32_t>(hex - '0');
      } else if (hex >= 'a' && hex <= 'f') {
        code_point |= static_cast<std::uint32_t>(hex - 'a' + 10);
      } else if (hex >= 'A' && hex <= 'F') {
        code_point |= static_cast<std::uint32_t>(hex - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;
    (void)Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        (void)Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
      return Fail("invalid numeric value '" + text + "'", error);
    }
    output = parsed;
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeKeyword(std::string_view keyword) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

inline const Value* FindField(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

inline bool TryGetString(const Value& object, std::string_view key, std::string& value) {
  const Value* field = FindField(object, key);
  if (field == nullptr || field->type != Value::Type::kString) {
    return false;
  }
  value = field->string_value;
  return true;
}

inline bool IsNonNegativeInteger(const Value& value) {
  if (value.type != Value::Type::kNumber) {
    return false;
  }
  const double number = value.number_value;
  return std::isfinite(number) && number >= 0.0 && std::floor(number) == number &&
         number <= static_cast<double>(std::numeric_limits<std::uint64_t>::max());
}

inline bool TryGetUnsigned(const Value& object, std::string_view key, std::uint64_t& value) {
  const Value* field = FindField(object, key);
  if (field == nullptr || !IsNonNegativeInteger(*field)) {
    return false;
  }
  value = static_cast<std::uint64_t>(field->number_value);
  return true;
}

} // namespace modelpush::core::json

#endif // MODELPUSH_CORE_JSON_DOM_HPP_
