#ifndef JTDV_CORE_JSON_DOM_HPP_
#define JTDV_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ios>
#include <istream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace jtdv::core::json {

// DOM shared by schema loading and instance validation. Objects are kept in a
// std::map so member iteration, and therefore error order, is deterministic.
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
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "boolean";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

// Arrays/objects nested deeper than this are rejected instead of recursing
// without bound on hostile input.
inline constexpr std::size_t kMaxNestingDepth = 1024;

// Pull parser over a byte stream.
//
// Reads one character at a time from the stream buffer, so only the document
// currently being parsed is held in memory. Back-to-back documents need no
// separator: each call to Next() stops right after the closing character of
// one value and the following call resumes from there.
//
// Diagnostics carry the byte offset plus line/column of the failing character.
// A stream buffer that throws std::ios_base::failure (std::filebuf does on a
// failed read) ends the parse with kReadError instead of propagating.
class StreamParser {
public:
  enum class Status {
    kValue,
    kEnd,
    kError,
    kReadError,
  };

  explicit StreamParser(std::istream& input) : buffer_(input.rdbuf()) {}

  // Parses the next top-level value. Leading whitespace is skipped; running
  // out of bytes before any value starts is a clean kEnd.
  //
  // A number or literal at the top level must be followed by whitespace, a
  // structural character, a quote or the end of input, so "truefalse" and
  // "1true" are errors rather than two documents each.
  Status Next(Value& value, std::string& error) {
    SkipWhitespace();
    if (AtEnd()) {
      return ReadFailed() ? ReadError(error) : Status::kEnd;
    }

    value = Value{};
    const bool parsed = ParseValue(value, 0, error) && CheckValueEnd(value, error);
    if (ReadFailed()) {
      return ReadError(error);
    }
    return parsed ? Status::kValue : Status::kError;
  }

  // True when nothing but whitespace remains.
  bool AtEndAfterWhitespace() {
    SkipWhitespace();
    return AtEnd();
  }

  bool ReadFailed() const {
    return !read_error_.empty();
  }

  Status ReadError(std::string& error) const {
    error = "read error at byte " + std::to_string(offset_) + ": " + read_error_;
    return Status::kReadError;
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at byte " + std::to_string(offset_) + " (line " + std::to_string(line_) +
            ", col " + std::to_string(col_) + "): " + std::string(message);
    return false;
  }

private:
  using Traits = std::istream::traits_type;

  static bool IsValueDelimiter(char c) {
    switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '"':
    case '[':
    case ']':
    case '{':
    case '}':
    case ',':
    case ':':
      return true;
    default:
      return false;
    }
  }

  bool CheckValueEnd(const Value& value, std::string& error) {
    if (value.type == Value::Type::kObject || value.type == Value::Type::kArray ||
        value.type == Value::Type::kString) {
      return true;
    }
    if (AtEnd() || IsValueDelimiter(Peek())) {
      return true;
    }
    return Fail("expected whitespace or a delimiter after value", error);
  }

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, depth + 1U, error);
    }
    if (c == '[') {
      return ParseArray(value, depth + 1U, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (c == 't') {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return ConsumeLiteral("true", error);
    }
    if (c == 'f') {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      return ConsumeLiteral("false", error);
    }
    if (c == 'n') {
      value.type = Value::Type::kNull;
      return ConsumeLiteral("null", error);
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxNestingDepth) {
      return Fail("maximum nesting depth exceeded", error);
    }

    value.type = Value::Type::kObject;
    Advance();
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      if (AtEnd() || Peek() != '"') {
        return Fail("expected '\"' to start object key", error);
      }
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
      if (!ParseValue(item, depth, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' or '}' after object entry", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxNestingDepth) {
      return Fail("maximum nesting depth exceeded", error);
    }

    value.type = Value::Type::kArray;
    Advance();
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' or ']' after array item", error)) {
        return false;
      }
    }

    return true;
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
      if (c == '\\') {
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
        continue;
      }

      const auto byte = static_cast<unsigned char>(c);
      if (byte < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
      if (byte >= 0x80U && !ConsumeUtf8Tail(byte, output, error)) {
        return false;
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Copies the continuation bytes of a multi-byte UTF-8 sequence whose lead
  // byte was `lead`. Overlong forms, surrogates and code points above
  // U+10FFFF are rejected.
  bool ConsumeUtf8Tail(unsigned char lead, std::string& output, std::string& error) {
    std::size_t tail = 0;
    unsigned char first_min = 0x80U;
    unsigned char first_max = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
      tail = 1;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
      tail = 2;
      if (lead == 0xE0U) {
        first_min = 0xA0U;
      } else if (lead == 0xEDU) {
        first_max = 0x9FU;
      }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
      tail = 3;
      if (lead == 0xF0U) {
        first_min = 0x90U;
      } else if (lead == 0xF4U) {
        first_max = 0x8FU;
      }
    } else {
      return Fail("invalid UTF-8 in string", error);
    }

    for (std::size_t i = 0; i < tail; ++i) {
      const unsigned char min = i == 0U ? first_min : 0x80U;
      const unsigned char max = i == 0U ? first_max : 0xBFU;
      if (AtEnd()) {
        return Fail("invalid UTF-8 in string", error);
      }
      const auto next = static_cast<unsigned char>(Peek());
      if (next < min || next > max) {
        return Fail("invalid UTF-8 in string", error);
      }
      output.push_back(Advance());
    }
    return true;
  }

  // Handles the XXXX part of \uXXXX, including a following low surrogate when
  // the first unit is a high surrogate. Appends the code point as UTF-8.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t unit = 0;
    if (!ParseHex4(unit, error)) {
      return false;
    }

    std::uint32_t code_point = unit;
    if (unit >= 0xD800U && unit <= 0xDBFFU) {
      if (!Match('\\') || !Match('u')) {
        return Fail("unpaired high surrogate in unicode escape", error);
      }
      std::uint32_t low = 0;
      if (!ParseHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in unicode escape", error);
      }
      code_point = 0x10000U + ((unit - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (unit >= 0xDC00U && unit <= 0xDFFFU) {
      return Fail("unpaired low surrogate in unicode escape", error);
    }

    AppendUtf8(output, code_point);
    return true;
  }

  bool ParseHex4(std::uint32_t& unit, std::string& error) {
    unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("unexpected end of input in unicode escape", error);
      }
      const char c = Peek();
      std::uint32_t digit = 0;
      if (c >= '0' && c <= '9') {
        digit = static_cast<std::uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        digit = static_cast<std::uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        digit = static_cast<std::uint32_t>(c - 'A' + 10);
      } else {
        return Fail("invalid hex digit in unicode escape", error);
      }
      Advance();
      unit = (unit << 4U) | digit;
    }
    return true;
  }

  static void AppendUtf8(std::string& output, std::uint32_t code_point) {
    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
  }

  bool ParseNumber(double& output, std::string& error) {
    std::string text;

    if (Match('-')) {
      text.push_back('-');
    }

    if (!AtEnd() && Peek() == '0') {
      text.push_back(Advance());
      if (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
        return Fail("leading zeros are not allowed in numbers", error);
      }
    } else if (!ConsumeDigits(text)) {
      return Fail("expected digits in number", error);
    }

    if (Match('.')) {
      text.push_back('.');
      if (!ConsumeDigits(text)) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (!AtEnd() && (Peek() == 'e' || Peek() == 'E')) {
      text.push_back(Advance());
      if (!AtEnd() && (Peek() == '+' || Peek() == '-')) {
        text.push_back(Advance());
      }
      if (!ConsumeDigits(text)) {
        return Fail("expected exponent digits", error);
      }
    }

    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      return Fail("invalid number token", error);
    }
    if (errno == ERANGE && std::isinf(parsed)) {
      return Fail("number out of range", error);
    }

    output = parsed;
    return true;
  }

  void SkipWhitespace() {
    // JSON whitespace only; std::isspace would also accept \v and \f.
    while (!AtEnd()) {
      const char c = Peek();
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        break;
      }
      Advance();
    }
  }

  bool ConsumeDigits(std::string& text) {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      text.push_back(Advance());
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeLiteral(std::string_view literal, std::string& error) {
    for (const char expected : literal) {
      if (AtEnd() || Peek() != expected) {
        return Fail("invalid literal, expected '" + std::string(literal) + "'", error);
      }
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

  bool AtEnd() {
    return Traits::eq_int_type(Current(), Traits::eof());
  }

  char Peek() {
    return Traits::to_char_type(Current());
  }

  Traits::int_type Current() {
    if (buffer_ == nullptr) {
      return Traits::eof();
    }
    try {
      return buffer_->sgetc();
    } catch (const std::ios_base::failure& e) {
      DropBuffer(e);
      return Traits::eof();
    }
  }

  void DropBuffer(const std::ios_base::failure& e) {
    read_error_ = e.what();
    if (read_error_.empty()) {
      read_error_ = "stream buffer failure";
    }
    buffer_ = nullptr;
  }

  // Only called after AtEnd() returned false, so the character is buffered.
  char Advance() {
    const char c = Traits::to_char_type(Current());
    if (buffer_ == nullptr) {
      return c;
    }
    try {
      buffer_->sbumpc();
    } catch (const std::ios_base::failure& e) {
      DropBuffer(e);
    }
    ++offset_;
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  std::streambuf* buffer_ = nullptr;
  std::size_t offset_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
  std::string read_error_;
};

// Parses exactly one JSON document from `input`; trailing non-whitespace
// content is an error.
//
// Returns kValue on success, kReadError when the stream buffer failed and
// kError for every syntax problem, empty input included. Never returns kEnd.
inline StreamParser::Status ParseDocument(std::istream& input, Value& root, std::string& error) {
  StreamParser parser(input);
  switch (parser.Next(root, error)) {
  case StreamParser::Status::kValue:
    break;
  case StreamParser::Status::kEnd:
    parser.Fail("unexpected end of input, expected a JSON document", error);
    return StreamParser::Status::kError;
  case StreamParser::Status::kError:
    return StreamParser::Status::kError;
  case StreamParser::Status::kReadError:
    return StreamParser::Status::kReadError;
  }

  const bool at_end = parser.AtEndAfterWhitespace();
  if (parser.ReadFailed()) {
    return parser.ReadError(error);
  }
  if (!at_end) {
    parser.Fail("unexpected trailing content after JSON value", error);
    return StreamParser::Status::kError;
  }
  return StreamParser::Status::kValue;
}

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  std::istringstream stream{std::string(input)};
  return ParseDocument(stream, root, error) == StreamParser::Status::kValue;
}

} // namespace jtdv::core::json

#endif // JTDV_CORE_JSON_DOM_HPP_
