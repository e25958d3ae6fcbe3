#ifndef PERMITPACK_CORE_JSON_DOM_HPP_
#define PERMITPACK_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::core::json {

// Minimal DOM for project files, structured narratives, config and the
// preference store. STL-only; one parser shared by every loader.
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

namespace detail {

// Nesting beyond this is rejected instead of recursing without bound on a
// hostile project file.
inline constexpr int kMaxNestingDepth = 64;

struct Cursor {
  std::string_view text;
  std::size_t pos = 0;
  std::size_t line = 1;
  std::size_t column = 1;

  bool AtEnd() const {
    return pos >= text.size();
  }

  char Peek() const {
    return text[pos];
  }

  char Next() {
    const char c = text[pos++];
    if (c == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
    return c;
  }

  bool Accept(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Next();
    return true;
  }

  bool AcceptWord(std::string_view word) {
    if (text.substr(pos, word.size()) != word) {
      return false;
    }
    for (std::size_t i = 0; i < word.size(); ++i) {
      Next();
    }
    return true;
  }

  void SkipSpace() {
    while (!AtEnd()) {
      const char c = Peek();
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        return;
      }
      Next();
    }
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Next();
      ++count;
    }
    return count;
  }

  // Parse errors carry line/column so a malformed project file points the
  // operator at the offending spot.
  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line) + ", col " + std::to_string(column) +
            ": " + std::string(message);
    return false;
  }
};

inline void AppendUtf8(std::uint32_t code_point, std::string& out) {
  if (code_point < 0x80U) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  }
}

// Basic-multilingual-plane escapes only; document names and narrative text
// exported by the upload layer never carry surrogate pairs.
inline bool ReadHexEscape(Cursor& in, std::string& out, std::string& error) {
  std::uint32_t code_point = 0;
  for (int i = 0; i < 4; ++i) {
    if (in.AtEnd()) {
      return in.Fail("truncated \\u escape", error);
    }
    const char h = in.Next();
    int digit = -1;
    if (h >= '0' && h <= '9') {
      digit = h - '0';
    } else if (h >= 'a' && h <= 'f') {
      digit = h - 'a' + 10;
    } else if (h >= 'A' && h <= 'F') {
      digit = h - 'A' + 10;
    }
    if (digit < 0) {
      return in.Fail("invalid hex digit in \\u escape", error);
    }
    code_point = (code_point << 4U) | static_cast<std::uint32_t>(digit);
  }
  if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
    return in.Fail("surrogate \\u escapes are not supported", error);
  }
  AppendUtf8(code_point, out);
  return true;
}

inline bool ReadStringToken(Cursor& in, std::string& out, std::string& error) {
  out.clear();
  if (!in.Accept('"')) {
    return in.Fail("expected '\"' to start string", error);
  }
  while (!in.AtEnd()) {
    const char c = in.Next();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20U) {
      return in.Fail("control character in string is not allowed", error);
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (in.AtEnd()) {
      break;
    }
    const char escape = in.Next();
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
    case 'u':
      if (!ReadHexEscape(in, out, error)) {
        return false;
      }
      break;
    default:
      return in.Fail("invalid escape sequence in string", error);
    }
  }
  return in.Fail("unterminated string literal", error);
}

inline bool ReadNumber(Cursor& in, double& out, std::string& error) {
  const std::size_t start = in.pos;
  (void)in.Accept('-');
  if (!in.Accept('0') && in.SkipDigits() == 0U) {
    return in.Fail("expected digits in number", error);
  }
  if (in.Accept('.') && in.SkipDigits() == 0U) {
    return in.Fail("expected digits after decimal point", error);
  }
  if (in.Accept('e') || in.Accept('E')) {
    if (!in.Accept('+')) {
      (void)in.Accept('-');
    }
    if (in.SkipDigits() == 0U) {
      return in.Fail("expected exponent digits", error);
    }
  }

  const std::string literal(in.text.substr(start, in.pos - start));
  char* end = nullptr;
  out = std::strtod(literal.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(out)) {
    return in.Fail("invalid numeric value", error);
  }
  return true;
}

inline bool ReadValue(Cursor& in, Value& value, int depth, std::string& error);

// Shared loop for objects and arrays: `read_item` consumes one member or
// element, separators and the closing bracket are handled here.
template <typename ReadItem>
bool ReadSequence(Cursor& in, char close, std::string_view separator_message,
                  ReadItem&& read_item, std::string& error) {
  in.SkipSpace();
  if (in.Accept(close)) {
    return true;
  }
  while (true) {
    in.SkipSpace();
    if (!read_item()) {
      return false;
    }
    in.SkipSpace();
    if (in.Accept(close)) {
      return true;
    }
    if (!in.Accept(',')) {
      return in.Fail(separator_message, error);
    }
  }
}

inline bool ReadValue(Cursor& in, Value& value, int depth, std::string& error) {
  value = Value{};
  if (in.AtEnd()) {
    return in.Fail("unexpected end of input while parsing value", error);
  }
  if (depth > kMaxNestingDepth) {
    return in.Fail("nesting too deep", error);
  }

  const char c = in.Peek();
  if (c == '{') {
    in.Next();
    value.type = Value::Type::kObject;
    return ReadSequence(
        in, '}', "expected ',' between object entries",
        [&]() {
          std::string key;
          if (!ReadStringToken(in, key, error)) {
            return false;
          }
          in.SkipSpace();
          if (!in.Accept(':')) {
            return in.Fail("expected ':' after object key", error);
          }
          in.SkipSpace();
          return ReadValue(in, value.object_value[key], depth + 1, error);
        },
        error);
  }
  if (c == '[') {
    in.Next();
    value.type = Value::Type::kArray;
    return ReadSequence(
        in, ']', "expected ',' between array items",
        [&]() {
          value.array_value.emplace_back();
          return ReadValue(in, value.array_value.back(), depth + 1, error);
        },
        error);
  }
  if (c == '"') {
    value.type = Value::Type::kString;
    return ReadStringToken(in, value.string_value, error);
  }
  if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
    value.type = Value::Type::kNumber;
    return ReadNumber(in, value.number_value, error);
  }
  if (in.AcceptWord("true")) {
    value.type = Value::Type::kBool;
    value.bool_value = true;
    return true;
  }
  if (in.AcceptWord("false")) {
    value.type = Value::Type::kBool;
    return true;
  }
  if (in.AcceptWord("null")) {
    return true;
  }
  return in.Fail("expected JSON value", error);
}

} // namespace detail

// Parses one complete JSON document. Trailing non-whitespace is an error.
inline bool Parse(std::string_view input, Value& root, std::string& error) {
  detail::Cursor in{input};
  in.SkipSpace();
  if (!detail::ReadValue(in, root, 0, error)) {
    return false;
  }
  in.SkipSpace();
  if (!in.AtEnd()) {
    return in.Fail("unexpected trailing content after JSON value", error);
  }
  return true;
}

// Lookup helpers. They never fail hard: a missing or mistyped member is
// reported as "absent" and the caller decides whether that is an issue.
inline const Value* FindMember(const Value& object_value, std::string_view key) {
  if (object_value.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object_value.object_value.find(std::string(key));
  if (it == object_value.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

inline std::optional<std::string> ReadString(const Value& object_value, std::string_view key) {
  const Value* member = FindMember(object_value, key);
  if (member == nullptr || member->type != Value::Type::kString) {
    return std::nullopt;
  }
  return member->string_value;
}

inline std::optional<bool> ReadBool(const Value& object_value, std::string_view key) {
  const Value* member = FindMember(object_value, key);
  if (member == nullptr || member->type != Value::Type::kBool) {
    return std::nullopt;
  }
  return member->bool_value;
}

inline std::optional<std::int64_t> ReadInteger(const Value& object_value, std::string_view key) {
  const Value* member = FindMember(object_value, key);
  if (member == nullptr || member->type != Value::Type::kNumber) {
    return std::nullopt;
  }
  const double floored = std::floor(member->number_value);
  if (floored != member->number_value ||
      std::fabs(floored) > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(floored);
}

} // namespace permitpack::core::json

#endif // PERMITPACK_CORE_JSON_DOM_HPP_
