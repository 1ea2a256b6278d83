/// @file
/// @brief Print option strings and the flat-object JSON loader.

#include "core/print_options.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>

#include "core/errors.h"

namespace pitchtypes {

namespace {

constexpr const char* kJsonGrammar = "a flat JSON object, e.g. {\"accidentals\": \"flat\"}";

/// @brief A single flat JSON value (string, number, boolean or null).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
};

/// @brief Cursor over the JSON text; every scan error throws ParseError.
class FlatJsonReader {
 public:
  explicit FlatJsonReader(const std::string& json) : json_(json) {}

  std::map<std::string, JsonValue> readObject() {
    std::map<std::string, JsonValue> result;
    skipWhitespace();
    expect('{');
    skipWhitespace();
    if (peek() == '}') {
      ++pos_;
      finish();
      return result;
    }
    while (true) {
      skipWhitespace();
      std::string key = readString();
      skipWhitespace();
      expect(':');
      skipWhitespace();
      if (peek() == '{' || peek() == '[') {
        skipNested();
      } else {
        result[key] = readValue();
      }
      skipWhitespace();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      expect('}');
      break;
    }
    finish();
    return result;
  }

 private:
  char peek() const { return pos_ < json_.size() ? json_[pos_] : '\0'; }

  [[noreturn]] void fail() const { throw ParseError(json_, kJsonGrammar); }

  void expect(char chr) {
    if (peek() != chr) fail();
    ++pos_;
  }

  void skipWhitespace() {
    while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  void finish() {
    skipWhitespace();
    if (pos_ != json_.size()) fail();
  }

  std::string readString() {
    expect('"');
    std::string result;
    while (pos_ < json_.size() && json_[pos_] != '"') {
      if (json_[pos_] == '\\' && pos_ + 1 < json_.size()) {
        ++pos_;
        switch (json_[pos_]) {
          case 'n':  result += '\n'; break;
          case 't':  result += '\t'; break;
          case 'r':  result += '\r'; break;
          default:   result += json_[pos_]; break;
        }
      } else {
        result += json_[pos_];
      }
      ++pos_;
    }
    expect('"');
    return result;
  }

  bool matchLiteral(const char* literal) {
    std::string lit(literal);
    if (json_.compare(pos_, lit.size(), lit) != 0) return false;
    pos_ += lit.size();
    return true;
  }

  JsonValue readValue() {
    JsonValue val;
    if (peek() == '"') {
      val.type = JsonValue::String;
      val.string_val = readString();
    } else if (matchLiteral("true")) {
      val.type = JsonValue::Bool;
      val.bool_val = true;
    } else if (matchLiteral("false")) {
      val.type = JsonValue::Bool;
      val.bool_val = false;
    } else if (matchLiteral("null")) {
      val.type = JsonValue::Null;
    } else {
      val.type = JsonValue::Number;
      val.number_val = readNumber();
    }
    return val;
  }

  double readNumber() {
    size_t start = pos_;
    if (peek() == '-') ++pos_;
    size_t digits_start = pos_;
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    if (pos_ == digits_start) fail();
    if (peek() == '.') {
      ++pos_;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      size_t exp_start = pos_;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
      if (pos_ == exp_start) fail();
    }
    std::string text = json_.substr(start, pos_ - start);
    errno = 0;
    double value = std::strtod(text.c_str(), nullptr);
    if (errno == ERANGE) fail();
    return value;
  }

  /// Skip a nested object or array (values we don't interpret).
  void skipNested() {
    char open = peek();
    char close = (open == '{') ? '}' : ']';
    int depth = 0;
    while (pos_ < json_.size()) {
      if (json_[pos_] == '"') {
        readString();
        continue;
      }
      if (json_[pos_] == open) ++depth;
      if (json_[pos_] == close && --depth == 0) {
        ++pos_;
        return;
      }
      ++pos_;
    }
    fail();
  }

  const std::string& json_;
  size_t pos_ = 0;
};

}  // namespace

const char* accidentalStyleToString(AccidentalStyle style) {
  switch (style) {
    case AccidentalStyle::Sharp: return "sharp";
    case AccidentalStyle::Flat:  return "flat";
  }
  return "sharp";
}

AccidentalStyle accidentalStyleFromString(const std::string& str) {
  if (str == "sharp") return AccidentalStyle::Sharp;
  if (str == "flat") return AccidentalStyle::Flat;
  throw DomainError("accidental style must be one of 'sharp', 'flat', got '" + str + "'");
}

PrintOptions printOptionsFromJson(const std::string& json) {
  PrintOptions opts;
  FlatJsonReader reader(json);
  for (const auto& entry : reader.readObject()) {
    const std::string& key = entry.first;
    const JsonValue& val = entry.second;
    if (key == "enharmonic_as_int") {
      if (val.type != JsonValue::Bool) {
        throw DomainError("print option 'enharmonic_as_int' must be a boolean");
      }
      opts.enharmonic_as_int = val.bool_val;
    } else if (key == "accidentals") {
      if (val.type != JsonValue::String) {
        throw DomainError("print option 'accidentals' must be a string");
      }
      opts.accidentals = accidentalStyleFromString(val.string_val);
    } else if (key == "logfreq_precision") {
      if (val.type != JsonValue::Number || std::floor(val.number_val) != val.number_val ||
          val.number_val < 0 || val.number_val > kMaxLogFreqPrecision) {
        throw DomainError("print option 'logfreq_precision' must be an integer in 0.." +
                          std::to_string(kMaxLogFreqPrecision));
      }
      opts.logfreq_precision = static_cast<int>(val.number_val);
    } else {
      std::fprintf(stderr, "[PrintOptions] WARNING: ignoring unknown key '%s'\n", key.c_str());
    }
  }
  return opts;
}

}  // namespace pitchtypes
