#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace atlas {

// Small JSON document model used for the config file and CLI reports.
//
//  - Strict input: no comments, no trailing commas, UTF-8 text.
//  - Numbers are doubles.
//  - Object members keep their input order (duplicate keys: first one wins on lookup).
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull() { return JsonValue(); }
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Object/array builders. No-ops on the wrong type.
  JsonValue& set(std::string key, JsonValue v);
  JsonValue& push(JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Contents of a JSON string literal, without the quotes.
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
  bool sortKeys = false;
};

// Non-finite numbers are written as null.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = JsonWriteOptions());

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt = JsonWriteOptions());

bool ReadTextFile(const std::string& path, std::string& outText, std::string& outError);

} // namespace atlas
