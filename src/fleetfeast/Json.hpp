#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace fleetfeast {

// Minimal JSON value representation, parser and streaming writer.
//
// Used for the city config file, action submissions, decision-maker replies and every
// snapshot the server publishes.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects are stored as an ordered list of key/value pairs.
//  - Nesting depth is capped (kMaxJsonDepth) since request bodies are untrusted.
//
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

  static JsonValue MakeNull();
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

  // Object helper: appends (does not replace) a member.
  void add(std::string key, JsonValue v);
};

constexpr int kMaxJsonDepth = 64;

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

// Convenience lookups: return false if the key is missing or has the wrong type.
bool GetJsonString(const JsonValue& obj, const std::string& key, std::string& out);
bool GetJsonNumber(const JsonValue& obj, const std::string& key, double& out);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape a string to be used inside a JSON string literal (without surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  // Pretty-print with newlines + indentation.
  bool pretty = false;

  // Spaces per indentation level when pretty-printing.
  int indent = 2;
};

// Serialize a JsonValue to a string. Non-finite numbers are written as null.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

// -----------------------------------------------------------------------------------------------
// JsonWriter
//
// Streaming writer used for snapshots and HTTP responses. Callers control key order.
// On misuse the writer stores an error message and subsequent calls return false.
// -----------------------------------------------------------------------------------------------
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  // Object member key (must be inside an object).
  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool stringValue(const std::string& s);

  // Serialize a JsonValue subtree in the current context.
  bool value(const JsonValue& v);

private:
  struct Frame {
    enum class Kind : std::uint8_t {
      Object,
      Array,
    };

    Kind kind = Kind::Object;
    bool first = true;
    bool expectingKey = true;
  };

  bool setError(std::string msg);
  void newline(std::size_t depth);

  // Handles commas + indentation before a value in the current context.
  bool prepareValue();
  void finishValue();

  bool beginContainer(Frame::Kind kind, char openChar);
  bool endContainer(Frame::Kind kind, char closeChar);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace fleetfeast
