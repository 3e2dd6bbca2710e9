#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sessionflow::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (\uXXXX is decoded to UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object. String values are unescaped; objects,
/// arrays, numbers and literals are kept as raw JSON text.
using JsonObject = std::unordered_map<std::string, std::string>;
[[nodiscard]] std::optional<JsonObject> json_parse_object(const std::string &json);

[[nodiscard]] std::string json_member_string(const JsonObject &object, const std::string &key,
                                             const std::string &fallback = "");
[[nodiscard]] std::optional<std::uint64_t> json_member_u64(const JsonObject &object,
                                                           const std::string &key);
[[nodiscard]] std::optional<bool> json_member_bool(const JsonObject &object,
                                                   const std::string &key);
/// Nested object member, parsed. Missing or null members yield nullopt.
[[nodiscard]] std::optional<JsonObject> json_member_object(const JsonObject &object,
                                                           const std::string &key);

/// Extract string elements from a raw JSON array like ["a","b"].
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Incremental writer producing two-space indented JSON.
class JsonWriter {
public:
  JsonWriter &begin_object();
  JsonWriter &end_object();
  JsonWriter &begin_array();
  JsonWriter &end_array();
  JsonWriter &key(const std::string &name);

  JsonWriter &value(const std::string &text);
  JsonWriter &value(const char *text);
  JsonWriter &value(std::uint64_t number);
  JsonWriter &value(bool flag);
  JsonWriter &null();

  JsonWriter &field(const std::string &name, const std::string &text) {
    return key(name).value(text);
  }
  JsonWriter &field(const std::string &name, const char *text) { return key(name).value(text); }
  JsonWriter &field(const std::string &name, std::uint64_t number) {
    return key(name).value(number);
  }
  JsonWriter &field(const std::string &name, bool flag) { return key(name).value(flag); }
  JsonWriter &field(const std::string &name, const std::optional<std::uint64_t> &number);

  [[nodiscard]] const std::string &str() const { return out_; }

private:
  void before_value();
  void newline();

  struct Frame {
    bool is_array = false;
    bool empty = true;
  };

  std::string out_;
  std::vector<Frame> stack_;
  bool after_key_ = false;
};

} // namespace sessionflow::common
