#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file json.h
 * @brief Minimal JSON value, parser and serializer shared by the result normalizer, the tool
 * server and the `json` script module.
 *
 * Objects keep insertion order so serialized results are deterministic.
 */

namespace cinder::json
{

struct Json
{
    using Object = std::vector<std::pair<std::string, Json>>;
    using Array = std::vector<Json>;

    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Object, Array> value;

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
    [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(value); }
    [[nodiscard]] bool is_int() const { return std::holds_alternative<std::int64_t>(value); }
    [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(value); }
    [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(value); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(value); }
    [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(value); }

    [[nodiscard]] const Object* as_object() const { return std::get_if<Object>(&value); }
    [[nodiscard]] Object* as_object() { return std::get_if<Object>(&value); }
    [[nodiscard]] const Array* as_array() const { return std::get_if<Array>(&value); }
    [[nodiscard]] const std::string* as_string() const { return std::get_if<std::string>(&value); }
    [[nodiscard]] const bool* as_bool() const { return std::get_if<bool>(&value); }

    /** @brief Numeric value as double (ints are widened); nullopt for non-numbers. */
    [[nodiscard]] std::optional<double> as_number() const;

    /** @brief Member lookup on objects; null for missing keys and non-objects. */
    [[nodiscard]] const Json* find(std::string_view key) const;

    /** @brief Insert or replace a member; converts a null value into an empty object first. */
    void set(std::string key, Json member);
};

/** @brief Build an empty JSON object. */
[[nodiscard]] Json make_object();

/** @brief Parse a complete JSON document; nullopt on any syntax error or trailing data. */
[[nodiscard]] std::optional<Json> parse(std::string_view input);

/** @brief Why and where a document failed to parse. */
struct ParseError
{
    std::string message; /**< "Expecting value" or "Extra data". */
    std::size_t offset = 0;
};

/** @brief Parse a complete JSON document, reporting the failure position on error. */
[[nodiscard]] std::variant<Json, ParseError> parse_document(std::string_view input);

/** @brief Serialize compactly (no whitespace). Non-finite doubles serialize as null. */
[[nodiscard]] std::string serialize(const Json& value);

/**
 * @brief Serialize the way scripts expect from `json.dumps`: `", "` and `": "` separators on
 * one line, or one member per line with `indent` spaces per level when an indent is given.
 */
[[nodiscard]] std::string serialize_pretty(const Json& value, std::optional<int> indent);

/** @brief Escape a string for inclusion between JSON double quotes. */
[[nodiscard]] std::string escape(std::string_view input);

/** @brief Shortest decimal text that round-trips `value`, always containing `.` or `e`. */
[[nodiscard]] std::string format_double(double value);

[[nodiscard]] std::optional<std::string> get_string(const Json& obj, std::string_view key);
[[nodiscard]] std::optional<double> get_number(const Json& obj, std::string_view key);
[[nodiscard]] std::optional<Json> get_object(const Json& obj, std::string_view key);
[[nodiscard]] std::optional<Json> get_array(const Json& obj, std::string_view key);

} // namespace cinder::json
