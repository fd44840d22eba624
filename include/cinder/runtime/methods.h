#pragma once

#include <cinder/runtime/value.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @file methods.h
 * @brief Native methods and attributes of builtin object types.
 */

namespace cinder::runtime
{

/** @brief Bound native method `self.name`, or nullopt when the type has none. */
[[nodiscard]] std::optional<Value> find_method(const Value& self, const std::string& name);

/** @brief Sorted names of every method available on `self`. */
[[nodiscard]] std::vector<std::string> method_names(const Value& self);

/** @brief Sort `items` in place with optional key function and reverse flag. */
void sort_values(Interpreter& interp, std::vector<Value>& items, const Value& key, bool reverse);

/** @brief `sep.join(iterable)` for str separators. */
[[nodiscard]] std::string join_strings(Interpreter& interp, const std::string& sep,
                                       const Value& iterable);

/** @brief `dict.update(source)`: merge a mapping or an iterable of key/value pairs into `table`. */
void update_dict(Interpreter& interp, HashTable& table, const Value& source);

} // namespace cinder::runtime
