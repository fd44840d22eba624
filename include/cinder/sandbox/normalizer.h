#pragma once

#include <cinder/json/json.h>
#include <cinder/runtime/value.h>
#include <cinder/sandbox/result.h>
#include <string>

/**
 * @file normalizer.h
 * @brief Conversion of script values and execution results to JSON.
 */

namespace cinder::sandbox
{

/**
 * @brief Total conversion of a script value to JSON.
 *
 * Sets, tuples, ranges and numeric arrays become arrays, complex numbers `[real, imag]`,
 * dicts objects with string keys, bytes their UTF-8 text (or `<binary data: N bytes>`), and
 * non-finite floats their text. Everything else becomes its repr, as do containers that are
 * cyclic or nested more than 200 levels deep.
 */
[[nodiscard]] cinder::json::Json normalize(const cinder::runtime::Value& value);

/** @brief `{"success", "output", "error", "result"}` in that order. */
[[nodiscard]] cinder::json::Json normalize_result(const ExecutionResult& result);

[[nodiscard]] std::string serialize_result(const ExecutionResult& result);

} // namespace cinder::sandbox
