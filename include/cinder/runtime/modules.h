#pragma once

#include <cinder/runtime/value.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file modules.h
 * @brief Native modules scripts may import.
 *
 * There is no module search path: an import either names one of these modules or fails with
 * ModuleNotFoundError.
 */

namespace cinder::runtime
{

/** @brief Names of every importable module. */
[[nodiscard]] const std::vector<std::string>& native_module_names();

/** @brief Fresh instance of a native module; null when no module has that name. */
[[nodiscard]] std::shared_ptr<ModuleObject> load_native_module(std::string_view name);

/** @brief Add a native function member to `module`. */
void define(ModuleObject& module, const std::string& name, NativeFunction fn);

[[nodiscard]] std::shared_ptr<ModuleObject> make_math_module();
[[nodiscard]] std::shared_ptr<ModuleObject> make_cmath_module();
[[nodiscard]] std::shared_ptr<ModuleObject> make_random_module();
[[nodiscard]] std::shared_ptr<ModuleObject> make_time_module();
[[nodiscard]] std::shared_ptr<ModuleObject> make_json_module();
[[nodiscard]] std::shared_ptr<ModuleObject> make_statistics_module();
[[nodiscard]] std::shared_ptr<ModuleObject> make_array_module();
[[nodiscard]] std::shared_ptr<ModuleObject> make_string_module();

} // namespace cinder::runtime
