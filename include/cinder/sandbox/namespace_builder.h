#pragma once

#include <cinder/runtime/interpreter.h>
#include <cinder/sandbox/result.h>
#include <memory>

/**
 * @file namespace_builder.h
 * @brief Builds the module namespace each run executes in.
 */

namespace cinder::sandbox
{

/** @brief The full builtin table minus the stripped reflection builtins; built once per process. */
[[nodiscard]] std::shared_ptr<const cinder::runtime::Builtins> sandbox_builtins();

/**
 * @brief Fresh module scope holding `__name__ = "__main__"` and the session's persisted bindings.
 *
 * Values are shared with `state`, not copied.
 */
[[nodiscard]] cinder::runtime::EnvPtr build_namespace(const PersistedState& state);

/** @brief Whether a top-level binding named `name` may be carried into the next request. */
[[nodiscard]] bool is_persistable(std::string_view name);

/** @brief Persistable bindings of `globals`. */
[[nodiscard]] PersistedState capture_bindings(const cinder::runtime::Environment& globals);

} // namespace cinder::sandbox
