#pragma once

#include <array>
#include <string_view>

/**
 * @file denylist.h
 * @brief Static, process-wide policy sets consulted by the checker and the namespace builder.
 */

namespace cinder::policy
{

/** @brief Modules whose import is rejected before execution (matched on the first component). */
inline constexpr std::array<std::string_view, 14> kBlockedModules = {
    "os",     "sys",      "subprocess", "shutil", "socket",          "requests",  "urllib",
    "ftplib", "telnetlib", "poplib",    "smtplib", "ctypes", "multiprocessing", "threading",
};

/** @brief Names that may not be called directly, and are never persisted as session state. */
inline constexpr std::array<std::string_view, 15> kBlockedCallables = {
    "exec",      "eval",  "compile", "open",       "file",    "subprocess", "ctypes", "importlib",
    "input",     "__import__", "globals", "locals", "dir",    "getattr",    "setattr",
};

/** @brief Builtins removed from every execution namespace. */
inline constexpr std::array<std::string_view, 9> kStrippedBuiltins = {
    "globals", "locals", "dir", "vars", "getattr", "setattr", "delattr", "hasattr", "__import__",
};

[[nodiscard]] bool is_blocked_module(std::string_view dotted_name);
[[nodiscard]] bool is_blocked_callable(std::string_view name);
[[nodiscard]] bool is_stripped_builtin(std::string_view name);

} // namespace cinder::policy
