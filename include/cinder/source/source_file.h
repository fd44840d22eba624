#pragma once

#include <istream>
#include <string>
#include <variant>

/**
 * @file source_file.h
 * @brief Script buffers and loaders.
 */

namespace cinder::source
{

/** @brief Name reported for scripts submitted as strings (tool calls). */
inline constexpr const char* kStringSourceName = "<string>";

/** @brief A script and the name used when reporting positions inside it. */
struct SourceFile
{
    std::string path;     /**< File path, or `<string>` for submitted code. */
    std::string contents; /**< Raw script text. */
};

/** @brief Error returned when a script cannot be loaded. */
struct LoadError
{
    std::string message;
};

using LoadResult = std::variant<SourceFile, LoadError>;

/** @brief Wrap submitted code in a SourceFile named `<string>`. */
[[nodiscard]] SourceFile from_string(std::string code);

/** @brief Load the file at `path` into a SourceFile or return a LoadError. */
[[nodiscard]] LoadResult load_source_file(const std::string& path);

/** @brief Load a script from the provided input stream; `path` is used for diagnostics. */
[[nodiscard]] LoadResult load_source_stream(std::istream& in, const std::string& path);

} // namespace cinder::source
