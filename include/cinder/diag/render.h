#pragma once

#include <cinder/diag/diagnostic.h>
#include <cinder/source/source_file.h>
#include <string>
#include <vector>

namespace cinder::diag
{

/** @brief Render a diagnostic as `path:line:col: severity: message` plus a caret excerpt. */
[[nodiscard]] std::string render(const Diagnostic& diagnostic,
                                 const cinder::source::SourceFile& file);

/** @brief Render several diagnostics back to back. */
[[nodiscard]] std::string render_all(const std::vector<Diagnostic>& diagnostics,
                                     const cinder::source::SourceFile& file);

/** @brief One-line summary used inside execution results: `message (line N)`. */
[[nodiscard]] std::string summarize(const Diagnostic& diagnostic,
                                    const cinder::source::SourceFile& file);

} // namespace cinder::diag
