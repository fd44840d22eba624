#pragma once

#include <cinder/source/span.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @file diagnostic.h
 * @brief Diagnostics (errors, warnings and notes) produced by the script front end and the
 * policy checker.
 */

namespace cinder::diag
{

/** @brief Severity level for a diagnostic. */
enum class Severity
{
    Error,
    Warning,
    Note,
};

/** @brief Additional related message attached to a diagnostic, with optional span. */
struct Related
{
    std::string message;
    std::optional<cinder::source::Span> span;
};

/**
 * @brief A diagnostic message with optional source span and related notes.
 */
struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string message;
    std::optional<cinder::source::Span> span;
    std::vector<Related> notes;
};

/** @brief Build an error diagnostic at `span`. */
[[nodiscard]] inline Diagnostic error_at(cinder::source::Span span, std::string message)
{
    return Diagnostic{
        .severity = Severity::Error, .message = std::move(message), .span = span, .notes = {}};
}

} // namespace cinder::diag
