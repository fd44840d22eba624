#include <algorithm>
#include <cinder/diag/render.h>
#include <cinder/source/line_map.h>
#include <cstddef>
#include <sstream>
#include <string_view>

namespace cinder::diag
{
namespace
{

constexpr std::string_view severity_string(Severity s)
{
    switch (s)
    {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Note:
        return "note";
    }
    return "error";
}

std::size_t clamp(std::size_t value, std::size_t low, std::size_t high)
{
    return std::min(std::max(value, low), high);
}

} // namespace

std::string render(const Diagnostic& diagnostic, const cinder::source::SourceFile& file)
{
    std::ostringstream out;

    if (!diagnostic.span.has_value())
    {
        out << file.path << ": " << severity_string(diagnostic.severity) << ": "
            << diagnostic.message << "\n";
        for (const auto& note : diagnostic.notes)
        {
            out << "note: " << note.message << "\n";
        }
        return out.str();
    }

    const auto span = *diagnostic.span;
    const std::string_view text = file.contents;
    const cinder::source::LineMap map(text);

    const auto lc = map.offset_to_line_col(span.start);
    out << file.path << ":" << lc.line << ":" << lc.col << ": "
        << severity_string(diagnostic.severity) << ": " << diagnostic.message << "\n";

    const std::string_view line_text = map.line_text(text, lc.line);
    out << "  |\n";
    out << "  | " << line_text << "\n";

    const std::size_t line_len = line_text.size();
    const std::size_t caret_start = lc.col - 1;
    const std::size_t line_end = map.line_start_offset(lc.line) + line_len;

    // If the span crosses lines, highlight only the first line.
    std::size_t caret_len = 1;
    if (span.end > span.start && span.end <= line_end)
    {
        caret_len = span.end - span.start;
    }
    else if (span.end > line_end && line_end > span.start)
    {
        caret_len = line_end - span.start;
    }

    const std::size_t safe_caret_start = clamp(caret_start, 0, line_len);
    const std::size_t remaining = (safe_caret_start <= line_len) ? (line_len - safe_caret_start) : 0;
    const std::size_t safe_caret_len = clamp(caret_len, 1, std::max<std::size_t>(1, remaining));

    out << "  | " << std::string(safe_caret_start, ' ') << std::string(safe_caret_len, '^')
        << "\n";

    for (const auto& note : diagnostic.notes)
    {
        if (note.span.has_value())
        {
            const auto nlc = map.offset_to_line_col(note.span->start);
            out << "note: " << note.message << " (line " << nlc.line << ")\n";
            continue;
        }
        out << "note: " << note.message << "\n";
    }

    return out.str();
}

std::string render_all(const std::vector<Diagnostic>& diagnostics,
                       const cinder::source::SourceFile& file)
{
    std::string out;
    for (const auto& d : diagnostics)
    {
        out += render(d, file);
    }
    return out;
}

std::string summarize(const Diagnostic& diagnostic, const cinder::source::SourceFile& file)
{
    if (!diagnostic.span.has_value())
    {
        return diagnostic.message;
    }
    const cinder::source::LineMap map(file.contents);
    const auto lc = map.offset_to_line_col(diagnostic.span->start);
    return diagnostic.message + " (line " + std::to_string(lc.line) + ")";
}

} // namespace cinder::diag
