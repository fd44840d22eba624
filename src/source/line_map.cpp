#include <algorithm>
#include <cinder/source/line_map.h>

namespace cinder::source
{

LineMap::LineMap(std::string_view text) : text_size_(text.size())
{
    line_starts_.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
        {
            line_starts_.push_back(i + 1);
        }
    }
}

LineCol LineMap::offset_to_line_col(std::size_t offset) const
{
    // Clamp to end-of-text.
    if (offset > text_size_)
    {
        offset = text_size_;
    }

    // Last line start <= offset.
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    if (it == line_starts_.begin())
    {
        return LineCol{.line = 1, .col = 1 + offset};
    }

    const auto index = static_cast<std::size_t>(std::distance(line_starts_.begin(), it) - 1);
    return LineCol{.line = index + 1, .col = 1 + (offset - line_starts_[index])};
}

std::size_t LineMap::line_start_offset(std::size_t line) const
{
    if (line == 0)
    {
        return 0;
    }

    const std::size_t index = line - 1;
    if (index >= line_starts_.size())
    {
        return text_size_;
    }

    return line_starts_[index];
}

std::size_t LineMap::line_count() const
{
    return line_starts_.size();
}

std::string_view LineMap::line_text(std::string_view text, std::size_t line) const
{
    const std::size_t start = std::min(line_start_offset(line), text.size());
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos)
    {
        end = text.size();
    }
    if (end > start && text[end - 1] == '\r')
    {
        --end;
    }
    return text.substr(start, end - start);
}

} // namespace cinder::source
