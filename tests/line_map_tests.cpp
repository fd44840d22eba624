#include <cinder/source/line_map.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void expect_eq(std::size_t got, std::size_t expected, const char* what)
{
    if (got != expected)
    {
        std::cerr << "FAIL: " << what << ": got=" << got << " expected=" << expected << "\n";
        std::exit(1);
    }
}

static void expect_text(std::string_view got, std::string_view expected, const char* what)
{
    if (got != expected)
    {
        std::cerr << "FAIL: " << what << ": got='" << got << "' expected='" << expected << "'\n";
        std::exit(1);
    }
}

int main()
{
    const std::string text = "x = 1\n"      // line 1
                             "if x:\r\n"    // line 2 (CRLF)
                             "    print(x)"; // line 3 (no trailing newline)

    cinder::source::LineMap map(text);

    {
        const auto lc = map.offset_to_line_col(0);
        expect_eq(lc.line, 1, "offset 0 line");
        expect_eq(lc.col, 1, "offset 0 col");
    }

    {
        const auto lc = map.offset_to_line_col(5); // '\n'
        expect_eq(lc.line, 1, "newline line");
        expect_eq(lc.col, 6, "newline col");
    }

    {
        const auto lc = map.offset_to_line_col(6); // 'i'
        expect_eq(lc.line, 2, "offset 6 line");
        expect_eq(lc.col, 1, "offset 6 col");
    }

    {
        const auto lc = map.offset_to_line_col(text.size() + 40); // clamp past end
        expect_eq(lc.line, 3, "clamped end line");
        expect_eq(lc.col, 13, "clamped end col");
    }

    expect_eq(map.line_start_offset(0), 0, "line 0 start offset");
    expect_eq(map.line_start_offset(1), 0, "line 1 start offset");
    expect_eq(map.line_start_offset(2), 6, "line 2 start offset");
    expect_eq(map.line_start_offset(3), 13, "line 3 start offset");
    expect_eq(map.line_start_offset(999), text.size(), "too-large line start offset");
    expect_eq(map.line_count(), 3, "line_count");

    expect_text(map.line_text(text, 1), "x = 1", "line 1 text");
    expect_text(map.line_text(text, 2), "if x:", "CRLF line text drops the carriage return");
    expect_text(map.line_text(text, 3), "    print(x)", "last line text");
    expect_text(map.line_text(text, 50), "", "missing line text");

    std::cout << "OK\n";
    return 0;
}
