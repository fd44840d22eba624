#include <cinder/diag/diagnostic.h>
#include <cinder/diag/render.h>
#include <cinder/source/source_file.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void expect_contains(const std::string& got, const std::string& needle, const char* what)
{
    if (got.find(needle) == std::string::npos)
    {
        std::cerr << "FAIL: " << what << ": expected output to contain: '" << needle << "'\n";
        std::cerr << "Got:\n" << got << "\n";
        std::exit(1);
    }
}

static void expect_eq(const std::string& got, const std::string& expected, const char* what)
{
    if (got != expected)
    {
        std::cerr << "FAIL: " << what << ": got='" << got << "' expected='" << expected << "'\n";
        std::exit(1);
    }
}

int main()
{
    const cinder::source::SourceFile file{
        .path = "job.py",
        .contents = "x = 1\n"         // line 1
                    "import os\n"     // line 2
                    "print(x)\n",     // line 3
    };

    {
        cinder::diag::Diagnostic diag;
        diag.severity = cinder::diag::Severity::Warning;
        diag.message = "something happened";
        diag.notes.push_back(cinder::diag::Related{.message = "note 1", .span = std::nullopt});

        const std::string out = cinder::diag::render(diag, file);
        expect_contains(out, "job.py: warning: something happened", "no-span header");
        expect_contains(out, "note: note 1", "no-span note");
    }

    {
        auto diag = cinder::diag::error_at(cinder::source::Span{.start = 13, .end = 15}, "import of blocked module 'os'");
        diag.notes.push_back(cinder::diag::Related{.message = "first use",
                                                   .span = cinder::source::Span{.start = 16, .end = 21}});

        const std::string out = cinder::diag::render(diag, file);
        expect_contains(out, "job.py:2:8: error: import of blocked module 'os'", "span header");
        expect_contains(out, "| import os", "source line");
        expect_contains(out, "|        ^^\n", "caret position and length");
        expect_contains(out, "note: first use (line 3)", "span note");
    }

    // Zero-length span still renders one caret.
    {
        const auto diag = cinder::diag::error_at(cinder::source::Span{.start = 5, .end = 5}, "point");
        const std::string out = cinder::diag::render(diag, file);
        expect_contains(out, "job.py:1:6: error: point", "zero-length header");
        expect_contains(out, "^", "zero-length caret");
    }

    // Multi-line span highlights the first line only.
    {
        const auto diag = cinder::diag::error_at(cinder::source::Span{.start = 2, .end = 100}, "cross");
        const std::string out = cinder::diag::render(diag, file);
        expect_contains(out, "job.py:1:3: error: cross", "multiline header");
        expect_contains(out, "|   ^^^\n", "multiline caret stops at end of line");
    }

    {
        cinder::diag::Diagnostic diag;
        diag.severity = static_cast<cinder::diag::Severity>(123);
        diag.message = "unknown severity";
        const std::string out = cinder::diag::render(diag, file);
        expect_contains(out, "job.py: error: unknown severity", "invalid severity fallback");
    }

    {
        std::vector<cinder::diag::Diagnostic> diags;
        diags.push_back(cinder::diag::error_at(cinder::source::Span{.start = 0, .end = 1}, "first"));
        diags.push_back(cinder::diag::error_at(cinder::source::Span{.start = 16, .end = 21}, "second"));
        const std::string out = cinder::diag::render_all(diags, file);
        expect_contains(out, "job.py:1:1: error: first", "render_all first");
        expect_contains(out, "job.py:3:1: error: second", "render_all second");
    }

    {
        const auto located = cinder::diag::error_at(cinder::source::Span{.start = 16, .end = 21}, "bad call");
        expect_eq(cinder::diag::summarize(located, file), "bad call (line 3)", "summarize with span");

        cinder::diag::Diagnostic floating;
        floating.message = "no position";
        expect_eq(cinder::diag::summarize(floating, file), "no position", "summarize without span");
    }

    std::cout << "OK\n";
    return 0;
}
