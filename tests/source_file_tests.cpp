#include <cinder/source/source_file.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    namespace fs = std::filesystem;
    using namespace cinder::source;

    const fs::path tmp = fs::path{"source_file_tests_tmp.py"};
    (void)fs::remove(tmp);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            fail("failed to create temp file");
        }
        out << "print('hello')\nx = 2";
    }

    {
        const auto res = load_source_file(tmp.string());
        if (!std::holds_alternative<SourceFile>(res))
        {
            fail("expected SourceFile for readable temp file");
        }
        const auto& sf = std::get<SourceFile>(res);
        if (sf.path != tmp.string())
        {
            fail("unexpected path");
        }
        if (sf.contents != "print('hello')\nx = 2")
        {
            fail("unexpected contents");
        }
    }

    {
        const auto res = load_source_file("this_script_should_not_exist_hopefully.py");
        if (!std::holds_alternative<LoadError>(res))
        {
            fail("expected LoadError for missing file");
        }
        const auto& err = std::get<LoadError>(res);
        if (err.message != "failed to open script")
        {
            fail("unexpected error message: " + err.message);
        }
    }

    {
        std::istringstream in("x = 1");
        in.setstate(std::ios::badbit);

        const auto res = load_source_stream(in, "<stdin>");
        if (!std::holds_alternative<LoadError>(res))
        {
            fail("expected LoadError for bad stream");
        }
        if (std::get<LoadError>(res).message != "failed while reading script")
        {
            fail("unexpected error message: " + std::get<LoadError>(res).message);
        }
    }

    // Stream already at EOF: not a read error.
    {
        std::istringstream in("");
        (void)in.get();

        const auto res = load_source_stream(in, "<stdin>");
        if (!std::holds_alternative<SourceFile>(res))
        {
            fail("expected SourceFile for EOF-only stream");
        }
        if (!std::get<SourceFile>(res).contents.empty())
        {
            fail("expected empty contents for EOF-only stream");
        }
    }

    {
        const SourceFile sf = from_string("1 + 1");
        if (sf.path != kStringSourceName || sf.contents != "1 + 1")
        {
            fail("from_string should name the buffer <string>");
        }
    }

    (void)fs::remove(tmp);
    std::cout << "OK\n";
    return 0;
}
