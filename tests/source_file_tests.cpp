#include <cstdlib>
#include <examkit/source/source_file.h>
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
    using namespace examkit::source;

    const fs::path tmp = fs::temp_directory_path() / "examkit_source_file_tests.ek";
    (void)fs::remove(tmp);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            fail("failed to create temp file");
        }
        out << "fn solve(params) {\n  return {};\n}\n";
    }

    // Success path.
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
        if (sf.contents != "fn solve(params) {\n  return {};\n}\n")
        {
            fail("unexpected contents");
        }
    }

    // Open-failure path names the file.
    {
        const auto res = load_source_file("examkit_missing_snippet.ek");
        if (!std::holds_alternative<LoadError>(res))
        {
            fail("expected LoadError for missing file");
        }
        const auto& err = std::get<LoadError>(res);
        if (err.message != "failed to open 'examkit_missing_snippet.ek'")
        {
            fail("unexpected error message: " + err.message);
        }
    }

    // Read-failure path.
    {
        std::istringstream in("fn f() {}");
        in.setstate(std::ios::badbit);

        const auto res = load_source_stream(in, "<stdin>");
        if (!std::holds_alternative<LoadError>(res))
        {
            fail("expected LoadError for bad stream");
        }
        if (std::get<LoadError>(res).message != "failed while reading '<stdin>'")
        {
            fail("unexpected error message: " + std::get<LoadError>(res).message);
        }
    }

    // In-memory stream with a label.
    {
        std::istringstream in("fn distractor(params) {}");
        const auto res = load_source_stream(in, "<distractor d1>");
        if (!std::holds_alternative<SourceFile>(res))
        {
            fail("expected SourceFile for string stream");
        }
        const auto& sf = std::get<SourceFile>(res);
        if (sf.path != "<distractor d1>" || sf.contents != "fn distractor(params) {}")
        {
            fail("unexpected in-memory source");
        }
    }

    (void)fs::remove(tmp);
    std::cout << "OK\n";
    return 0;
}
