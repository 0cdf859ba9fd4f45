#include <cstdlib>
#include <examkit/source/line_map.h>
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

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    const std::string text = "fn solve(params) {\n" // line 1
                             "  return 1;\r\n"      // line 2 (CRLF)
                             "}";                   // line 3 (no trailing newline)

    examkit::source::LineMap map(text);

    {
        const auto lc = map.offset_to_line_col(0);
        expect_eq(lc.line, 1, "offset 0 line");
        expect_eq(lc.col, 1, "offset 0 col");
    }

    {
        const auto lc = map.offset_to_line_col(3); // 's' of solve
        expect_eq(lc.line, 1, "offset 3 line");
        expect_eq(lc.col, 4, "offset 3 col");
    }

    {
        const auto lc = map.offset_to_line_col(21); // 'r' of return
        expect_eq(lc.line, 2, "offset 21 line");
        expect_eq(lc.col, 3, "offset 21 col");
    }

    {
        const auto lc = map.offset_to_line_col(text.size() + 50); // clamped
        expect_eq(lc.line, 3, "clamped line");
        expect_eq(lc.col, 2, "clamped col");
    }

    expect_eq(map.line_count(), 3, "line_count");
    expect_eq(map.line_start_offset(0), 0, "line 0 start");
    expect_eq(map.line_start_offset(2), 19, "line 2 start");
    expect_eq(map.line_start_offset(99), text.size(), "past-end line start");

    if (map.line_text(2) != "  return 1;")
    {
        fail("expected line_text to drop the CRLF terminator");
    }
    if (map.line_text(3) != "}")
    {
        fail("expected last line without newline");
    }
    if (!map.line_text(7).empty())
    {
        fail("expected empty text for a missing line");
    }

    {
        examkit::source::LineMap empty("");
        expect_eq(empty.line_count(), 1, "empty line_count");
        const auto lc = empty.offset_to_line_col(0);
        expect_eq(lc.line, 1, "empty line");
        expect_eq(lc.col, 1, "empty col");
    }

    std::cout << "OK\n";
    return 0;
}
