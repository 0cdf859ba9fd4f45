#include <cctype>
#include <charconv>
#include <examkit/mc/canonical.h>
#include <system_error>

namespace examkit::mc
{

namespace
{

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool is_continuation(unsigned char b)
{
    return (b & 0xC0) == 0x80;
}

// Decodes a two- or three-byte UTF-8 sequence at `pos`. Returns its length, or 0 when the
// bytes are not one (ASCII, four-byte forms and malformed input are copied unchanged).
std::size_t decode_utf8(std::string_view text, std::size_t pos, char32_t& cp)
{
    const auto b0 = static_cast<unsigned char>(text[pos]);
    const std::size_t left = text.size() - pos;
    if ((b0 & 0xE0) == 0xC0 && b0 >= 0xC2 && left >= 2 &&
        is_continuation(static_cast<unsigned char>(text[pos + 1])))
    {
        cp = (char32_t(b0 & 0x1F) << 6) | char32_t(text[pos + 1] & 0x3F);
        return 2;
    }
    if ((b0 & 0xF0) == 0xE0 && left >= 3 &&
        is_continuation(static_cast<unsigned char>(text[pos + 1])) &&
        is_continuation(static_cast<unsigned char>(text[pos + 2])))
    {
        cp = (char32_t(b0 & 0x0F) << 12) | (char32_t(text[pos + 1] & 0x3F) << 6) |
             char32_t(text[pos + 2] & 0x3F);
        return cp >= 0x800 ? 3 : 0;
    }
    return 0;
}

void append_utf8(std::string& out, char32_t cp)
{
    if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        return;
    }
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

// Latin-1, Greek and Cyrillic capitals fold to lowercase; the micro, ohm and angstrom
// signs fold onto the letters they are written with.
char32_t fold(char32_t cp)
{
    if ((cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) || (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) ||
        (cp >= 0x410 && cp <= 0x42F))
    {
        return cp + 0x20;
    }
    if (cp >= 0x400 && cp <= 0x40F)
    {
        return cp + 0x50;
    }
    switch (cp)
    {
    case 0xB5:
        return 0x3BC;
    case 0x2126:
        return 0x3C9;
    case 0x212B:
        return 0xE5;
    default:
        return cp;
    }
}

} // namespace

std::string canonicalize(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (std::size_t pos = 0; pos < text.size();)
    {
        const char c = text[pos];
        if (is_space(c))
        {
            pending_space = !out.empty();
            ++pos;
            continue;
        }
        if (pending_space)
        {
            out.push_back(' ');
            pending_space = false;
        }

        char32_t cp = 0;
        if (const std::size_t width = decode_utf8(text, pos, cp); width != 0)
        {
            append_utf8(out, fold(cp));
            pos += width;
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        ++pos;
    }
    return out;
}

std::string trim(std::string_view text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin]))
    {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1]))
    {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::optional<double> leading_number(std::string_view text)
{
    std::string stripped;
    stripped.reserve(text.size());
    for (const char c : text)
    {
        if (c != ',')
        {
            stripped.push_back(c);
        }
    }

    std::size_t i = 0;
    while (i < stripped.size() && is_space(stripped[i]))
    {
        ++i;
    }

    bool negative = false;
    if (i < stripped.size() && (stripped[i] == '+' || stripped[i] == '-'))
    {
        negative = stripped[i] == '-';
        ++i;
    }

    const std::size_t start = i;
    std::size_t int_digits = 0;
    while (i < stripped.size() && is_digit(stripped[i]))
    {
        ++i;
        ++int_digits;
    }

    std::size_t frac_digits = 0;
    if (i < stripped.size() && stripped[i] == '.')
    {
        std::size_t j = i + 1;
        while (j < stripped.size() && is_digit(stripped[j]))
        {
            ++j;
            ++frac_digits;
        }
        if (int_digits > 0 || frac_digits > 0)
        {
            i = j;
        }
    }

    if (int_digits == 0 && frac_digits == 0)
    {
        return std::nullopt;
    }

    // Exponent only counts when at least one digit follows `e` and its sign.
    if (i < stripped.size() && (stripped[i] == 'e' || stripped[i] == 'E'))
    {
        std::size_t j = i + 1;
        if (j < stripped.size() && (stripped[j] == '+' || stripped[j] == '-'))
        {
            ++j;
        }
        if (j < stripped.size() && is_digit(stripped[j]))
        {
            while (j < stripped.size() && is_digit(stripped[j]))
            {
                ++j;
            }
            i = j;
        }
    }

    double value = 0.0;
    const char* first = stripped.data() + start;
    const char* last = stripped.data() + i;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return negative ? -value : value;
}

std::size_t word_count(std::string_view text)
{
    std::size_t count = 0;
    bool in_word = false;
    for (const char c : text)
    {
        if (is_space(c))
        {
            in_word = false;
        }
        else if (!in_word)
        {
            in_word = true;
            ++count;
        }
    }
    return count;
}

} // namespace examkit::mc
