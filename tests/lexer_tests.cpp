#include <cstdlib>
#include <examkit/lexer/lexer.h>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_token(const std::vector<examkit::lexer::Token>& tokens, std::size_t index,
                         examkit::lexer::TokenKind kind, std::string_view lexeme)
{
    if (index >= tokens.size())
    {
        fail("missing token at index " + std::to_string(index));
    }

    const auto& t = tokens[index];
    if (t.kind != kind)
    {
        fail("token kind mismatch at index " + std::to_string(index) + ": got " +
             std::string(examkit::lexer::to_string(t.kind)));
    }
    if (t.lexeme != lexeme)
    {
        fail("token lexeme mismatch at index " + std::to_string(index) + ": got '" +
             std::string(t.lexeme) + "'");
    }
}

// Tokens view into `src`; callers pass literals or strings that outlive the tokens.
static std::vector<examkit::lexer::Token> lex_ok(std::string_view src)
{
    auto res = examkit::lexer::lex(src);
    if (!std::holds_alternative<std::vector<examkit::lexer::Token>>(res))
    {
        fail("expected lexing to succeed for: " + std::string(src) + " (" +
             std::get<examkit::diag::Diagnostic>(res).message + ")");
    }
    return std::get<std::vector<examkit::lexer::Token>>(std::move(res));
}

static examkit::diag::Diagnostic lex_err(const std::string& src)
{
    auto res = examkit::lexer::lex(src);
    if (!std::holds_alternative<examkit::diag::Diagnostic>(res))
    {
        fail("expected lexing to fail for: " + src);
    }
    return std::get<examkit::diag::Diagnostic>(std::move(res));
}

int main()
{
    using namespace examkit::lexer;

    {
        const std::string src = "fn solve(params) { return params.x; }";
        const auto toks = lex_ok(src);
        expect_token(toks, 0, TokenKind::KwFn, "fn");
        expect_token(toks, 1, TokenKind::Identifier, "solve");
        expect_token(toks, 2, TokenKind::LParen, "(");
        expect_token(toks, 3, TokenKind::Identifier, "params");
        expect_token(toks, 4, TokenKind::RParen, ")");
        expect_token(toks, 5, TokenKind::LBrace, "{");
        expect_token(toks, 6, TokenKind::KwReturn, "return");
        expect_token(toks, 7, TokenKind::Identifier, "params");
        expect_token(toks, 8, TokenKind::Dot, ".");
        expect_token(toks, 9, TokenKind::Identifier, "x");
        expect_token(toks, 10, TokenKind::Semicolon, ";");
        expect_token(toks, 11, TokenKind::RBrace, "}");
        expect_token(toks, 12, TokenKind::Eof, "");
    }

    // Keywords vs identifiers.
    {
        const auto toks = lex_ok("let if else while true false letter _x1");
        expect_token(toks, 0, TokenKind::KwLet, "let");
        expect_token(toks, 1, TokenKind::KwIf, "if");
        expect_token(toks, 2, TokenKind::KwElse, "else");
        expect_token(toks, 3, TokenKind::KwWhile, "while");
        expect_token(toks, 4, TokenKind::KwTrue, "true");
        expect_token(toks, 5, TokenKind::KwFalse, "false");
        expect_token(toks, 6, TokenKind::Identifier, "letter");
        expect_token(toks, 7, TokenKind::Identifier, "_x1");
    }

    // Numbers: ints, floats, exponents; `1.` and `2e` stop before the dot/e.
    {
        const auto toks = lex_ok("42 2.5 1e-3 6.02e23 7.x 3e");
        expect_token(toks, 0, TokenKind::IntLiteral, "42");
        expect_token(toks, 1, TokenKind::FloatLiteral, "2.5");
        expect_token(toks, 2, TokenKind::FloatLiteral, "1e-3");
        expect_token(toks, 3, TokenKind::FloatLiteral, "6.02e23");
        expect_token(toks, 4, TokenKind::IntLiteral, "7");
        expect_token(toks, 5, TokenKind::Dot, ".");
        expect_token(toks, 6, TokenKind::Identifier, "x");
        expect_token(toks, 7, TokenKind::IntLiteral, "3");
        expect_token(toks, 8, TokenKind::Identifier, "e");
    }

    // Operators, longest match first.
    {
        const auto toks = lex_ok("== != <= >= && || ** = ! < > + - * / % : ,");
        const TokenKind expected[] = {
            TokenKind::EqualEqual, TokenKind::BangEqual, TokenKind::LessEqual,
            TokenKind::GreaterEqual, TokenKind::AndAnd, TokenKind::OrOr,
            TokenKind::StarStar, TokenKind::Equal, TokenKind::Bang,
            TokenKind::Less, TokenKind::Greater, TokenKind::Plus,
            TokenKind::Minus, TokenKind::Star, TokenKind::Slash,
            TokenKind::Percent, TokenKind::Colon, TokenKind::Comma,
        };
        for (std::size_t i = 0; i < std::size(expected); ++i)
        {
            if (toks[i].kind != expected[i])
            {
                fail("operator kind mismatch at index " + std::to_string(i));
            }
        }
    }

    // Comments are trivia.
    {
        const auto toks = lex_ok("// line\nx /* block\n comment */ y");
        expect_token(toks, 0, TokenKind::Identifier, "x");
        expect_token(toks, 1, TokenKind::Identifier, "y");
        expect_token(toks, 2, TokenKind::Eof, "");
    }

    // Strings keep their quotes and escapes; unescape decodes them.
    {
        const auto toks = lex_ok(R"("a\"b\n")");
        expect_token(toks, 0, TokenKind::StringLiteral, R"("a\"b\n")");
        if (unescape_string_literal(toks[0].lexeme) != "a\"b\n")
        {
            fail("unexpected unescaped string");
        }
        if (unescape_string_literal(R"("tab\there\\")") != "tab\there\\")
        {
            fail("unexpected unescaped tab/backslash");
        }
    }

    // Spans are byte offsets.
    {
        const auto toks = lex_ok("ab  cd");
        if (toks[1].span.start != 4 || toks[1].span.end != 6)
        {
            fail("unexpected span for second identifier");
        }
    }

    // Errors.
    {
        const auto d = lex_err("let x = 1 @ 2;");
        if (d.message != "invalid character" || !d.span.has_value() || d.span->start != 10)
        {
            fail("expected invalid character at offset 10");
        }
    }
    {
        if (lex_err("\"abc").message != "unterminated string literal")
        {
            fail("expected unterminated string literal");
        }
        if (lex_err("\"ab\ncd\"").message != "unterminated string literal")
        {
            fail("expected newline to terminate string with an error");
        }
        if (lex_err(R"("\q")").message != "unknown escape sequence")
        {
            fail("expected unknown escape sequence");
        }
        if (lex_err("x /* never closed").message != "unterminated block comment")
        {
            fail("expected unterminated block comment");
        }
        if (lex_err("a & b").message != "invalid character")
        {
            fail("expected single '&' to be invalid");
        }
    }

    std::cout << "OK\n";
    return 0;
}
