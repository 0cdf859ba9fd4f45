#pragma once

#include <examkit/source/span.h>
#include <string_view>

namespace examkit::lexer
{

enum class TokenKind
{
    Eof,

    Identifier,
    IntLiteral,
    FloatLiteral,
    StringLiteral,

    // Keywords
    KwFn,
    KwLet,
    KwIf,
    KwElse,
    KwWhile,
    KwReturn,
    KwTrue,
    KwFalse,

    // Punctuation / operators
    LParen,
    RParen,
    LBrace,
    RBrace,

    Semicolon,
    Comma,
    Colon,
    Dot,

    Equal,      // =
    EqualEqual, // ==
    Bang,       // !
    BangEqual,  // !=

    Less,
    LessEqual,
    Greater,
    GreaterEqual,

    Plus,
    Minus,
    Star,
    StarStar, // **
    Slash,
    Percent,

    AndAnd,
    OrOr,
};

struct Token
{
    TokenKind kind = TokenKind::Eof;
    std::string_view lexeme;
    examkit::source::Span span;
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Eof:
        return "eof";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::IntLiteral:
        return "int";
    case TokenKind::FloatLiteral:
        return "float";
    case TokenKind::StringLiteral:
        return "string";

    case TokenKind::KwFn:
        return "kw_fn";
    case TokenKind::KwLet:
        return "kw_let";
    case TokenKind::KwIf:
        return "kw_if";
    case TokenKind::KwElse:
        return "kw_else";
    case TokenKind::KwWhile:
        return "kw_while";
    case TokenKind::KwReturn:
        return "kw_return";
    case TokenKind::KwTrue:
        return "kw_true";
    case TokenKind::KwFalse:
        return "kw_false";

    case TokenKind::LParen:
        return "l_paren";
    case TokenKind::RParen:
        return "r_paren";
    case TokenKind::LBrace:
        return "l_brace";
    case TokenKind::RBrace:
        return "r_brace";

    case TokenKind::Semicolon:
        return "semicolon";
    case TokenKind::Comma:
        return "comma";
    case TokenKind::Colon:
        return "colon";
    case TokenKind::Dot:
        return "dot";

    case TokenKind::Equal:
        return "equal";
    case TokenKind::EqualEqual:
        return "equal_equal";
    case TokenKind::Bang:
        return "bang";
    case TokenKind::BangEqual:
        return "bang_equal";

    case TokenKind::Less:
        return "less";
    case TokenKind::LessEqual:
        return "less_equal";
    case TokenKind::Greater:
        return "greater";
    case TokenKind::GreaterEqual:
        return "greater_equal";

    case TokenKind::Plus:
        return "plus";
    case TokenKind::Minus:
        return "minus";
    case TokenKind::Star:
        return "star";
    case TokenKind::StarStar:
        return "star_star";
    case TokenKind::Slash:
        return "slash";
    case TokenKind::Percent:
        return "percent";

    case TokenKind::AndAnd:
        return "and_and";
    case TokenKind::OrOr:
        return "or_or";
    }
    return "unknown";
}

} // namespace examkit::lexer
