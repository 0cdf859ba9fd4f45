#include <cctype>
#include <cstddef>
#include <examkit/lexer/lexer.h>
#include <optional>

namespace examkit::lexer
{
namespace
{

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

class Lexer
{
  public:
    explicit Lexer(std::string_view input) : input_(input) {}

    [[nodiscard]] LexResult lex_all()
    {
        std::vector<Token> tokens;
        while (true)
        {
            if (auto err = skip_trivia())
            {
                return *err;
            }

            const std::size_t start = pos_;
            if (is_at_end())
            {
                tokens.push_back(Token{
                    .kind = TokenKind::Eof, .lexeme = std::string_view{}, .span = {start, start}});
                return tokens;
            }

            const char c = peek();
            const char next = peek_next();

            if (is_ident_start(c))
            {
                advance();
                while (!is_at_end() && is_ident_continue(peek()))
                {
                    advance();
                }
                const std::string_view lexeme = input_.substr(start, pos_ - start);
                tokens.push_back(Token{
                    .kind = keyword_or_ident(lexeme), .lexeme = lexeme, .span = {start, pos_}});
                continue;
            }

            if (is_digit(c))
            {
                tokens.push_back(lex_number(start));
                continue;
            }

            if (c == '"')
            {
                auto str = lex_string(start);
                if (std::holds_alternative<examkit::diag::Diagnostic>(str))
                {
                    return std::get<examkit::diag::Diagnostic>(std::move(str));
                }
                tokens.push_back(std::get<Token>(str));
                continue;
            }

            // Two-character operators
            if (c == '=' && next == '=')
            {
                pos_ += 2;
                tokens.push_back(make_token(TokenKind::EqualEqual, start, pos_));
                continue;
            }

            if (c == '!' && next == '=')
            {
                pos_ += 2;
                tokens.push_back(make_token(TokenKind::BangEqual, start, pos_));
                continue;
            }

            if (c == '<' && next == '=')
            {
                pos_ += 2;
                tokens.push_back(make_token(TokenKind::LessEqual, start, pos_));
                continue;
            }

            if (c == '>' && next == '=')
            {
                pos_ += 2;
                tokens.push_back(make_token(TokenKind::GreaterEqual, start, pos_));
                continue;
            }

            if (c == '&' && next == '&')
            {
                pos_ += 2;
                tokens.push_back(make_token(TokenKind::AndAnd, start, pos_));
                continue;
            }

            if (c == '|' && next == '|')
            {
                pos_ += 2;
                tokens.push_back(make_token(TokenKind::OrOr, start, pos_));
                continue;
            }

            if (c == '*' && next == '*')
            {
                pos_ += 2;
                tokens.push_back(make_token(TokenKind::StarStar, start, pos_));
                continue;
            }

            // Single-character tokens
            advance();
            switch (c)
            {
            case '(':
                tokens.push_back(make_token(TokenKind::LParen, start, pos_));
                break;
            case ')':
                tokens.push_back(make_token(TokenKind::RParen, start, pos_));
                break;
            case '{':
                tokens.push_back(make_token(TokenKind::LBrace, start, pos_));
                break;
            case '}':
                tokens.push_back(make_token(TokenKind::RBrace, start, pos_));
                break;
            case ';':
                tokens.push_back(make_token(TokenKind::Semicolon, start, pos_));
                break;
            case ',':
                tokens.push_back(make_token(TokenKind::Comma, start, pos_));
                break;
            case ':':
                tokens.push_back(make_token(TokenKind::Colon, start, pos_));
                break;
            case '.':
                tokens.push_back(make_token(TokenKind::Dot, start, pos_));
                break;
            case '+':
                tokens.push_back(make_token(TokenKind::Plus, start, pos_));
                break;
            case '-':
                tokens.push_back(make_token(TokenKind::Minus, start, pos_));
                break;
            case '*':
                tokens.push_back(make_token(TokenKind::Star, start, pos_));
                break;
            case '/':
                tokens.push_back(make_token(TokenKind::Slash, start, pos_));
                break;
            case '%':
                tokens.push_back(make_token(TokenKind::Percent, start, pos_));
                break;
            case '=':
                tokens.push_back(make_token(TokenKind::Equal, start, pos_));
                break;
            case '!':
                tokens.push_back(make_token(TokenKind::Bang, start, pos_));
                break;
            case '<':
                tokens.push_back(make_token(TokenKind::Less, start, pos_));
                break;
            case '>':
                tokens.push_back(make_token(TokenKind::Greater, start, pos_));
                break;
            default:
                return make_error(start, pos_, "invalid character");
            }
        }
    }

  private:
    std::string_view input_;
    std::size_t pos_ = 0;

    [[nodiscard]] bool is_at_end() const { return pos_ >= input_.size(); }
    [[nodiscard]] char peek() const { return input_[pos_]; }

    [[nodiscard]] char peek_at(std::size_t offset) const
    {
        const std::size_t n = pos_ + offset;
        return (n < input_.size()) ? input_[n] : '\0';
    }

    [[nodiscard]] char peek_next() const { return peek_at(1); }

    void advance() { ++pos_; }

    static bool is_ident_start(char c)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        return (std::isalpha(uc) != 0) || c == '_';
    }

    static bool is_ident_continue(char c)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        return (std::isalnum(uc) != 0) || c == '_';
    }

    static TokenKind keyword_or_ident(std::string_view lexeme)
    {
        if (lexeme == "fn")
        {
            return TokenKind::KwFn;
        }
        if (lexeme == "let")
        {
            return TokenKind::KwLet;
        }
        if (lexeme == "if")
        {
            return TokenKind::KwIf;
        }
        if (lexeme == "else")
        {
            return TokenKind::KwElse;
        }
        if (lexeme == "while")
        {
            return TokenKind::KwWhile;
        }
        if (lexeme == "return")
        {
            return TokenKind::KwReturn;
        }
        if (lexeme == "true")
        {
            return TokenKind::KwTrue;
        }
        if (lexeme == "false")
        {
            return TokenKind::KwFalse;
        }
        return TokenKind::Identifier;
    }

    // digits ['.' digits] [('e'|'E') ['+'|'-'] digits]; a '.' or exponent marker that is
    // not followed by a digit ends the literal.
    [[nodiscard]] Token lex_number(std::size_t start)
    {
        bool is_float = false;
        while (!is_at_end() && is_digit(peek()))
        {
            advance();
        }

        if (!is_at_end() && peek() == '.' && is_digit(peek_next()))
        {
            is_float = true;
            advance();
            while (!is_at_end() && is_digit(peek()))
            {
                advance();
            }
        }

        if (!is_at_end() && (peek() == 'e' || peek() == 'E'))
        {
            const char sign = peek_next();
            const bool has_sign = sign == '+' || sign == '-';
            if (is_digit(peek_at(has_sign ? 2 : 1)))
            {
                is_float = true;
                pos_ += has_sign ? 2 : 1;
                while (!is_at_end() && is_digit(peek()))
                {
                    advance();
                }
            }
        }

        return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start,
                          pos_);
    }

    [[nodiscard]] std::variant<Token, examkit::diag::Diagnostic> lex_string(std::size_t start)
    {
        advance(); // opening quote
        while (!is_at_end())
        {
            const char ch = peek();
            if (ch == '"')
            {
                advance();
                return make_token(TokenKind::StringLiteral, start, pos_);
            }

            if (ch == '\n' || ch == '\r')
            {
                return make_error(start, pos_, "unterminated string literal");
            }

            if (ch == '\\')
            {
                const std::size_t escape_start = pos_;
                advance();
                if (is_at_end())
                {
                    return make_error(start, pos_, "unterminated string literal");
                }
                const char esc = peek();
                if (esc != 'n' && esc != 't' && esc != 'r' && esc != '"' && esc != '\\')
                {
                    return make_error(escape_start, pos_ + 1, "unknown escape sequence");
                }
                advance();
                continue;
            }

            advance();
        }

        return make_error(start, pos_, "unterminated string literal");
    }

    [[nodiscard]] Token make_token(TokenKind kind, std::size_t start, std::size_t end) const
    {
        return Token{
            .kind = kind, .lexeme = input_.substr(start, end - start), .span = {start, end}};
    }

    [[nodiscard]] examkit::diag::Diagnostic make_error(std::size_t start, std::size_t end,
                                                       std::string_view message) const
    {
        return examkit::diag::error_at({start, end}, std::string(message));
    }

    // Skips whitespace and comments. Returns a diagnostic on unterminated block comment.
    [[nodiscard]] std::optional<examkit::diag::Diagnostic> skip_trivia()
    {
        while (!is_at_end())
        {
            const char c = peek();

            if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
            {
                advance();
                continue;
            }

            if (c == '/' && peek_next() == '/')
            {
                pos_ += 2;
                while (!is_at_end() && peek() != '\n')
                {
                    advance();
                }
                continue;
            }

            if (c == '/' && peek_next() == '*')
            {
                const std::size_t start = pos_;
                pos_ += 2;
                bool closed = false;
                while (!is_at_end())
                {
                    if (peek() == '*' && peek_next() == '/')
                    {
                        pos_ += 2;
                        closed = true;
                        break;
                    }
                    advance();
                }
                if (!closed)
                {
                    return make_error(start, pos_, "unterminated block comment");
                }
                continue;
            }

            break;
        }

        return std::nullopt;
    }
};

} // namespace

LexResult lex(std::string_view input)
{
    return Lexer(input).lex_all();
}

std::string unescape_string_literal(std::string_view lexeme)
{
    std::string out;
    if (lexeme.size() < 2)
    {
        return out;
    }
    const std::string_view body = lexeme.substr(1, lexeme.size() - 2);
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i)
    {
        const char c = body[i];
        if (c != '\\' || i + 1 >= body.size())
        {
            out.push_back(c);
            continue;
        }
        const char esc = body[++i];
        switch (esc)
        {
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'r':
            out.push_back('\r');
            break;
        default:
            out.push_back(esc);
            break;
        }
    }
    return out;
}

} // namespace examkit::lexer
