#include <algorithm>
#include <cassert>
#include <cstddef>
#include <examkit/lexer/lexer.h>
#include <examkit/lexer/token.h>
#include <examkit/parser/parser.h>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace examkit::parser
{
namespace
{

using examkit::diag::Diagnostic;
using examkit::lexer::Token;
using examkit::lexer::TokenKind;
using examkit::source::cover;

void assign_ids(Expr& expr, std::size_t& next_id);

void assign_ids_block(Block& block, std::size_t& next_id);

void assign_ids_stmt(Stmt& stmt, std::size_t& next_id)
{
    std::visit(
        [&](auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, LetStmt> || std::is_same_v<Node, AssignStmt>)
            {
                node.id = next_id++;
                assign_ids(node.value, next_id);
            }
            else if constexpr (std::is_same_v<Node, ReturnStmt>)
            {
                if (node.value.has_value())
                {
                    assign_ids(*node.value, next_id);
                }
            }
            else if constexpr (std::is_same_v<Node, ExprStmt>)
            {
                assign_ids(node.expr, next_id);
            }
            else if constexpr (std::is_same_v<Node, BlockStmt>)
            {
                assign_ids_block(*node.block, next_id);
            }
            else if constexpr (std::is_same_v<Node, IfStmt>)
            {
                assign_ids(node.cond, next_id);
                assign_ids_block(*node.then_block, next_id);
                if (node.else_block != nullptr)
                {
                    assign_ids_block(*node.else_block, next_id);
                }
            }
            else if constexpr (std::is_same_v<Node, WhileStmt>)
            {
                assign_ids(node.cond, next_id);
                assign_ids_block(*node.body, next_id);
            }
        },
        stmt.node);
}

void assign_ids_block(Block& block, std::size_t& next_id)
{
    for (auto& stmt : block.stmts)
    {
        assign_ids_stmt(stmt, next_id);
    }
}

void assign_ids(Expr& expr, std::size_t& next_id)
{
    expr.id = next_id++;
    std::visit(
        [&](auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, UnaryExpr>)
            {
                assign_ids(*node.rhs, next_id);
            }
            else if constexpr (std::is_same_v<Node, BinaryExpr>)
            {
                assign_ids(*node.lhs, next_id);
                assign_ids(*node.rhs, next_id);
            }
            else if constexpr (std::is_same_v<Node, CallExpr>)
            {
                assign_ids(*node.callee, next_id);
                for (auto& arg : node.args)
                {
                    assign_ids(arg, next_id);
                }
            }
            else if constexpr (std::is_same_v<Node, MemberExpr>)
            {
                assign_ids(*node.base, next_id);
            }
            else if constexpr (std::is_same_v<Node, GroupExpr>)
            {
                assign_ids(*node.inner, next_id);
            }
            else if constexpr (std::is_same_v<Node, RecordExpr>)
            {
                for (auto& f : node.fields)
                {
                    assign_ids(*f.value, next_id);
                }
            }
        },
        expr.node);
}

// Ids are unique across the program; let/assign statements draw from the same counter
// as expressions so the resolver can key every binding site by a single number.
void assign_ids_program(Program& program)
{
    std::size_t next_id = 1;
    for (auto& function : program.functions)
    {
        assign_ids_block(function.body, next_id);
    }
}

class Parser
{
  public:
    explicit Parser(std::span<const Token> tokens) : tokens_(tokens) {}

    [[nodiscard]] ParseResult parse_program()
    {
        Program program;
        while (!is_at_end())
        {
            if (!check(TokenKind::KwFn))
            {
                diagnostics_.push_back(error_at(peek(), "expected 'fn' at top level"));
                advance();
                synchronize_top_level();
                continue;
            }

            auto fn = parse_function();
            if (std::holds_alternative<Diagnostic>(fn))
            {
                diagnostics_.push_back(std::get<Diagnostic>(std::move(fn)));
                synchronize_top_level();
                continue;
            }
            program.functions.push_back(std::get<Function>(std::move(fn)));
        }

        if (!diagnostics_.empty())
        {
            return diagnostics_;
        }
        return program;
    }

    [[nodiscard]] ExprParseResult parse_standalone_expr()
    {
        if (is_at_end())
        {
            return std::vector<Diagnostic>{error_at(peek(), "expected expression")};
        }

        auto expr_res = parse_expr();
        if (std::holds_alternative<Diagnostic>(expr_res))
        {
            return std::vector<Diagnostic>{std::get<Diagnostic>(std::move(expr_res))};
        }
        if (!is_at_end())
        {
            return std::vector<Diagnostic>{error_at(peek(), "unexpected token after expression")};
        }
        return std::get<Expr>(std::move(expr_res));
    }

  private:
    // Later passes walk the tree recursively, so both the descent and the tree height are capped.
    static constexpr std::size_t kMaxNestingDepth = 256;

    std::span<const Token> tokens_;
    std::size_t pos_ = 0;
    std::vector<Diagnostic> diagnostics_;
    std::size_t depth_ = 0;

    class NestingGuard
    {
      public:
        explicit NestingGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
        ~NestingGuard() { --depth_; }
        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

        [[nodiscard]] bool exceeded() const { return depth_ > kMaxNestingDepth; }

      private:
        std::size_t& depth_;
    };

    [[nodiscard]] Diagnostic nested_too_deeply(const Token& at) const
    {
        return error_at(at, "expression nested too deeply");
    }

    [[nodiscard]] bool is_at_end() const { return peek().kind == TokenKind::Eof; }

    [[nodiscard]] const Token& peek() const
    {
        assert(pos_ < tokens_.size());
        return tokens_[pos_];
    }

    [[nodiscard]] const Token& peek_next() const
    {
        const std::size_t n = pos_ + 1;
        return n < tokens_.size() ? tokens_[n] : tokens_.back();
    }

    [[nodiscard]] const Token& previous() const
    {
        assert(pos_ > 0);
        return tokens_[pos_ - 1];
    }

    [[nodiscard]] bool check(TokenKind kind) const { return peek().kind == kind; }

    const Token& advance()
    {
        if (!is_at_end())
        {
            ++pos_;
        }
        return previous();
    }

    bool match(TokenKind kind)
    {
        if (!check(kind))
        {
            return false;
        }
        advance();
        return true;
    }

    void synchronize_stmt()
    {
        if (!is_at_end())
        {
            advance();
        }

        while (!is_at_end())
        {
            if (previous().kind == TokenKind::Semicolon)
            {
                return;
            }
            if (check(TokenKind::RBrace))
            {
                return;
            }
            advance();
        }
    }

    void synchronize_top_level()
    {
        while (!is_at_end() && !check(TokenKind::KwFn))
        {
            advance();
        }
    }

    [[nodiscard]] Diagnostic error_at(const Token& token, std::string_view message) const
    {
        return examkit::diag::error_at(token.span, std::string(message));
    }

    [[nodiscard]] std::optional<Diagnostic> consume(TokenKind kind, std::string_view message)
    {
        if (check(kind))
        {
            advance();
            return std::nullopt;
        }
        return error_at(peek(), message);
    }

    [[nodiscard]] std::variant<Function, Diagnostic> parse_function()
    {
        if (auto err = consume(TokenKind::KwFn, "expected 'fn'"); err.has_value())
        {
            return *err;
        }
        const Token kw = previous();

        if (!check(TokenKind::Identifier))
        {
            return error_at(peek(), "expected function name");
        }
        const Token name = advance();

        if (auto err = consume(TokenKind::LParen, "expected '(' after function name");
            err.has_value())
        {
            return *err;
        }

        std::vector<Function::Param> params;
        if (!check(TokenKind::RParen))
        {
            while (true)
            {
                if (!check(TokenKind::Identifier))
                {
                    return error_at(peek(), "expected parameter name");
                }
                const Token param = advance();
                params.push_back(Function::Param{.span = param.span, .name = param.lexeme});

                if (match(TokenKind::Comma))
                {
                    continue;
                }
                break;
            }
        }

        if (auto err = consume(TokenKind::RParen, "expected ')' after parameter list");
            err.has_value())
        {
            return *err;
        }

        auto body_res = parse_block();
        if (std::holds_alternative<Diagnostic>(body_res))
        {
            return std::get<Diagnostic>(std::move(body_res));
        }

        Block body = std::get<Block>(std::move(body_res));
        Function fn{
            .span = cover(kw.span, body.span),
            .name_span = name.span,
            .name = name.lexeme,
            .body = std::move(body),
            .params = std::move(params),
        };
        return fn;
    }

    [[nodiscard]] std::variant<Block, Diagnostic> parse_block()
    {
        const NestingGuard guard(depth_);
        if (guard.exceeded())
        {
            return error_at(peek(), "blocks nested too deeply");
        }
        if (auto err = consume(TokenKind::LBrace, "expected '{' to start block"); err.has_value())
        {
            return *err;
        }
        const Token lbrace = previous();

        std::vector<Stmt> stmts;
        while (!check(TokenKind::RBrace) && !is_at_end())
        {
            auto stmt_res = parse_stmt();
            if (std::holds_alternative<Diagnostic>(stmt_res))
            {
                diagnostics_.push_back(std::get<Diagnostic>(std::move(stmt_res)));
                synchronize_stmt();
                continue;
            }
            stmts.push_back(std::get<Stmt>(std::move(stmt_res)));
        }

        if (auto err = consume(TokenKind::RBrace, "expected '}' to end block"); err.has_value())
        {
            return *err;
        }
        const Token rbrace = previous();

        return Block{.span = cover(lbrace.span, rbrace.span), .stmts = std::move(stmts)};
    }

    [[nodiscard]] std::variant<Stmt, Diagnostic> parse_if_after_keyword(const Token& kw)
    {
        const NestingGuard guard(depth_);
        if (guard.exceeded())
        {
            return error_at(kw, "blocks nested too deeply");
        }
        if (auto err = consume(TokenKind::LParen, "expected '(' after 'if'"); err.has_value())
        {
            return *err;
        }

        auto cond_res = parse_expr();
        if (std::holds_alternative<Diagnostic>(cond_res))
        {
            return std::get<Diagnostic>(std::move(cond_res));
        }
        Expr cond = std::get<Expr>(std::move(cond_res));

        if (auto err = consume(TokenKind::RParen, "expected ')' after if condition");
            err.has_value())
        {
            return *err;
        }

        auto then_res = parse_block();
        if (std::holds_alternative<Diagnostic>(then_res))
        {
            return std::get<Diagnostic>(std::move(then_res));
        }
        auto then_block = std::make_unique<Block>(std::get<Block>(std::move(then_res)));

        std::unique_ptr<Block> else_block;
        if (match(TokenKind::KwElse))
        {
            if (match(TokenKind::KwIf))
            {
                // `else if` becomes an else block holding a single nested if.
                const Token nested_kw = previous();
                auto nested_res = parse_if_after_keyword(nested_kw);
                if (std::holds_alternative<Diagnostic>(nested_res))
                {
                    return std::get<Diagnostic>(std::move(nested_res));
                }
                Stmt nested = std::get<Stmt>(std::move(nested_res));
                else_block = std::make_unique<Block>();
                else_block->span = nested.span;
                else_block->stmts.push_back(std::move(nested));
            }
            else
            {
                auto else_res = parse_block();
                if (std::holds_alternative<Diagnostic>(else_res))
                {
                    return std::get<Diagnostic>(std::move(else_res));
                }
                else_block = std::make_unique<Block>(std::get<Block>(std::move(else_res)));
            }
        }

        const examkit::source::Span span = else_block != nullptr
                                               ? cover(kw.span, else_block->span)
                                               : cover(kw.span, then_block->span);
        Stmt stmt{
            .span = span,
            .node = IfStmt{.cond = std::move(cond),
                           .then_block = std::move(then_block),
                           .else_block = std::move(else_block)},
        };
        return stmt;
    }

    [[nodiscard]] std::variant<Stmt, Diagnostic> parse_stmt()
    {
        const std::size_t start_pos = pos_;

        if (check(TokenKind::LBrace))
        {
            auto block_res = parse_block();
            if (std::holds_alternative<Diagnostic>(block_res))
            {
                return std::get<Diagnostic>(std::move(block_res));
            }
            auto block = std::get<Block>(std::move(block_res));
            Stmt stmt;
            stmt.span = block.span;
            stmt.node = BlockStmt{.block = std::make_unique<Block>(std::move(block))};
            return stmt;
        }

        if (match(TokenKind::KwLet))
        {
            const Token kw = previous();
            if (!check(TokenKind::Identifier))
            {
                return error_at(peek(), "expected identifier after 'let'");
            }
            const Token name = advance();

            if (auto err = consume(TokenKind::Equal, "expected '=' in let statement");
                err.has_value())
            {
                return *err;
            }

            auto expr_res = parse_expr();
            if (std::holds_alternative<Diagnostic>(expr_res))
            {
                return std::get<Diagnostic>(std::move(expr_res));
            }
            Expr value = std::get<Expr>(std::move(expr_res));

            if (auto err = consume(TokenKind::Semicolon, "expected ';' after let statement");
                err.has_value())
            {
                return *err;
            }
            const Token semi = previous();

            Stmt stmt{
                .span = cover(kw.span, semi.span),
                .node = LetStmt{.name_span = name.span,
                                .name = name.lexeme,
                                .value = std::move(value)},
            };
            return stmt;
        }

        if (check(TokenKind::Identifier) && peek_next().kind == TokenKind::Equal)
        {
            const Token name = advance();
            advance(); // '='

            auto expr_res = parse_expr();
            if (std::holds_alternative<Diagnostic>(expr_res))
            {
                return std::get<Diagnostic>(std::move(expr_res));
            }
            Expr value = std::get<Expr>(std::move(expr_res));

            if (auto err = consume(TokenKind::Semicolon, "expected ';' after assignment");
                err.has_value())
            {
                return *err;
            }
            const Token semi = previous();

            Stmt stmt{
                .span = cover(name.span, semi.span),
                .node = AssignStmt{.name_span = name.span,
                                   .name = name.lexeme,
                                   .value = std::move(value)},
            };
            return stmt;
        }

        if (match(TokenKind::KwIf))
        {
            const Token kw = previous();
            return parse_if_after_keyword(kw);
        }

        if (match(TokenKind::KwWhile))
        {
            const Token kw = previous();

            if (auto err = consume(TokenKind::LParen, "expected '(' after 'while'");
                err.has_value())
            {
                return *err;
            }

            auto cond_res = parse_expr();
            if (std::holds_alternative<Diagnostic>(cond_res))
            {
                return std::get<Diagnostic>(std::move(cond_res));
            }
            Expr cond = std::get<Expr>(std::move(cond_res));

            if (auto err = consume(TokenKind::RParen, "expected ')' after while condition");
                err.has_value())
            {
                return *err;
            }

            auto body_res = parse_block();
            if (std::holds_alternative<Diagnostic>(body_res))
            {
                return std::get<Diagnostic>(std::move(body_res));
            }
            auto body = std::make_unique<Block>(std::get<Block>(std::move(body_res)));

            Stmt stmt{
                .span = cover(kw.span, body->span),
                .node = WhileStmt{.cond = std::move(cond), .body = std::move(body)},
            };
            return stmt;
        }

        if (match(TokenKind::KwReturn))
        {
            const Token kw = previous();
            std::optional<Expr> value;
            if (!check(TokenKind::Semicolon))
            {
                auto expr_res = parse_expr();
                if (std::holds_alternative<Diagnostic>(expr_res))
                {
                    return std::get<Diagnostic>(std::move(expr_res));
                }
                value = std::get<Expr>(std::move(expr_res));
            }

            if (auto err = consume(TokenKind::Semicolon, "expected ';' after return statement");
                err.has_value())
            {
                return *err;
            }
            const Token semi = previous();

            Stmt stmt{
                .span = cover(kw.span, semi.span),
                .node = ReturnStmt{.value = std::move(value)},
            };
            return stmt;
        }

        auto expr_res = parse_expr();
        if (std::holds_alternative<Diagnostic>(expr_res))
        {
            return std::get<Diagnostic>(std::move(expr_res));
        }
        Expr expr = std::get<Expr>(std::move(expr_res));

        if (auto err = consume(TokenKind::Semicolon, "expected ';' after expression");
            err.has_value())
        {
            return *err;
        }
        const Token semi = previous();

        const Token first = tokens_[start_pos];
        Stmt stmt{
            .span = cover(first.span, semi.span),
            .node = ExprStmt{.expr = std::move(expr)},
        };
        return stmt;
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_expr()
    {
        const NestingGuard guard(depth_);
        if (guard.exceeded())
        {
            return nested_too_deeply(peek());
        }
        return parse_or();
    }

    [[nodiscard]] static Expr make_binary(const Token& op, Expr lhs, Expr rhs)
    {
        Expr combined;
        combined.span = cover(lhs.span, rhs.span);
        combined.height = std::max(lhs.height, rhs.height) + 1;
        combined.node = BinaryExpr{
            .op = op.kind,
            .lhs = std::make_unique<Expr>(std::move(lhs)),
            .rhs = std::make_unique<Expr>(std::move(rhs)),
        };
        return combined;
    }

    // Parses a left-associative chain `next (op next)*` for any operator in `ops`.
    template <typename Next>
    [[nodiscard]] std::variant<Expr, Diagnostic>
    parse_left_assoc(std::initializer_list<TokenKind> ops, Next next)
    {
        auto lhs_res = (this->*next)();
        if (std::holds_alternative<Diagnostic>(lhs_res))
        {
            return std::get<Diagnostic>(std::move(lhs_res));
        }
        Expr expr = std::get<Expr>(std::move(lhs_res));

        while (true)
        {
            bool matched = false;
            for (const TokenKind kind : ops)
            {
                if (match(kind))
                {
                    matched = true;
                    break;
                }
            }
            if (!matched)
            {
                break;
            }

            const Token op = previous();
            auto rhs_res = (this->*next)();
            if (std::holds_alternative<Diagnostic>(rhs_res))
            {
                return std::get<Diagnostic>(std::move(rhs_res));
            }
            expr = make_binary(op, std::move(expr), std::get<Expr>(std::move(rhs_res)));
            if (expr.height > kMaxNestingDepth)
            {
                return nested_too_deeply(op);
            }
        }

        return expr;
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_or()
    {
        return parse_left_assoc({TokenKind::OrOr}, &Parser::parse_and);
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_and()
    {
        return parse_left_assoc({TokenKind::AndAnd}, &Parser::parse_equality);
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_equality()
    {
        return parse_left_assoc({TokenKind::EqualEqual, TokenKind::BangEqual},
                                &Parser::parse_comparison);
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_comparison()
    {
        return parse_left_assoc({TokenKind::Less, TokenKind::LessEqual, TokenKind::Greater,
                                 TokenKind::GreaterEqual},
                                &Parser::parse_term);
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_term()
    {
        return parse_left_assoc({TokenKind::Plus, TokenKind::Minus}, &Parser::parse_factor);
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_factor()
    {
        return parse_left_assoc({TokenKind::Star, TokenKind::Slash, TokenKind::Percent},
                                &Parser::parse_unary);
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_unary()
    {
        if (match(TokenKind::Bang) || match(TokenKind::Minus))
        {
            const Token op = previous();
            const NestingGuard guard(depth_);
            if (guard.exceeded())
            {
                return nested_too_deeply(op);
            }
            auto rhs_res = parse_unary();
            if (std::holds_alternative<Diagnostic>(rhs_res))
            {
                return std::get<Diagnostic>(std::move(rhs_res));
            }
            Expr rhs = std::get<Expr>(std::move(rhs_res));

            Expr expr;
            expr.span = cover(op.span, rhs.span);
            expr.height = rhs.height + 1;
            expr.node = UnaryExpr{.op = op.kind, .rhs = std::make_unique<Expr>(std::move(rhs))};
            return expr;
        }

        return parse_power();
    }

    // `**` binds tighter than unary minus on its left and is right associative:
    // `-x ** 2` is `-(x ** 2)` and `2 ** -1` is allowed.
    [[nodiscard]] std::variant<Expr, Diagnostic> parse_power()
    {
        auto base_res = parse_postfix();
        if (std::holds_alternative<Diagnostic>(base_res))
        {
            return base_res;
        }

        if (!match(TokenKind::StarStar))
        {
            return base_res;
        }
        const Token op = previous();

        auto exp_res = parse_unary();
        if (std::holds_alternative<Diagnostic>(exp_res))
        {
            return exp_res;
        }
        Expr expr = make_binary(op, std::get<Expr>(std::move(base_res)),
                                std::get<Expr>(std::move(exp_res)));
        if (expr.height > kMaxNestingDepth)
        {
            return nested_too_deeply(op);
        }
        return expr;
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_postfix()
    {
        auto callee_res = parse_primary();
        if (std::holds_alternative<Diagnostic>(callee_res))
        {
            return std::get<Diagnostic>(std::move(callee_res));
        }

        Expr expr = std::get<Expr>(std::move(callee_res));

        while (true)
        {
            if (match(TokenKind::Dot))
            {
                if (!check(TokenKind::Identifier))
                {
                    return error_at(peek(), "expected field name after '.'");
                }
                const Token member = advance();

                Expr access;
                access.span = cover(expr.span, member.span);
                access.height = expr.height + 1;
                access.node = MemberExpr{.base = std::make_unique<Expr>(std::move(expr)),
                                         .member = member.lexeme};
                expr = std::move(access);
                if (expr.height > kMaxNestingDepth)
                {
                    return nested_too_deeply(member);
                }
                continue;
            }

            if (!match(TokenKind::LParen))
            {
                break;
            }

            std::vector<Expr> args;
            if (!check(TokenKind::RParen))
            {
                while (true)
                {
                    auto arg_res = parse_expr();
                    if (std::holds_alternative<Diagnostic>(arg_res))
                    {
                        return std::get<Diagnostic>(std::move(arg_res));
                    }
                    args.push_back(std::get<Expr>(std::move(arg_res)));

                    if (match(TokenKind::Comma))
                    {
                        continue;
                    }
                    break;
                }
            }

            if (auto err = consume(TokenKind::RParen, "expected ')' after arguments");
                err.has_value())
            {
                return *err;
            }
            const Token rparen = previous();

            Expr call;
            call.span = cover(expr.span, rparen.span);
            call.height = expr.height + 1;
            for (const Expr& arg : args)
            {
                call.height = std::max(call.height, arg.height + 1);
            }
            call.node = CallExpr{
                .callee = std::make_unique<Expr>(std::move(expr)),
                .args = std::move(args),
            };
            expr = std::move(call);
            if (expr.height > kMaxNestingDepth)
            {
                return nested_too_deeply(rparen);
            }
        }

        return expr;
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_record_literal()
    {
        const Token lbrace = previous();

        std::vector<RecordExprField> fields;
        std::unordered_map<std::string, examkit::source::Span> seen;

        while (!check(TokenKind::RBrace) && !is_at_end())
        {
            if (!check(TokenKind::Identifier) && !check(TokenKind::StringLiteral))
            {
                return error_at(peek(), "expected field name in record literal");
            }
            const Token key_tok = advance();
            std::string key = key_tok.kind == TokenKind::StringLiteral
                                  ? examkit::lexer::unescape_string_literal(key_tok.lexeme)
                                  : std::string(key_tok.lexeme);

            if (auto it = seen.find(key); it != seen.end())
            {
                auto d = error_at(key_tok, "duplicate key '" + key + "' in record literal");
                d.notes.push_back(examkit::diag::Related{
                    .message = "previous entry is here",
                    .span = it->second,
                });
                return d;
            }
            seen.emplace(key, key_tok.span);

            if (auto err = consume(TokenKind::Colon, "expected ':' after field name");
                err.has_value())
            {
                return *err;
            }

            auto value_res = parse_expr();
            if (std::holds_alternative<Diagnostic>(value_res))
            {
                return std::get<Diagnostic>(std::move(value_res));
            }
            Expr value = std::get<Expr>(std::move(value_res));

            const examkit::source::Span field_span = cover(key_tok.span, value.span);
            fields.push_back(RecordExprField{
                .span = field_span,
                .key = std::move(key),
                .value = std::make_unique<Expr>(std::move(value)),
            });

            if (match(TokenKind::Comma))
            {
                continue; // trailing comma allowed
            }

            if (check(TokenKind::RBrace))
            {
                break;
            }

            return error_at(peek(), "expected ',' or '}' after record field");
        }

        if (auto err = consume(TokenKind::RBrace, "expected '}' after record literal");
            err.has_value())
        {
            return *err;
        }
        const Token rbrace = previous();

        Expr expr;
        expr.span = cover(lbrace.span, rbrace.span);
        for (const RecordExprField& field : fields)
        {
            expr.height = std::max(expr.height, field.value->height + 1);
        }
        expr.node = RecordExpr{.fields = std::move(fields)};
        return expr;
    }

    [[nodiscard]] std::variant<Expr, Diagnostic> parse_primary()
    {
        if (match(TokenKind::IntLiteral))
        {
            const Token lit = previous();
            Expr expr;
            expr.span = lit.span;
            expr.node = IntExpr{.lexeme = lit.lexeme};
            return expr;
        }

        if (match(TokenKind::FloatLiteral))
        {
            const Token lit = previous();
            Expr expr;
            expr.span = lit.span;
            expr.node = FloatExpr{.lexeme = lit.lexeme};
            return expr;
        }

        if (match(TokenKind::KwTrue) || match(TokenKind::KwFalse))
        {
            const Token lit = previous();
            Expr expr;
            expr.span = lit.span;
            expr.node = BoolExpr{.value = (lit.kind == TokenKind::KwTrue)};
            return expr;
        }

        if (match(TokenKind::StringLiteral))
        {
            const Token lit = previous();
            Expr expr;
            expr.span = lit.span;
            expr.node = StringExpr{.lexeme = lit.lexeme};
            return expr;
        }

        if (match(TokenKind::Identifier))
        {
            const Token name = previous();
            Expr expr;
            expr.span = name.span;
            expr.node = NameExpr{.name = name.lexeme};
            return expr;
        }

        if (match(TokenKind::LBrace))
        {
            return parse_record_literal();
        }

        if (match(TokenKind::LParen))
        {
            const Token l = previous();
            auto inner_res = parse_expr();
            if (std::holds_alternative<Diagnostic>(inner_res))
            {
                return std::get<Diagnostic>(std::move(inner_res));
            }
            Expr inner = std::get<Expr>(std::move(inner_res));

            if (auto err = consume(TokenKind::RParen, "expected ')' after expression");
                err.has_value())
            {
                return *err;
            }
            const Token r = previous();

            Expr expr;
            expr.span = cover(l.span, r.span);
            expr.height = inner.height + 1;
            expr.node = GroupExpr{.inner = std::make_unique<Expr>(std::move(inner))};
            return expr;
        }

        return error_at(peek(), "expected expression");
    }
};

class Dumper
{
  public:
    explicit Dumper(std::ostringstream& out) : out_(out) {}

    void dump_program(const Program& p)
    {
        for (std::size_t i = 0; i < p.functions.size(); ++i)
        {
            dump_function(p.functions[i]);
            out_ << "\n";
        }
    }

    void dump_expr(const Expr& e)
    {
        std::visit([&](const auto& node) { dump_expr_node(node); }, e.node);
    }

  private:
    std::ostringstream& out_;

    void dump_function(const Function& f)
    {
        out_ << "fn " << f.name << "(";
        for (std::size_t i = 0; i < f.params.size(); ++i)
        {
            out_ << f.params[i].name;
            if (i + 1 < f.params.size())
            {
                out_ << ", ";
            }
        }
        out_ << ") ";
        dump_block(f.body);
    }

    void dump_block(const Block& b)
    {
        out_ << "{";
        for (const auto& s : b.stmts)
        {
            out_ << " ";
            dump_stmt(s);
        }
        out_ << " }";
    }

    void dump_stmt(const Stmt& s)
    {
        std::visit([&](const auto& node) { dump_stmt_node(node); }, s.node);
    }

    void dump_stmt_node(const LetStmt& s)
    {
        out_ << "let " << s.name << " = ";
        dump_expr(s.value);
        out_ << ";";
    }

    void dump_stmt_node(const AssignStmt& s)
    {
        out_ << s.name << " = ";
        dump_expr(s.value);
        out_ << ";";
    }

    void dump_stmt_node(const ReturnStmt& s)
    {
        if (!s.value.has_value())
        {
            out_ << "return;";
            return;
        }

        out_ << "return ";
        dump_expr(*s.value);
        out_ << ";";
    }

    void dump_stmt_node(const ExprStmt& s)
    {
        dump_expr(s.expr);
        out_ << ";";
    }

    void dump_stmt_node(const BlockStmt& s) { dump_block(*s.block); }

    void dump_stmt_node(const IfStmt& s)
    {
        out_ << "if (";
        dump_expr(s.cond);
        out_ << ") ";
        dump_block(*s.then_block);
        if (s.else_block != nullptr)
        {
            out_ << " else ";
            dump_block(*s.else_block);
        }
    }

    void dump_stmt_node(const WhileStmt& s)
    {
        out_ << "while (";
        dump_expr(s.cond);
        out_ << ") ";
        dump_block(*s.body);
    }

    void dump_expr_node(const IntExpr& e) { out_ << e.lexeme; }
    void dump_expr_node(const FloatExpr& e) { out_ << e.lexeme; }
    void dump_expr_node(const BoolExpr& e) { out_ << (e.value ? "true" : "false"); }
    void dump_expr_node(const StringExpr& e) { out_ << e.lexeme; }
    void dump_expr_node(const NameExpr& e) { out_ << e.name; }

    void dump_expr_node(const MemberExpr& e)
    {
        dump_expr(*e.base);
        out_ << "." << e.member;
    }

    void dump_expr_node(const GroupExpr& e)
    {
        out_ << "(";
        dump_expr(*e.inner);
        out_ << ")";
    }

    void dump_expr_node(const UnaryExpr& e)
    {
        out_ << op_text(e.op);
        dump_expr(*e.rhs);
    }

    void dump_expr_node(const BinaryExpr& e)
    {
        out_ << "(";
        dump_expr(*e.lhs);
        out_ << " " << op_text(e.op) << " ";
        dump_expr(*e.rhs);
        out_ << ")";
    }

    void dump_expr_node(const CallExpr& e)
    {
        dump_expr(*e.callee);
        out_ << "(";
        for (std::size_t i = 0; i < e.args.size(); ++i)
        {
            dump_expr(e.args[i]);
            if (i + 1 < e.args.size())
            {
                out_ << ", ";
            }
        }
        out_ << ")";
    }

    void dump_expr_node(const RecordExpr& e)
    {
        out_ << "{";
        for (std::size_t i = 0; i < e.fields.size(); ++i)
        {
            const auto& f = e.fields[i];
            out_ << " " << f.key << ": ";
            dump_expr(*f.value);
            if (i + 1 < e.fields.size())
            {
                out_ << ",";
            }
        }
        if (!e.fields.empty())
        {
            out_ << " ";
        }
        out_ << "}";
    }
};

} // namespace

std::string_view op_text(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::StarStar:
        return "**";
    case TokenKind::Slash:
        return "/";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Bang:
        return "!";
    case TokenKind::EqualEqual:
        return "==";
    case TokenKind::BangEqual:
        return "!=";
    case TokenKind::Less:
        return "<";
    case TokenKind::LessEqual:
        return "<=";
    case TokenKind::Greater:
        return ">";
    case TokenKind::GreaterEqual:
        return ">=";
    case TokenKind::AndAnd:
        return "&&";
    case TokenKind::OrOr:
        return "||";
    default:
        return examkit::lexer::to_string(kind);
    }
}

ParseResult parse(std::span<const examkit::lexer::Token> tokens)
{
    auto result = Parser(tokens).parse_program();
    if (auto* program = std::get_if<Program>(&result))
    {
        assign_ids_program(*program);
    }
    return result;
}

ExprParseResult parse_expression(std::span<const examkit::lexer::Token> tokens)
{
    auto result = Parser(tokens).parse_standalone_expr();
    if (auto* expr = std::get_if<Expr>(&result))
    {
        std::size_t next_id = 1;
        assign_ids(*expr, next_id);
    }
    return result;
}

std::string dump(const Program& program)
{
    std::ostringstream out;
    Dumper d(out);
    d.dump_program(program);
    return out.str();
}

std::string dump(const Expr& expr)
{
    std::ostringstream out;
    Dumper d(out);
    d.dump_expr(expr);
    return out.str();
}

} // namespace examkit::parser
