#pragma once

#include <cstddef>
#include <examkit/lexer/token.h>
#include <examkit/source/span.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file ast.h
 * @brief Abstract syntax tree (AST) node types produced by the parser.
 *
 * Names and literal lexemes are views into the token stream, so the source text a
 * tree was parsed from must outlive the tree.
 */

namespace examkit::parser
{

/** Forward declaration for expression nodes. */
struct Expr;

/** @brief Integer literal expression. */
struct IntExpr
{
    std::string_view lexeme;
};

/** @brief Float literal expression (`2.5`, `1e-3`). */
struct FloatExpr
{
    std::string_view lexeme;
};

/** @brief Boolean literal expression. */
struct BoolExpr
{
    bool value = false;
};

/** @brief String literal expression (lexeme includes quotes). */
struct StringExpr
{
    std::string_view lexeme; // includes quotes, preserves escapes
};

/** @brief Simple name expression (identifier). */
struct NameExpr
{
    std::string_view name;
};

/** @brief Field access expression (base.member). */
struct MemberExpr
{
    std::unique_ptr<Expr> base;
    std::string_view member;
};

/** @brief Unary expression (`-x`, `!b`). */
struct UnaryExpr
{
    examkit::lexer::TokenKind op;
    std::unique_ptr<Expr> rhs;
};

/** @brief Binary expression (e.g. `a + b`). */
struct BinaryExpr
{
    examkit::lexer::TokenKind op;
    std::unique_ptr<Expr> lhs;
    std::unique_ptr<Expr> rhs;
};

/** @brief Function call expression. */
struct CallExpr
{
    std::unique_ptr<Expr> callee;
    std::vector<Expr> args;
};

/** @brief One `key: value` entry of a record literal. */
struct RecordExprField
{
    examkit::source::Span span;
    std::string key; // decoded when written as a string literal
    std::unique_ptr<Expr> value;
};

/** @brief Record literal expression (`{ final_answer_text: x, "k": 1 }`). */
struct RecordExpr
{
    std::vector<RecordExprField> fields;
};

/** @brief Parenthesized expression. */
struct GroupExpr
{
    std::unique_ptr<Expr> inner;
};

/**
 * @brief A general expression node with id, span and variant payload.
 */
struct Expr
{
    std::size_t id = 0;
    examkit::source::Span span;
    std::variant<IntExpr, FloatExpr, BoolExpr, StringExpr, NameExpr, UnaryExpr, BinaryExpr,
                 CallExpr, MemberExpr, GroupExpr, RecordExpr>
        node;
    std::size_t height = 1; // leaves are 1
};

/** @brief Let statement (new local binding). */
struct LetStmt
{
    std::size_t id = 0;
    examkit::source::Span name_span;
    std::string_view name;
    Expr value;
};

/** @brief Assignment to an existing local (`x = e;`). */
struct AssignStmt
{
    std::size_t id = 0;
    examkit::source::Span name_span;
    std::string_view name;
    Expr value;
};

/** @brief Return statement (optional return value). */
struct ReturnStmt
{
    std::optional<Expr> value;
};

/** @brief Expression statement. */
struct ExprStmt
{
    Expr expr;
};

/** Forward declaration for block nodes. */
struct Block;

/** @brief If statement; `else if` chains nest inside `else_block`. */
struct IfStmt
{
    Expr cond;
    std::unique_ptr<Block> then_block;
    std::unique_ptr<Block> else_block;
};

/** @brief While loop statement. */
struct WhileStmt
{
    Expr cond;
    std::unique_ptr<Block> body;
};

/** @brief Block statement wrapper. */
struct BlockStmt
{
    std::unique_ptr<Block> block;
};

struct Stmt
{
    examkit::source::Span span;
    std::variant<LetStmt, AssignStmt, ReturnStmt, ExprStmt, BlockStmt, IfStmt, WhileStmt> node;
};

/** @brief A sequence of statements with a source span. */
struct Block
{
    examkit::source::Span span;
    std::vector<Stmt> stmts;
};

/**
 * @brief Top-level function definition.
 */
struct Function
{
    examkit::source::Span span;
    examkit::source::Span name_span;
    std::string_view name;
    Block body;

    struct Param
    {
        examkit::source::Span span;
        std::string_view name;
    };

    std::vector<Param> params;
};

/** @brief Full parsed snippet: a list of functions. */
struct Program
{
    std::vector<Function> functions;
};

} // namespace examkit::parser
