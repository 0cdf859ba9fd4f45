#include <charconv>
#include <examkit/compiler/emitter.h>
#include <examkit/lexer/lexer.h>
#include <examkit/lexer/token.h>
#include <limits>
#include <string>

namespace examkit::compiler
{
namespace
{

using examkit::diag::Diagnostic;
using examkit::lexer::TokenKind;
using examkit::parser::AssignStmt;
using examkit::parser::BinaryExpr;
using examkit::parser::BlockStmt;
using examkit::parser::BoolExpr;
using examkit::parser::CallExpr;
using examkit::parser::Expr;
using examkit::parser::ExprStmt;
using examkit::parser::FloatExpr;
using examkit::parser::Function;
using examkit::parser::GroupExpr;
using examkit::parser::IfStmt;
using examkit::parser::IntExpr;
using examkit::parser::LetStmt;
using examkit::parser::MemberExpr;
using examkit::parser::NameExpr;
using examkit::parser::RecordExpr;
using examkit::parser::ReturnStmt;
using examkit::parser::Stmt;
using examkit::parser::StringExpr;
using examkit::parser::UnaryExpr;
using examkit::parser::WhileStmt;
using examkit::resolver::BindingKind;
using examkit::source::Span;
using examkit::vm::Chunk;
using examkit::vm::OpCode;
using examkit::vm::Value;

constexpr std::size_t kMaxU16 = std::numeric_limits<std::uint16_t>::max();

class Emitter
{
  public:
    Emitter(const examkit::resolver::Resolution& resolution,
            const examkit::runtime::SymbolTable& symbols)
        : resolution_(resolution), symbols_(symbols)
    {
    }

    EmitResult run(const examkit::parser::Program& program)
    {
        for (std::size_t i = 0; i < program.functions.size(); ++i)
        {
            const auto& frame = resolution_.frames.at(i);
            chunk_.functions.push_back(examkit::vm::FunctionInfo{
                .name = std::string(frame.name),
                .entry = 0,
                .arity = frame.arity,
                .locals = frame.slot_count,
            });
        }

        for (std::size_t i = 0; i < program.functions.size(); ++i)
        {
            emit_function(program.functions[i], i);
            if (!diags_.empty())
            {
                return diags_;
            }
        }

        if (chunk_.code.size() > kMaxU16)
        {
            diags_.push_back(examkit::diag::error_at({}, "snippet is too large to compile"));
            return diags_;
        }
        return std::move(chunk_);
    }

  private:
    const examkit::resolver::Resolution& resolution_;
    const examkit::runtime::SymbolTable& symbols_;
    Chunk chunk_;
    std::vector<Diagnostic> diags_;

    std::size_t ip() const { return chunk_.code.size(); }

    void fail_at(Span span, std::string message)
    {
        if (diags_.empty())
        {
            diags_.push_back(examkit::diag::error_at(span, std::move(message)));
        }
    }

    std::size_t emit_jump(OpCode op, Span span)
    {
        chunk_.emit(op, span);
        const auto pos = ip();
        chunk_.emit_u16(0, span);
        return pos;
    }

    void patch_to_here(std::size_t pos)
    {
        chunk_.patch_u16(pos, static_cast<std::uint16_t>(ip() & 0xFFFF));
    }

    void emit_jump_to(std::size_t target, Span span)
    {
        chunk_.emit(OpCode::Jump, span);
        chunk_.emit_u16(static_cast<std::uint16_t>(target & 0xFFFF), span);
    }

    void emit_constant(Value value, Span span)
    {
        if (chunk_.constants.size() >= kMaxU16)
        {
            fail_at(span, "too many constants in snippet");
            return;
        }
        chunk_.emit_constant(std::move(value), span);
    }

    std::uint16_t constant_index(Value value, Span span)
    {
        if (chunk_.constants.size() >= kMaxU16)
        {
            fail_at(span, "too many constants in snippet");
            return 0;
        }
        return static_cast<std::uint16_t>(chunk_.add_constant(std::move(value)));
    }

    void emit_function(const Function& fn, std::size_t index)
    {
        chunk_.functions[index].entry = ip();
        if (chunk_.functions[index].locals > kMaxU16)
        {
            fail_at(fn.span, "function " + std::string(fn.name) + " has too many locals");
            return;
        }

        for (const auto& stmt : fn.body.stmts)
        {
            emit_stmt(stmt);
        }

        // Implicit return (reachable if the body falls off the end).
        emit_constant(Value::unit_v(), fn.span);
        chunk_.emit(OpCode::Ret, fn.span);
    }

    void emit_block(const examkit::parser::Block& block)
    {
        for (const auto& stmt : block.stmts)
        {
            emit_stmt(stmt);
        }
    }

    void emit_stmt(const Stmt& stmt)
    {
        std::visit([&](const auto& node) { emit_stmt_node(node, stmt.span); }, stmt.node);
    }

    void emit_store(std::size_t stmt_id, Span span)
    {
        const auto it = resolution_.slots.find(stmt_id);
        if (it == resolution_.slots.end())
        {
            fail_at(span, "internal error: unresolved binding");
            return;
        }
        chunk_.emit_local(OpCode::StoreLocal, static_cast<std::uint16_t>(it->second), span);
    }

    void emit_stmt_node(const LetStmt& stmt, Span span)
    {
        emit_expr(stmt.value);
        emit_store(stmt.id, span);
    }

    void emit_stmt_node(const AssignStmt& stmt, Span span)
    {
        emit_expr(stmt.value);
        emit_store(stmt.id, span);
    }

    void emit_stmt_node(const ReturnStmt& stmt, Span span)
    {
        if (stmt.value.has_value())
        {
            emit_expr(*stmt.value);
        }
        else
        {
            emit_constant(Value::unit_v(), span);
        }
        chunk_.emit(OpCode::Ret, span);
    }

    void emit_stmt_node(const ExprStmt& stmt, Span span)
    {
        emit_expr(stmt.expr);
        chunk_.emit(OpCode::Pop, span);
    }

    void emit_stmt_node(const BlockStmt& stmt, Span) { emit_block(*stmt.block); }

    void emit_stmt_node(const IfStmt& stmt, Span span)
    {
        emit_expr(stmt.cond);
        const auto else_jump = emit_jump(OpCode::JumpIfFalse, span);
        emit_block(*stmt.then_block);

        if (stmt.else_block == nullptr)
        {
            patch_to_here(else_jump);
            return;
        }

        const auto end_jump = emit_jump(OpCode::Jump, span);
        patch_to_here(else_jump);
        emit_block(*stmt.else_block);
        patch_to_here(end_jump);
    }

    void emit_stmt_node(const WhileStmt& stmt, Span span)
    {
        const auto loop_start = ip();
        emit_expr(stmt.cond);
        const auto exit_jump = emit_jump(OpCode::JumpIfFalse, span);
        emit_block(*stmt.body);
        emit_jump_to(loop_start, span);
        patch_to_here(exit_jump);
    }

    void emit_expr(const Expr& expr)
    {
        std::visit([&](const auto& node) { emit_expr_node(node, expr); }, expr.node);
    }

    void emit_expr_node(const IntExpr& e, const Expr& expr)
    {
        std::int64_t value = 0;
        const auto* begin = e.lexeme.data();
        const auto* end = e.lexeme.data() + e.lexeme.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end)
        {
            fail_at(expr.span, "integer literal out of range");
            return;
        }
        emit_constant(Value::int_v(value), expr.span);
    }

    void emit_expr_node(const FloatExpr& e, const Expr& expr)
    {
        double value = 0.0;
        const auto* begin = e.lexeme.data();
        const auto* end = e.lexeme.data() + e.lexeme.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end)
        {
            fail_at(expr.span, "float literal out of range");
            return;
        }
        emit_constant(Value::float_v(value), expr.span);
    }

    void emit_expr_node(const BoolExpr& e, const Expr& expr)
    {
        emit_constant(Value::bool_v(e.value), expr.span);
    }

    void emit_expr_node(const StringExpr& e, const Expr& expr)
    {
        emit_constant(Value::string_v(examkit::lexer::unescape_string_literal(e.lexeme)),
                      expr.span);
    }

    void emit_expr_node(const NameExpr&, const Expr& expr)
    {
        const auto it = resolution_.names.find(expr.id);
        if (it == resolution_.names.end())
        {
            fail_at(expr.span, "internal error: unresolved name");
            return;
        }

        switch (it->second.kind)
        {
        case BindingKind::Local:
            chunk_.emit_local(OpCode::LoadLocal, static_cast<std::uint16_t>(it->second.index),
                              expr.span);
            return;
        case BindingKind::Constant:
            emit_constant(*symbols_.at(it->second.index).constant, expr.span);
            return;
        case BindingKind::Function:
        case BindingKind::Builtin:
            fail_at(expr.span, "internal error: callable used as a value");
            return;
        }
    }

    void emit_expr_node(const UnaryExpr& e, const Expr& expr)
    {
        emit_expr(*e.rhs);
        chunk_.emit(e.op == TokenKind::Bang ? OpCode::Not : OpCode::Neg, expr.span);
    }

    // `a && b` and `a || b` short-circuit; both operands must be Bool.
    void emit_logical(const BinaryExpr& e, const Expr& expr)
    {
        const bool is_and = e.op == TokenKind::AndAnd;

        emit_expr(*e.lhs);
        const auto lhs_false = emit_jump(OpCode::JumpIfFalse, expr.span);
        if (is_and)
        {
            emit_expr(*e.rhs);
            const auto rhs_false = emit_jump(OpCode::JumpIfFalse, expr.span);
            emit_constant(Value::bool_v(true), expr.span);
            const auto done = emit_jump(OpCode::Jump, expr.span);
            patch_to_here(lhs_false);
            patch_to_here(rhs_false);
            emit_constant(Value::bool_v(false), expr.span);
            patch_to_here(done);
            return;
        }

        emit_constant(Value::bool_v(true), expr.span);
        const auto lhs_done = emit_jump(OpCode::Jump, expr.span);
        patch_to_here(lhs_false);
        emit_expr(*e.rhs);
        const auto rhs_false = emit_jump(OpCode::JumpIfFalse, expr.span);
        emit_constant(Value::bool_v(true), expr.span);
        const auto rhs_done = emit_jump(OpCode::Jump, expr.span);
        patch_to_here(rhs_false);
        emit_constant(Value::bool_v(false), expr.span);
        patch_to_here(lhs_done);
        patch_to_here(rhs_done);
    }

    void emit_expr_node(const BinaryExpr& e, const Expr& expr)
    {
        if (e.op == TokenKind::AndAnd || e.op == TokenKind::OrOr)
        {
            emit_logical(e, expr);
            return;
        }

        emit_expr(*e.lhs);
        emit_expr(*e.rhs);

        switch (e.op)
        {
        case TokenKind::Plus:
            chunk_.emit(OpCode::Add, expr.span);
            return;
        case TokenKind::Minus:
            chunk_.emit(OpCode::Sub, expr.span);
            return;
        case TokenKind::Star:
            chunk_.emit(OpCode::Mul, expr.span);
            return;
        case TokenKind::Slash:
            chunk_.emit(OpCode::Div, expr.span);
            return;
        case TokenKind::Percent:
            chunk_.emit(OpCode::Mod, expr.span);
            return;
        case TokenKind::StarStar:
            chunk_.emit(OpCode::Pow, expr.span);
            return;
        case TokenKind::EqualEqual:
            chunk_.emit(OpCode::Equal, expr.span);
            return;
        case TokenKind::BangEqual:
            chunk_.emit(OpCode::NotEqual, expr.span);
            return;
        case TokenKind::Less:
            chunk_.emit(OpCode::Less, expr.span);
            return;
        case TokenKind::LessEqual:
            chunk_.emit(OpCode::LessEqual, expr.span);
            return;
        case TokenKind::Greater:
            chunk_.emit(OpCode::Greater, expr.span);
            return;
        case TokenKind::GreaterEqual:
            chunk_.emit(OpCode::GreaterEqual, expr.span);
            return;
        default:
            fail_at(expr.span, "unsupported binary operator");
            return;
        }
    }

    void emit_expr_node(const CallExpr& e, const Expr& expr)
    {
        const auto it = resolution_.names.find(e.callee->id);
        if (it == resolution_.names.end())
        {
            fail_at(expr.span, "internal error: unresolved call");
            return;
        }
        if (e.args.size() > std::numeric_limits<std::uint8_t>::max())
        {
            fail_at(expr.span, "too many arguments in call");
            return;
        }

        for (const auto& arg : e.args)
        {
            emit_expr(arg);
        }

        const auto argc = static_cast<std::uint8_t>(e.args.size());
        const auto target = static_cast<std::uint16_t>(it->second.index);
        if (it->second.kind == BindingKind::Function)
        {
            chunk_.emit(OpCode::Call, expr.span);
        }
        else
        {
            chunk_.emit(OpCode::CallBuiltin, expr.span);
        }
        chunk_.emit_u16(target, expr.span);
        chunk_.emit_u8(argc, expr.span);
    }

    void emit_expr_node(const MemberExpr& e, const Expr& expr)
    {
        emit_expr(*e.base);
        const auto key = constant_index(Value::string_v(std::string(e.member)), expr.span);
        chunk_.emit(OpCode::GetField, expr.span);
        chunk_.emit_u16(key, expr.span);
    }

    void emit_expr_node(const GroupExpr& e, const Expr&) { emit_expr(*e.inner); }

    void emit_expr_node(const RecordExpr& e, const Expr& expr)
    {
        if (e.fields.size() > kMaxU16)
        {
            fail_at(expr.span, "record literal has too many fields");
            return;
        }
        for (const auto& f : e.fields)
        {
            emit_constant(Value::string_v(f.key), f.span);
            emit_expr(*f.value);
        }
        chunk_.emit(OpCode::MakeRecord, expr.span);
        chunk_.emit_u16(static_cast<std::uint16_t>(e.fields.size()), expr.span);
    }
};

} // namespace

EmitResult emit_bytecode(const examkit::parser::Program& program,
                         const examkit::resolver::Resolution& resolution,
                         const examkit::runtime::SymbolTable& symbols)
{
    return Emitter(resolution, symbols).run(program);
}

} // namespace examkit::compiler
