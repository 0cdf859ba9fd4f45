#include <cassert>
#include <examkit/resolver/resolver.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace examkit::resolver
{
namespace
{

using examkit::diag::Diagnostic;
using examkit::diag::Related;
using examkit::parser::AssignStmt;
using examkit::parser::BinaryExpr;
using examkit::parser::Block;
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
using examkit::source::Span;

std::string quoted(std::string_view name)
{
    return "'" + std::string(name) + "'";
}

std::string count_args(std::size_t n)
{
    return std::to_string(n) + (n == 1 ? " argument" : " arguments");
}

struct LocalDef
{
    std::size_t slot = 0;
    Span span;
};

struct Scope
{
    std::unordered_map<std::string_view, LocalDef> defs;
};

class Resolver
{
  public:
    Resolver(const examkit::runtime::SymbolTable& symbols,
             const examkit::runtime::Capabilities& granted)
        : symbols_(symbols), granted_(granted)
    {
    }

    [[nodiscard]] ResolveResult run(const examkit::parser::Program& program)
    {
        // First pass: declare top-level functions so bodies may call forward.
        for (std::size_t i = 0; i < program.functions.size(); ++i)
        {
            declare_function(program.functions[i], i);
        }

        // Second pass: resolve bodies.
        for (const auto& f : program.functions)
        {
            resolve_function(f);
        }

        if (!diagnostics_.empty())
        {
            return diagnostics_;
        }
        return resolution_;
    }

  private:
    const examkit::runtime::SymbolTable& symbols_;
    const examkit::runtime::Capabilities& granted_;
    Resolution resolution_;
    std::vector<Diagnostic> diagnostics_;

    struct FunctionDef
    {
        std::size_t index = 0;
        std::size_t arity = 0;
        Span span;
    };
    std::unordered_map<std::string_view, FunctionDef> functions_;

    std::vector<Scope> scopes_;
    std::size_t next_slot_ = 0;
    std::size_t max_slot_ = 0;

    void error(Span span, std::string message)
    {
        diagnostics_.push_back(examkit::diag::error_at(span, std::move(message)));
    }

    void declare_function(const Function& f, std::size_t index)
    {
        if (auto it = functions_.find(f.name); it != functions_.end())
        {
            auto d = examkit::diag::error_at(f.name_span, "duplicate function: " + quoted(f.name));
            d.notes.push_back(
                Related{.message = "previous definition is here", .span = it->second.span});
            diagnostics_.push_back(std::move(d));
            return;
        }

        if (symbols_.find_visible(f.name, granted_).has_value())
        {
            error(f.name_span, "function " + quoted(f.name) + " shadows a builtin");
            return;
        }

        functions_.emplace(f.name,
                           FunctionDef{.index = index, .arity = f.params.size(), .span = f.name_span});
    }

    void push_scope() { scopes_.push_back(Scope{}); }
    void pop_scope() { scopes_.pop_back(); }

    [[nodiscard]] std::optional<LocalDef> lookup_local(std::string_view name) const
    {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it)
        {
            auto found = it->defs.find(name);
            if (found != it->defs.end())
            {
                return found->second;
            }
        }
        return std::nullopt;
    }

    std::optional<std::size_t> declare_local(std::string_view name, Span span,
                                             std::string_view kind)
    {
        assert(!scopes_.empty());

        auto& scope = scopes_.back();
        if (auto it = scope.defs.find(name); it != scope.defs.end())
        {
            auto d = examkit::diag::error_at(span, std::string(kind) + ": " + quoted(name));
            d.notes.push_back(
                Related{.message = "previous definition is here", .span = it->second.span});
            diagnostics_.push_back(std::move(d));
            return std::nullopt;
        }

        const std::size_t slot = next_slot_++;
        if (next_slot_ > max_slot_)
        {
            max_slot_ = next_slot_;
        }
        scope.defs.emplace(name, LocalDef{.slot = slot, .span = span});
        return slot;
    }

    void resolve_function(const Function& f)
    {
        scopes_.clear();
        next_slot_ = 0;
        max_slot_ = 0;

        // Params and top-level body statements share the function scope.
        push_scope();
        for (const auto& p : f.params)
        {
            (void)declare_local(p.name, p.span, "duplicate parameter");
        }
        for (const auto& s : f.body.stmts)
        {
            resolve_stmt(s);
        }
        pop_scope();

        resolution_.frames.push_back(FunctionFrame{
            .name = f.name, .arity = f.params.size(), .slot_count = max_slot_});
    }

    void resolve_block(const Block& block)
    {
        // Slots of a finished block are not reused; frames stay small enough for snippets.
        push_scope();
        for (const auto& s : block.stmts)
        {
            resolve_stmt(s);
        }
        pop_scope();
    }

    void resolve_stmt(const Stmt& s)
    {
        std::visit([&](const auto& node) { resolve_stmt_node(node); }, s.node);
    }

    void resolve_stmt_node(const LetStmt& s)
    {
        // The initializer sees the outer binding: `let x = x + 1;` in a nested block.
        resolve_expr(s.value);
        if (const auto slot = declare_local(s.name, s.name_span, "duplicate definition"))
        {
            resolution_.slots.emplace(s.id, *slot);
        }
    }

    void resolve_stmt_node(const AssignStmt& s)
    {
        resolve_expr(s.value);
        if (const auto local = lookup_local(s.name))
        {
            resolution_.slots.emplace(s.id, local->slot);
            return;
        }
        if (functions_.contains(s.name) || symbols_.find_visible(s.name, granted_).has_value())
        {
            error(s.name_span, "cannot assign to " + quoted(s.name) + "; it is not a variable");
            return;
        }
        error(s.name_span, "assignment to undeclared variable " + quoted(s.name));
    }

    void resolve_stmt_node(const ReturnStmt& s)
    {
        if (s.value.has_value())
        {
            resolve_expr(*s.value);
        }
    }

    void resolve_stmt_node(const ExprStmt& s) { resolve_expr(s.expr); }

    void resolve_stmt_node(const BlockStmt& s) { resolve_block(*s.block); }

    void resolve_stmt_node(const IfStmt& s)
    {
        resolve_expr(s.cond);
        resolve_block(*s.then_block);
        if (s.else_block != nullptr)
        {
            resolve_block(*s.else_block);
        }
    }

    void resolve_stmt_node(const WhileStmt& s)
    {
        resolve_expr(s.cond);
        resolve_block(*s.body);
    }

    void resolve_expr(const Expr& expr)
    {
        std::visit([&](const auto& node) { resolve_expr_node(node, expr); }, expr.node);
    }

    void resolve_expr_node(const IntExpr&, const Expr&) {}
    void resolve_expr_node(const FloatExpr&, const Expr&) {}
    void resolve_expr_node(const BoolExpr&, const Expr&) {}
    void resolve_expr_node(const StringExpr&, const Expr&) {}

    void resolve_expr_node(const NameExpr& e, const Expr& expr)
    {
        if (const auto local = lookup_local(e.name))
        {
            resolution_.names.emplace(expr.id,
                                      Binding{.kind = BindingKind::Local, .index = local->slot});
            return;
        }

        if (functions_.contains(e.name))
        {
            error(expr.span, "function " + quoted(e.name) + " cannot be used as a value");
            return;
        }

        if (const auto index = symbols_.find_visible(e.name, granted_))
        {
            if (!symbols_.at(*index).is_constant())
            {
                error(expr.span, "builtin " + quoted(e.name) + " cannot be used as a value");
                return;
            }
            resolution_.names.emplace(expr.id,
                                      Binding{.kind = BindingKind::Constant, .index = *index});
            return;
        }

        error(expr.span, "unknown name " + quoted(e.name));
    }

    void resolve_expr_node(const UnaryExpr& e, const Expr&) { resolve_expr(*e.rhs); }

    void resolve_expr_node(const BinaryExpr& e, const Expr&)
    {
        resolve_expr(*e.lhs);
        resolve_expr(*e.rhs);
    }

    void resolve_expr_node(const CallExpr& e, const Expr& expr)
    {
        for (const auto& arg : e.args)
        {
            resolve_expr(arg);
        }

        const auto* callee = std::get_if<NameExpr>(&e.callee->node);
        if (callee == nullptr)
        {
            resolve_expr(*e.callee);
            error(e.callee->span, "only named functions can be called");
            return;
        }

        const std::size_t argc = e.args.size();

        if (lookup_local(callee->name).has_value())
        {
            error(e.callee->span, quoted(callee->name) + " is a variable, not a function");
            return;
        }

        if (auto it = functions_.find(callee->name); it != functions_.end())
        {
            if (it->second.arity != argc)
            {
                error(expr.span, "function " + quoted(callee->name) + " expects " +
                                     count_args(it->second.arity) + ", got " +
                                     std::to_string(argc));
                return;
            }
            resolution_.names.emplace(
                e.callee->id, Binding{.kind = BindingKind::Function, .index = it->second.index});
            return;
        }

        if (const auto index = symbols_.find_visible(callee->name, granted_))
        {
            const auto& symbol = symbols_.at(*index);
            if (symbol.is_constant())
            {
                error(e.callee->span, quoted(callee->name) + " is a constant, not a function");
                return;
            }
            if (!symbol.accepts(argc))
            {
                error(expr.span, "builtin " + quoted(callee->name) + " expects " +
                                     examkit::runtime::describe_arity(symbol) + ", got " +
                                     std::to_string(argc));
                return;
            }
            resolution_.names.emplace(e.callee->id,
                                      Binding{.kind = BindingKind::Builtin, .index = *index});
            return;
        }

        error(e.callee->span, "unknown name " + quoted(callee->name));
    }

    void resolve_expr_node(const MemberExpr& e, const Expr&) { resolve_expr(*e.base); }

    void resolve_expr_node(const GroupExpr& e, const Expr&) { resolve_expr(*e.inner); }

    void resolve_expr_node(const RecordExpr& e, const Expr&)
    {
        for (const auto& f : e.fields)
        {
            resolve_expr(*f.value);
        }
    }
};

} // namespace

ResolveResult resolve(const examkit::parser::Program& program,
                      const examkit::runtime::SymbolTable& symbols,
                      const examkit::runtime::Capabilities& granted)
{
    return Resolver(symbols, granted).run(program);
}

} // namespace examkit::resolver
