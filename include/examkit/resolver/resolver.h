#pragma once

#include <cstddef>
#include <examkit/diag/diagnostic.h>
#include <examkit/parser/ast.h>
#include <examkit/runtime/capabilities.h>
#include <examkit/runtime/symbol_table.h>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

/**
 * @file resolver.h
 * @brief Name resolution API and result types.
 */

namespace examkit::resolver
{

/** @brief What a name refers to. */
enum class BindingKind
{
    Local,    // index: slot in the enclosing function's frame
    Function, // index: position in Program::functions
    Builtin,  // index: SymbolTable entry (callable)
    Constant, // index: SymbolTable entry (constant)
};

struct Binding
{
    BindingKind kind = BindingKind::Local;
    std::size_t index = 0;
};

/** @brief Frame layout of one function; parameters occupy the first slots. */
struct FunctionFrame
{
    std::string_view name;
    std::size_t arity = 0;
    std::size_t slot_count = 0;
};

/**
 * @brief Resolution result.
 *
 * `names` maps the id of every NameExpr (including call targets) to its binding;
 * `slots` maps the id of every LetStmt/AssignStmt to the slot it writes.
 */
struct Resolution
{
    std::unordered_map<std::size_t, Binding> names;
    std::unordered_map<std::size_t, std::size_t> slots;
    std::vector<FunctionFrame> frames; // parallel to Program::functions
};

using ResolveResult = std::variant<Resolution, std::vector<examkit::diag::Diagnostic>>;

/**
 * @brief Resolve names in `program` against the builtins visible under `granted`.
 *
 * Also checks call arity and that functions are only ever called, never used as values.
 */
[[nodiscard]] ResolveResult resolve(const examkit::parser::Program& program,
                                    const examkit::runtime::SymbolTable& symbols,
                                    const examkit::runtime::Capabilities& granted);

} // namespace examkit::resolver
