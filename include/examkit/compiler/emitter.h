#pragma once

#include <examkit/diag/diagnostic.h>
#include <examkit/parser/ast.h>
#include <examkit/resolver/resolver.h>
#include <examkit/runtime/symbol_table.h>
#include <examkit/vm/bytecode.h>
#include <variant>
#include <vector>

/**
 * @file emitter.h
 * @brief Bytecode emission from a resolved AST.
 */

namespace examkit::compiler
{

/** @brief Result of emitting bytecode: a Chunk or diagnostics. */
using EmitResult = std::variant<examkit::vm::Chunk, std::vector<examkit::diag::Diagnostic>>;

/**
 * @brief Emit one chunk holding every function of `program`.
 *
 * The chunk's function table is parallel to Program::functions. Every function ends in
 * an implicit `return ();`.
 */
[[nodiscard]] EmitResult emit_bytecode(const examkit::parser::Program& program,
                                       const examkit::resolver::Resolution& resolution,
                                       const examkit::runtime::SymbolTable& symbols);

} // namespace examkit::compiler
