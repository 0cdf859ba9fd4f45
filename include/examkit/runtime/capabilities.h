#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

/**
 * @file capabilities.h
 * @brief Named groups of builtins a sandbox policy may grant.
 */

namespace examkit::runtime
{

/** @brief Plain arithmetic, conversion, formatting and record helpers. */
inline constexpr std::string_view kCapCore = "core";
/** @brief Elementary functions (`sqrt`, `log`, trig) and the constants `pi`, `e`. */
inline constexpr std::string_view kCapMath = "math";
/** @brief `sym_equal`, backed by the SMT solver. */
inline constexpr std::string_view kCapSymbolic = "symbolic";
/** @brief `units_compatible`. */
inline constexpr std::string_view kCapUnits = "units";

/**
 * @brief Capabilities are explicit permissions granted by the host (e.g. CLI).
 *
 * Symbols whose capability is not in the set are invisible to snippets.
 */
using Capabilities = std::unordered_set<std::string>;

/** @brief All four capabilities; the default for sandbox policies. */
[[nodiscard]] Capabilities default_capabilities();

[[nodiscard]] bool is_known_capability(std::string_view name);

} // namespace examkit::runtime
