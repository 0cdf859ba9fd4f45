#include <examkit/runtime/symbol_table.h>
#include <examkit/symbolic/equivalence.h>
#include <examkit/units/units.h>
#include <utility>

namespace examkit::runtime
{

Capabilities default_capabilities()
{
    return Capabilities{std::string(kCapCore), std::string(kCapMath), std::string(kCapSymbolic),
                        std::string(kCapUnits)};
}

bool is_known_capability(std::string_view name)
{
    return name == kCapCore || name == kCapMath || name == kCapSymbolic || name == kCapUnits;
}

std::size_t SymbolTable::add(Symbol symbol)
{
    const std::size_t index = symbols_.size();
    by_name_[symbol.name] = index;
    symbols_.push_back(std::move(symbol));
    return index;
}

std::size_t SymbolTable::add_function(std::string name, std::string_view capability,
                                      std::size_t min_arity,
                                      std::optional<std::size_t> max_arity, BuiltinFn fn)
{
    Symbol symbol;
    symbol.name = std::move(name);
    symbol.capability = std::string(capability);
    symbol.min_arity = min_arity;
    symbol.max_arity = max_arity;
    symbol.fn = std::move(fn);
    return add(std::move(symbol));
}

std::size_t SymbolTable::add_constant(std::string name, std::string_view capability,
                                      examkit::vm::Value value)
{
    Symbol symbol;
    symbol.name = std::move(name);
    symbol.capability = std::string(capability);
    symbol.constant = std::move(value);
    return add(std::move(symbol));
}

std::optional<std::size_t> SymbolTable::find(std::string_view name) const
{
    const auto it = by_name_.find(std::string(name));
    if (it == by_name_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::size_t> SymbolTable::find_visible(std::string_view name,
                                                     const Capabilities& granted) const
{
    const auto index = find(name);
    if (!index.has_value() || !granted.contains(symbols_[*index].capability))
    {
        return std::nullopt;
    }
    return index;
}

const SymbolTable& standard_symbols()
{
    static const SymbolTable table = []
    {
        SymbolTable t;
        register_core_builtins(t);
        register_math_builtins(t);
        examkit::symbolic::register_builtins(t);
        examkit::units::register_builtins(t);
        return t;
    }();
    return table;
}

std::string describe_arity(const Symbol& symbol)
{
    auto plural = [](std::size_t n)
    { return std::to_string(n) + (n == 1 ? " argument" : " arguments"); };

    if (!symbol.max_arity.has_value())
    {
        return "at least " + plural(symbol.min_arity);
    }
    if (*symbol.max_arity == symbol.min_arity)
    {
        return plural(symbol.min_arity);
    }
    return std::to_string(symbol.min_arity) + " to " + plural(*symbol.max_arity);
}

} // namespace examkit::runtime
