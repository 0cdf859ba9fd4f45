#include <cmath>
#include <cstdint>
#include <examkit/runtime/symbol_table.h>
#include <numbers>
#include <string>

namespace examkit::runtime
{
namespace
{

using examkit::vm::Value;
using examkit::vm::ValueKind;
using Args = std::span<const Value>;

const BuiltinError kDomainError{"math domain error"};
const BuiltinError kRangeError{"math range error"};

BuiltinError not_a_number(std::string_view fn, const Value& got)
{
    return BuiltinError{std::string(fn) + "() expects a number, got " +
                        std::string(examkit::vm::kind_name(got.kind))};
}

// Wraps a unary double function with argument checking and an optional domain guard.
template <typename Fn, typename Domain>
BuiltinFn unary(std::string_view name, Fn fn, Domain in_domain)
{
    return [name, fn, in_domain](Args args, const BuiltinContext&) -> BuiltinResult
    {
        if (!args[0].is_number())
        {
            return not_a_number(name, args[0]);
        }
        const double x = args[0].as_double();
        if (!in_domain(x))
        {
            return kDomainError;
        }
        const double r = fn(x);
        if (std::isinf(r) && std::isfinite(x))
        {
            return kRangeError;
        }
        return Value::float_v(r);
    };
}

bool anything(double)
{
    return true;
}

BuiltinResult rounding(std::string_view name, Args args, double (*fn)(double))
{
    const Value& x = args[0];
    if (x.kind == ValueKind::Int)
    {
        return x;
    }
    if (x.kind != ValueKind::Float)
    {
        return not_a_number(name, x);
    }
    const double r = fn(x.float_value);
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(r) || r >= kLimit || r < -kLimit)
    {
        return BuiltinError{"cannot convert float " + examkit::vm::format_float(r) + " to int"};
    }
    return Value::int_v(static_cast<std::int64_t>(r));
}

BuiltinResult builtin_pow(Args args, const BuiltinContext&)
{
    for (const Value& v : args)
    {
        if (!v.is_number())
        {
            return not_a_number("pow", v);
        }
    }
    const double x = args[0].as_double();
    const double y = args[1].as_double();
    if (x == 0.0 && y < 0.0)
    {
        return kDomainError;
    }
    if (x < 0.0 && std::isfinite(y) && std::trunc(y) != y)
    {
        return kDomainError;
    }
    const double r = std::pow(x, y);
    if (std::isinf(r) && std::isfinite(x) && std::isfinite(y))
    {
        return kRangeError;
    }
    return Value::float_v(r);
}

BuiltinResult builtin_log(Args args, const BuiltinContext&)
{
    for (const Value& v : args)
    {
        if (!v.is_number())
        {
            return not_a_number("log", v);
        }
    }
    const double x = args[0].as_double();
    if (x <= 0.0)
    {
        return kDomainError;
    }
    if (args.size() == 1)
    {
        return Value::float_v(std::log(x));
    }
    const double base = args[1].as_double();
    if (base <= 0.0 || base == 1.0)
    {
        return kDomainError;
    }
    return Value::float_v(std::log(x) / std::log(base));
}

BuiltinResult builtin_atan2(Args args, const BuiltinContext&)
{
    for (const Value& v : args)
    {
        if (!v.is_number())
        {
            return not_a_number("atan2", v);
        }
    }
    return Value::float_v(std::atan2(args[0].as_double(), args[1].as_double()));
}

BuiltinResult builtin_hypot(Args args, const BuiltinContext&)
{
    double total = 0.0;
    for (const Value& v : args)
    {
        if (!v.is_number())
        {
            return not_a_number("hypot", v);
        }
        total = std::hypot(total, v.as_double());
    }
    return Value::float_v(total);
}

} // namespace

void register_math_builtins(SymbolTable& table)
{
    table.add_function("sqrt", kCapMath, 1, 1,
                       unary("sqrt", [](double x) { return std::sqrt(x); },
                             [](double x) { return x >= 0.0; }));
    table.add_function("pow", kCapMath, 2, 2, builtin_pow);
    table.add_function("exp", kCapMath, 1, 1,
                       unary("exp", [](double x) { return std::exp(x); }, anything));
    table.add_function("log", kCapMath, 1, 2, builtin_log);
    table.add_function("log10", kCapMath, 1, 1,
                       unary("log10", [](double x) { return std::log10(x); },
                             [](double x) { return x > 0.0; }));
    table.add_function("sin", kCapMath, 1, 1,
                       unary("sin", [](double x) { return std::sin(x); }, anything));
    table.add_function("cos", kCapMath, 1, 1,
                       unary("cos", [](double x) { return std::cos(x); }, anything));
    table.add_function("tan", kCapMath, 1, 1,
                       unary("tan", [](double x) { return std::tan(x); }, anything));
    table.add_function("asin", kCapMath, 1, 1,
                       unary("asin", [](double x) { return std::asin(x); },
                             [](double x) { return x >= -1.0 && x <= 1.0; }));
    table.add_function("acos", kCapMath, 1, 1,
                       unary("acos", [](double x) { return std::acos(x); },
                             [](double x) { return x >= -1.0 && x <= 1.0; }));
    table.add_function("atan", kCapMath, 1, 1,
                       unary("atan", [](double x) { return std::atan(x); }, anything));
    table.add_function("atan2", kCapMath, 2, 2, builtin_atan2);
    table.add_function("floor", kCapMath, 1, 1,
                       [](Args args, const BuiltinContext&)
                       { return rounding("floor", args, [](double x) { return std::floor(x); }); });
    table.add_function("ceil", kCapMath, 1, 1,
                       [](Args args, const BuiltinContext&)
                       { return rounding("ceil", args, [](double x) { return std::ceil(x); }); });
    table.add_function("hypot", kCapMath, 1, std::nullopt, builtin_hypot);

    table.add_constant("pi", kCapMath, Value::float_v(std::numbers::pi));
    table.add_constant("e", kCapMath, Value::float_v(std::numbers::e));
}

} // namespace examkit::runtime
