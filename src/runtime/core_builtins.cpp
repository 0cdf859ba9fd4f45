#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <examkit/runtime/symbol_table.h>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace examkit::runtime
{
namespace
{

using examkit::vm::Value;
using examkit::vm::ValueKind;
using Args = std::span<const Value>;

BuiltinError type_error(std::string_view fn, std::string_view expected, const Value& got)
{
    return BuiltinError{std::string(fn) + "() expects " + std::string(expected) + ", got " +
                        std::string(examkit::vm::kind_name(got.kind))};
}

BuiltinResult checked_string(std::string s, const BuiltinContext& ctx)
{
    if (s.size() > ctx.max_string_bytes)
    {
        return BuiltinError{"string exceeds maximum size of " +
                            std::to_string(ctx.max_string_bytes) + " bytes"};
    }
    return Value::string_v(std::move(s));
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0)
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0)
    {
        s.remove_suffix(1);
    }
    return s;
}

// Converts a finite double to Int, failing outside the int64 range.
std::optional<std::int64_t> to_int64(double value)
{
    if (!std::isfinite(value))
    {
        return std::nullopt;
    }
    // 2^63 is exactly representable; anything at or above it overflows.
    constexpr double kLimit = 9223372036854775808.0;
    if (value >= kLimit || value < -kLimit)
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

BuiltinResult builtin_str(Args args, const BuiltinContext& ctx)
{
    return checked_string(examkit::vm::to_string(args[0]), ctx);
}

BuiltinResult builtin_float(Args args, const BuiltinContext&)
{
    const Value& v = args[0];
    switch (v.kind)
    {
    case ValueKind::Int:
    case ValueKind::Float:
        return Value::float_v(v.as_double());
    case ValueKind::Bool:
        return Value::float_v(v.bool_value ? 1.0 : 0.0);
    case ValueKind::String:
    {
        std::string_view text = trim(v.string_value);
        if (!text.empty() && text.front() == '+')
        {
            text.remove_prefix(1);
        }
        double out = 0.0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        {
            return BuiltinError{"could not convert string to float: '" + v.string_value + "'"};
        }
        return Value::float_v(out);
    }
    default:
        return type_error("float", "a number, bool or string", v);
    }
}

BuiltinResult builtin_int(Args args, const BuiltinContext&)
{
    const Value& v = args[0];
    switch (v.kind)
    {
    case ValueKind::Int:
        return v;
    case ValueKind::Bool:
        return Value::int_v(v.bool_value ? 1 : 0);
    case ValueKind::Float:
    {
        const auto out = to_int64(std::trunc(v.float_value));
        if (!out.has_value())
        {
            return BuiltinError{"cannot convert float " + examkit::vm::format_float(v.float_value) +
                                " to int"};
        }
        return Value::int_v(*out);
    }
    case ValueKind::String:
    {
        std::string_view text = trim(v.string_value);
        if (!text.empty() && text.front() == '+')
        {
            text.remove_prefix(1);
        }
        std::int64_t out = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        {
            return BuiltinError{"invalid literal for int(): '" + v.string_value + "'"};
        }
        return Value::int_v(out);
    }
    default:
        return type_error("int", "a number, bool or string", v);
    }
}

// round(x) rounds half to even and yields Int; round(x, n) keeps x's kind.
BuiltinResult builtin_round(Args args, const BuiltinContext&)
{
    const Value& x = args[0];
    if (!x.is_number())
    {
        return type_error("round", "a number", x);
    }

    if (args.size() == 1)
    {
        if (x.kind == ValueKind::Int)
        {
            return x;
        }
        const auto out = to_int64(std::nearbyint(x.float_value));
        if (!out.has_value())
        {
            return BuiltinError{"cannot round " + examkit::vm::format_float(x.float_value) +
                                " to int"};
        }
        return Value::int_v(*out);
    }

    const Value& digits = args[1];
    if (digits.kind != ValueKind::Int)
    {
        return type_error("round", "an int digit count", digits);
    }

    if (x.kind == ValueKind::Int)
    {
        if (digits.int_value >= 0)
        {
            return x;
        }
        if (digits.int_value < -18)
        {
            return Value::int_v(0);
        }
        const double scale = std::pow(10.0, static_cast<double>(-digits.int_value));
        const auto out = to_int64(std::nearbyint(static_cast<double>(x.int_value) / scale) * scale);
        if (!out.has_value())
        {
            return BuiltinError{"integer overflow in round()"};
        }
        return Value::int_v(*out);
    }

    const double scale = std::pow(10.0, static_cast<double>(digits.int_value));
    const double scaled = x.float_value * scale;
    if (!std::isfinite(scaled) || scale == 0.0)
    {
        return x;
    }
    return Value::float_v(std::nearbyint(scaled) / scale);
}

BuiltinResult builtin_abs(Args args, const BuiltinContext&)
{
    const Value& x = args[0];
    if (x.kind == ValueKind::Int)
    {
        if (x.int_value == std::numeric_limits<std::int64_t>::min())
        {
            return BuiltinError{"integer overflow in abs()"};
        }
        return Value::int_v(x.int_value < 0 ? -x.int_value : x.int_value);
    }
    if (x.kind == ValueKind::Float)
    {
        return Value::float_v(std::fabs(x.float_value));
    }
    return type_error("abs", "a number", x);
}

bool less_than(const Value& a, const Value& b)
{
    if (a.kind == ValueKind::Int && b.kind == ValueKind::Int)
    {
        return a.int_value < b.int_value;
    }
    if (a.is_number() && b.is_number())
    {
        return a.as_double() < b.as_double();
    }
    return a.string_value < b.string_value;
}

BuiltinResult pick_extreme(std::string_view name, Args args, bool want_max)
{
    const bool numbers = args[0].is_number();
    for (const Value& v : args)
    {
        const bool ok = numbers ? v.is_number() : v.kind == ValueKind::String;
        if (!ok)
        {
            return type_error(name, numbers ? "numbers" : "strings", v);
        }
    }

    const Value* best = &args[0];
    for (const Value& v : args.subspan(1))
    {
        if (want_max ? less_than(*best, v) : less_than(v, *best))
        {
            best = &v;
        }
    }
    return *best;
}

BuiltinResult builtin_min(Args args, const BuiltinContext&)
{
    return pick_extreme("min", args, false);
}

BuiltinResult builtin_max(Args args, const BuiltinContext&)
{
    return pick_extreme("max", args, true);
}

BuiltinResult builtin_sum(Args args, const BuiltinContext&)
{
    std::int64_t int_total = 0;
    double float_total = 0.0;
    bool is_float = false;
    for (const Value& v : args)
    {
        if (!v.is_number())
        {
            return type_error("sum", "numbers", v);
        }
        if (!is_float && v.kind == ValueKind::Int)
        {
            if (__builtin_add_overflow(int_total, v.int_value, &int_total))
            {
                return BuiltinError{"integer overflow in sum()"};
            }
            continue;
        }
        if (!is_float)
        {
            is_float = true;
            float_total = static_cast<double>(int_total);
        }
        float_total += v.as_double();
    }
    return is_float ? Value::float_v(float_total) : Value::int_v(int_total);
}

BuiltinResult builtin_len(Args args, const BuiltinContext&)
{
    const Value& v = args[0];
    if (v.kind == ValueKind::String)
    {
        return Value::int_v(static_cast<std::int64_t>(v.string_value.size()));
    }
    if (v.kind == ValueKind::Record)
    {
        return Value::int_v(static_cast<std::int64_t>(v.record_value->fields.size()));
    }
    return type_error("len", "a string or record", v);
}

BuiltinResult format_number(std::string_view name, Args args, const BuiltinContext& ctx,
                            bool scientific)
{
    const Value& x = args[0];
    const Value& digits = args[1];
    if (!x.is_number())
    {
        return type_error(name, "a number", x);
    }
    if (digits.kind != ValueKind::Int)
    {
        return type_error(name, "an int digit count", digits);
    }
    if (digits.int_value < 0 || digits.int_value > 30)
    {
        return BuiltinError{std::string(name) + "() digit count must be between 0 and 30"};
    }

    std::ostringstream out;
    out << (scientific ? std::scientific : std::fixed)
        << std::setprecision(static_cast<int>(digits.int_value)) << x.as_double();
    return checked_string(out.str(), ctx);
}

BuiltinResult builtin_fmt(Args args, const BuiltinContext& ctx)
{
    return format_number("fmt", args, ctx, false);
}

BuiltinResult builtin_sci(Args args, const BuiltinContext& ctx)
{
    return format_number("sci", args, ctx, true);
}

BuiltinResult builtin_get(Args args, const BuiltinContext&)
{
    if (args[0].kind != ValueKind::Record)
    {
        return type_error("get", "a record", args[0]);
    }
    if (args[1].kind != ValueKind::String)
    {
        return type_error("get", "a string key", args[1]);
    }
    if (const Value* found = args[0].record_value->find(args[1].string_value))
    {
        return *found;
    }
    return args[2];
}

BuiltinResult builtin_has(Args args, const BuiltinContext&)
{
    if (args[0].kind != ValueKind::Record)
    {
        return type_error("has", "a record", args[0]);
    }
    if (args[1].kind != ValueKind::String)
    {
        return type_error("has", "a string key", args[1]);
    }
    return Value::bool_v(args[0].record_value->find(args[1].string_value) != nullptr);
}

BuiltinResult builtin_fail(Args args, const BuiltinContext&)
{
    return BuiltinError{examkit::vm::to_string(args[0])};
}

BuiltinResult map_case(std::string_view name, Args args, bool upper)
{
    if (args[0].kind != ValueKind::String)
    {
        return type_error(name, "a string", args[0]);
    }
    std::string out = args[0].string_value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [upper](char c)
                   {
                       const auto uc = static_cast<unsigned char>(c);
                       return static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
                   });
    return Value::string_v(std::move(out));
}

BuiltinResult builtin_lower(Args args, const BuiltinContext&)
{
    return map_case("lower", args, false);
}

BuiltinResult builtin_upper(Args args, const BuiltinContext&)
{
    return map_case("upper", args, true);
}

} // namespace

void register_core_builtins(SymbolTable& table)
{
    table.add_function("str", kCapCore, 1, 1, builtin_str);
    table.add_function("float", kCapCore, 1, 1, builtin_float);
    table.add_function("int", kCapCore, 1, 1, builtin_int);
    table.add_function("round", kCapCore, 1, 2, builtin_round);
    table.add_function("abs", kCapCore, 1, 1, builtin_abs);
    table.add_function("min", kCapCore, 1, std::nullopt, builtin_min);
    table.add_function("max", kCapCore, 1, std::nullopt, builtin_max);
    table.add_function("sum", kCapCore, 0, std::nullopt, builtin_sum);
    table.add_function("len", kCapCore, 1, 1, builtin_len);
    table.add_function("fmt", kCapCore, 2, 2, builtin_fmt);
    table.add_function("sci", kCapCore, 2, 2, builtin_sci);
    table.add_function("get", kCapCore, 3, 3, builtin_get);
    table.add_function("has", kCapCore, 2, 2, builtin_has);
    table.add_function("fail", kCapCore, 1, 1, builtin_fail);
    table.add_function("lower", kCapCore, 1, 1, builtin_lower);
    table.add_function("upper", kCapCore, 1, 1, builtin_upper);
}

} // namespace examkit::runtime
