#include <cstdlib>
#include <examkit/runtime/symbol_table.h>
#include <examkit/units/units.h>
#include <iostream>
#include <string>
#include <vector>

using examkit::units::Dimension;
using examkit::units::UnitError;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static Dimension dimension_or_fail(const std::string& text)
{
    auto res = examkit::units::parse_dimension(text);
    if (auto* err = std::get_if<UnitError>(&res))
    {
        fail("parse_dimension('" + text + "') failed: " + err->message);
    }
    return std::get<Dimension>(res);
}

static void expect_dimension(const std::string& text, const std::string& expected)
{
    const std::string got = examkit::units::format_dimension(dimension_or_fail(text));
    if (got != expected)
    {
        fail("dimension of '" + text + "': expected '" + expected + "', got '" + got + "'");
    }
}

static void expect_compatible(const std::string& value, const std::string& units, bool expected)
{
    const auto res = examkit::units::compatible(value, units);
    if (const auto* err = std::get_if<UnitError>(&res))
    {
        fail("compatible('" + value + "', '" + units + "') failed: " + err->message);
    }
    if (std::get<bool>(res) != expected)
    {
        fail("compatible('" + value + "', '" + units + "') expected " +
             (expected ? "true" : "false"));
    }
}

static void expect_error(const std::string& text, const std::string& message)
{
    const auto res = examkit::units::parse_dimension(text);
    const auto* err = std::get_if<UnitError>(&res);
    if (err == nullptr)
    {
        fail("expected parse_dimension('" + text + "') to fail");
    }
    if (err->message != message)
    {
        fail("parse_dimension('" + text + "'): expected '" + message + "', got '" +
             err->message + "'");
    }
}

int main()
{
    // base and derived units
    {
        expect_dimension("m", "[length]");
        expect_dimension("kg", "[mass]");
        expect_dimension("9.8 meter/second**2", "[length] / [time] ** 2");
        expect_dimension("N", "[length] * [mass] / [time] ** 2");
        expect_dimension("Hz", "1 / [time]");
        expect_dimension("J / (kg K)", "[length] ** 2 / [time] ** 2 * [temperature]");
        expect_dimension("42", "dimensionless");
        expect_dimension("rad", "dimensionless");
        expect_dimension("-3.5e2 mol", "[substance]");
    }

    // prefixes, plurals and spellings
    {
        expect_compatible("3 km", "m", true);
        expect_compatible("12 ms", "s", true);
        expect_compatible("5 kilometers", "meter", true);
        expect_compatible("2 hours", "s", true);
        expect_compatible("6 feet", "m", true);
        expect_compatible("250 mA", "A", true);
        expect_compatible("1.2 kWh", "J", true);
        expect_compatible("3 min", "s", true);
        expect_compatible("10 mph", "m/s", true);
    }

    // operators
    {
        expect_compatible("9.8 m/s^2", "meter/second**2", true);
        expect_compatible("9.8 m s**-2", "m/s**2", true);
        expect_compatible("2 kg m / s**(2)", "N", true);
        expect_compatible("1 N m", "J", true);
        expect_compatible("1 W s", "J", true);
        expect_compatible("(m/s) / s", "m/s**2", true);
    }

    // incompatible pairs
    {
        expect_compatible("9.8 m/s", "m/s**2", false);
        expect_compatible("3 kg", "N", false);
        expect_compatible("5", "m", false);
    }

    // errors
    {
        expect_error("3 furlongs", "unknown unit 'furlongs'");
        expect_error("", "empty unit expression");
        expect_error("m ** x", "unsupported exponent in unit expression 'm ** x'");
        expect_error("m ** 99", "unsupported exponent in unit expression 'm ** 99'");
        expect_error("(m / s", "expected ')' in unit expression '(m / s'");
        expect_error("m )", "unexpected ')' in unit expression 'm )'");

        // Unprefixable units do not take SI prefixes.
        expect_error("kmin", "unknown unit 'kmin'");

        expect_dimension(std::string(100, '(') + "m / s" + std::string(100, ')'),
                         "[length] / [time]");
        expect_error(std::string(5000, '(') + "m" + std::string(5000, ')'),
                     "unit expression nested too deeply");
    }

    // units_compatible builtin
    {
        using examkit::vm::Value;
        const auto& table = examkit::runtime::standard_symbols();
        const auto index = table.find("units_compatible");
        if (!index.has_value())
        {
            fail("units_compatible is not registered");
        }
        const auto& symbol = table.at(*index);
        if (symbol.capability != examkit::runtime::kCapUnits)
        {
            fail("units_compatible must require the units capability");
        }

        const std::vector<Value> args{Value::string_v("9.8 meter/second**2"),
                                      Value::string_v("meter/second**2")};
        auto res = symbol.fn(args, examkit::runtime::BuiltinContext{});
        if (!std::holds_alternative<Value>(res) || !(std::get<Value>(res) == Value::bool_v(true)))
        {
            fail("expected units_compatible to return true");
        }

        const std::vector<Value> unknown{Value::string_v("3 furlongs"), Value::string_v("m")};
        res = symbol.fn(unknown, examkit::runtime::BuiltinContext{});
        if (!std::holds_alternative<examkit::runtime::BuiltinError>(res) ||
            std::get<examkit::runtime::BuiltinError>(res).message !=
                "units_compatible: unknown unit 'furlongs'")
        {
            fail("expected units_compatible to report the unknown unit");
        }

        const std::vector<Value> bad{Value::float_v(9.8), Value::string_v("m")};
        res = symbol.fn(bad, examkit::runtime::BuiltinContext{});
        if (!std::holds_alternative<examkit::runtime::BuiltinError>(res) ||
            std::get<examkit::runtime::BuiltinError>(res).message !=
                "units_compatible() expects unit strings, got float")
        {
            fail("expected units_compatible to reject non-strings");
        }
    }

    std::cout << "OK\n";
    return 0;
}
