#include <examkit/lexer/lexer.h>
#include <examkit/units/units.h>
#include <initializer_list>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace examkit::units
{
namespace
{

using examkit::lexer::Token;
using examkit::lexer::TokenKind;
using examkit::vm::Value;
using examkit::vm::ValueKind;

constexpr int kMaxUnitExponent = 32;

struct UnitDef
{
    Dimension dimension{};
    bool prefixable = false;
};

//                                    L  M  T  I  Θ  N  J
constexpr Dimension kDimensionless = {0, 0, 0, 0, 0, 0, 0};
constexpr Dimension kLength = {1, 0, 0, 0, 0, 0, 0};
constexpr Dimension kMass = {0, 1, 0, 0, 0, 0, 0};
constexpr Dimension kTime = {0, 0, 1, 0, 0, 0, 0};
constexpr Dimension kCurrent = {0, 0, 0, 1, 0, 0, 0};
constexpr Dimension kTemperature = {0, 0, 0, 0, 1, 0, 0};
constexpr Dimension kAmount = {0, 0, 0, 0, 0, 1, 0};
constexpr Dimension kLuminosity = {0, 0, 0, 0, 0, 0, 1};
constexpr Dimension kFrequency = {0, 0, -1, 0, 0, 0, 0};
constexpr Dimension kVelocity = {1, 0, -1, 0, 0, 0, 0};
constexpr Dimension kForce = {1, 1, -2, 0, 0, 0, 0};
constexpr Dimension kPressure = {-1, 1, -2, 0, 0, 0, 0};
constexpr Dimension kEnergy = {2, 1, -2, 0, 0, 0, 0};
constexpr Dimension kPower = {2, 1, -3, 0, 0, 0, 0};
constexpr Dimension kCharge = {0, 0, 1, 1, 0, 0, 0};
constexpr Dimension kVoltage = {2, 1, -3, -1, 0, 0, 0};
constexpr Dimension kCapacitance = {-2, -1, 4, 2, 0, 0, 0};
constexpr Dimension kResistance = {2, 1, -3, -2, 0, 0, 0};
constexpr Dimension kConductance = {-2, -1, 3, 2, 0, 0, 0};
constexpr Dimension kMagneticFlux = {2, 1, -2, -1, 0, 0, 0};
constexpr Dimension kFluxDensity = {0, 1, -2, -1, 0, 0, 0};
constexpr Dimension kInductance = {2, 1, -2, -2, 0, 0, 0};
constexpr Dimension kVolume = {3, 0, 0, 0, 0, 0, 0};
constexpr Dimension kArea = {2, 0, 0, 0, 0, 0, 0};

struct Prefix
{
    std::string_view text;
    bool is_symbol;
};

constexpr std::array<Prefix, 40> kPrefixes = {{
    {"yotta", false}, {"zetta", false}, {"exa", false},   {"peta", false},  {"tera", false},
    {"giga", false},  {"mega", false},  {"kilo", false},  {"hecto", false}, {"deka", false},
    {"deca", false},  {"deci", false},  {"centi", false}, {"milli", false}, {"micro", false},
    {"nano", false},  {"pico", false},  {"femto", false}, {"atto", false},  {"zepto", false},
    {"yocto", false}, {"Y", true},      {"Z", true},      {"E", true},      {"P", true},
    {"T", true},      {"G", true},      {"M", true},      {"k", true},      {"h", true},
    {"da", true},     {"d", true},      {"c", true},      {"m", true},      {"u", true},
    {"n", true},      {"p", true},      {"f", true},      {"a", true},      {"z", true},
}};

class Registry
{
  public:
    Registry()
    {
        // Base units.
        add({"m"}, {"meter", "metre"}, kLength, true);
        add({"g"}, {"gram", "gramme"}, kMass, true);
        add({"s", "sec"}, {"second"}, kTime, true);
        add({"A", "amp"}, {"ampere"}, kCurrent, true);
        add({"K"}, {"kelvin"}, kTemperature, true);
        add({"mol"}, {"mole"}, kAmount, true);
        add({"cd"}, {"candela"}, kLuminosity, true);

        // Derived SI units.
        add({"Hz"}, {"hertz"}, kFrequency, true);
        add({"N"}, {"newton"}, kForce, true);
        add({"Pa"}, {"pascal"}, kPressure, true);
        add({"J"}, {"joule"}, kEnergy, true);
        add({"W"}, {"watt"}, kPower, true);
        add({"C"}, {"coulomb"}, kCharge, true);
        add({"V"}, {"volt"}, kVoltage, true);
        add({"F"}, {"farad"}, kCapacitance, true);
        add({"ohm"}, {"ohm"}, kResistance, true);
        add({"S"}, {"siemens"}, kConductance, true);
        add({"Wb"}, {"weber"}, kMagneticFlux, true);
        add({"T"}, {"tesla"}, kFluxDensity, true);
        add({"H"}, {"henry"}, kInductance, true);
        add({"L", "l"}, {"liter", "litre"}, kVolume, true);
        add({"eV"}, {"electron_volt"}, kEnergy, true);
        add({"Bq"}, {"becquerel"}, kFrequency, true);
        add({"Gy"}, {"gray"}, {2, 0, -2, 0, 0, 0, 0}, true);
        add({"bar"}, {"bar"}, kPressure, true);
        add({"cal"}, {"calorie"}, kEnergy, true);

        // Temperature scales share the temperature dimension.
        add({"degC"}, {"celsius", "degree_Celsius", "degree_celsius"}, kTemperature, false);
        add({"degF"}, {"fahrenheit", "degree_Fahrenheit", "degree_fahrenheit"}, kTemperature,
            false);

        // Time.
        add({"min"}, {"minute"}, kTime, false);
        add({"h", "hr"}, {"hour"}, kTime, false);
        add({"d"}, {"day"}, kTime, false);
        add({}, {"week", "fortnight"}, kTime, false);
        add({"yr"}, {"year"}, kTime, false);

        // Length, area, volume.
        add({"in"}, {"inch"}, kLength, false);
        add({"ft"}, {"foot"}, kLength, false);
        add({"yd"}, {"yard"}, kLength, false);
        add({"mi"}, {"mile"}, kLength, false);
        add({"nmi"}, {"nautical_mile"}, kLength, false);
        add({"au"}, {"astronomical_unit"}, kLength, false);
        add({"ly"}, {"light_year"}, kLength, false);
        add({"pc"}, {"parsec"}, kLength, true);
        add({"ha"}, {"hectare"}, kArea, false);
        add({}, {"acre"}, kArea, false);
        add({"gal"}, {"gallon"}, kVolume, false);
        add({"qt"}, {"quart"}, kVolume, false);
        add({"pt"}, {"pint"}, kVolume, false);
        add({"cc"}, {}, kVolume, false);

        // Mass, force, pressure, energy, power.
        add({"t"}, {"tonne", "metric_ton"}, kMass, false);
        add({"lb"}, {"pound"}, kMass, false);
        add({"oz"}, {"ounce"}, kMass, false);
        add({"Da", "amu"}, {"dalton", "atomic_mass_unit"}, kMass, false);
        add({"lbf"}, {"pound_force"}, kForce, false);
        add({"dyn"}, {"dyne"}, kForce, false);
        add({"atm"}, {"atmosphere"}, kPressure, false);
        add({"psi"}, {}, kPressure, false);
        add({"torr"}, {"torr"}, kPressure, false);
        add({"erg"}, {"erg"}, kEnergy, false);
        add({"Wh"}, {"watt_hour"}, kEnergy, true);
        add({"BTU", "Btu"}, {"british_thermal_unit"}, kEnergy, false);
        add({"hp"}, {"horsepower"}, kPower, false);

        // Speed.
        add({"mph"}, {}, kVelocity, false);
        add({"kph"}, {}, kVelocity, false);
        add({"kn", "kt"}, {"knot"}, kVelocity, false);

        // Dimensionless.
        add({"rad"}, {"radian"}, kDimensionless, true);
        add({"sr"}, {"steradian"}, kDimensionless, false);
        add({"deg"}, {"degree", "arcdegree"}, kDimensionless, false);
        add({}, {"percent", "dimensionless", "count", "revolution", "turn", "cycle"},
            kDimensionless, false);

        // Irregular plurals.
        long_names_.emplace("feet", UnitDef{.dimension = kLength, .prefixable = false});
        long_names_.emplace("inches", UnitDef{.dimension = kLength, .prefixable = false});
        long_names_.emplace("siemens", UnitDef{.dimension = kConductance, .prefixable = true});
        long_names_.emplace("henries", UnitDef{.dimension = kInductance, .prefixable = true});
        long_names_.emplace("celsius", UnitDef{.dimension = kTemperature, .prefixable = false});
    }

    [[nodiscard]] std::optional<Dimension> lookup(std::string_view name) const
    {
        if (auto def = find_exact(name))
        {
            return def->dimension;
        }

        for (const Prefix& prefix : kPrefixes)
        {
            if (name.size() <= prefix.text.size() || !name.starts_with(prefix.text))
            {
                continue;
            }
            const std::string_view rest = name.substr(prefix.text.size());
            const auto def = prefix.is_symbol ? find_symbol(rest) : find_long(rest);
            if (def.has_value() && def->prefixable)
            {
                return def->dimension;
            }
        }
        return std::nullopt;
    }

  private:
    std::unordered_map<std::string, UnitDef> symbols_;
    std::unordered_map<std::string, UnitDef> long_names_;

    void add(std::initializer_list<std::string_view> symbols,
             std::initializer_list<std::string_view> names, Dimension dimension, bool prefixable)
    {
        const UnitDef def{.dimension = dimension, .prefixable = prefixable};
        for (const auto symbol : symbols)
        {
            symbols_.emplace(std::string(symbol), def);
        }
        for (const auto name : names)
        {
            long_names_.emplace(std::string(name), def);
        }
    }

    [[nodiscard]] std::optional<UnitDef> find_symbol(std::string_view name) const
    {
        if (auto it = symbols_.find(std::string(name)); it != symbols_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    // Long names also match simple plurals: `meters`, `inches`.
    [[nodiscard]] std::optional<UnitDef> find_long(std::string_view name) const
    {
        if (auto it = long_names_.find(std::string(name)); it != long_names_.end())
        {
            return it->second;
        }
        if (name.ends_with("es"))
        {
            if (auto it = long_names_.find(std::string(name.substr(0, name.size() - 2)));
                it != long_names_.end())
            {
                return it->second;
            }
        }
        if (name.ends_with("s"))
        {
            if (auto it = long_names_.find(std::string(name.substr(0, name.size() - 1)));
                it != long_names_.end())
            {
                return it->second;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<UnitDef> find_exact(std::string_view name) const
    {
        if (auto def = find_symbol(name))
        {
            return def;
        }
        return find_long(name);
    }
};

const Registry& registry()
{
    static const Registry instance;
    return instance;
}

Dimension combine(const Dimension& a, const Dimension& b, int sign)
{
    Dimension out{};
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        out[i] = a[i] + sign * b[i];
    }
    return out;
}

// Recursive descent over lexer tokens:
//   quantity := product Eof
//   product  := power (('*' | '/')? power)*       juxtaposition multiplies
//   power    := primary [('**') ['-'] INT | '(' ['-'] INT ')']
//   primary  := ['-'] NUMBER | IDENT | '(' product ')'
class DimensionParser
{
  public:
    DimensionParser(std::span<const Token> tokens, std::string_view text)
        : tokens_(tokens), text_(text)
    {
    }

    [[nodiscard]] DimensionResult parse()
    {
        if (check(TokenKind::Eof))
        {
            return UnitError{"empty unit expression"};
        }
        auto result = parse_product();
        if (std::holds_alternative<UnitError>(result))
        {
            return result;
        }
        if (!check(TokenKind::Eof))
        {
            return error("unexpected '" + std::string(peek().lexeme) + "'");
        }
        return result;
    }

  private:
    static constexpr std::size_t kMaxNestingDepth = 256;

    std::span<const Token> tokens_;
    std::string_view text_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    [[nodiscard]] const Token& peek() const { return tokens_[pos_]; }
    [[nodiscard]] bool check(TokenKind kind) const { return peek().kind == kind; }

    bool match(TokenKind kind)
    {
        if (!check(kind))
        {
            return false;
        }
        ++pos_;
        return true;
    }

    [[nodiscard]] UnitError error(const std::string& message) const
    {
        return UnitError{message + " in unit expression '" + std::string(text_) + "'"};
    }

    [[nodiscard]] bool starts_operand() const
    {
        return check(TokenKind::Identifier) || check(TokenKind::IntLiteral) ||
               check(TokenKind::FloatLiteral) || check(TokenKind::LParen);
    }

    [[nodiscard]] DimensionResult parse_product()
    {
        auto first = parse_power();
        if (std::holds_alternative<UnitError>(first))
        {
            return first;
        }
        Dimension dim = std::get<Dimension>(first);

        while (true)
        {
            int sign = 1;
            if (match(TokenKind::Slash))
            {
                sign = -1;
            }
            else if (!match(TokenKind::Star) && !starts_operand())
            {
                break;
            }

            auto next = parse_power();
            if (std::holds_alternative<UnitError>(next))
            {
                return next;
            }
            dim = combine(dim, std::get<Dimension>(next), sign);
        }
        return dim;
    }

    [[nodiscard]] std::optional<int> parse_exponent()
    {
        const bool grouped = match(TokenKind::LParen);
        const bool negative = match(TokenKind::Minus);
        if (!check(TokenKind::IntLiteral) || peek().lexeme.size() > 3)
        {
            return std::nullopt;
        }
        const int value = std::stoi(std::string(peek().lexeme));
        ++pos_;
        if (grouped && !match(TokenKind::RParen))
        {
            return std::nullopt;
        }
        return negative ? -value : value;
    }

    [[nodiscard]] DimensionResult parse_power()
    {
        auto base = parse_primary();
        if (std::holds_alternative<UnitError>(base) || !match(TokenKind::StarStar))
        {
            return base;
        }

        const auto exponent = parse_exponent();
        if (!exponent.has_value() || *exponent > kMaxUnitExponent ||
            *exponent < -kMaxUnitExponent)
        {
            return error("unsupported exponent");
        }

        Dimension out = std::get<Dimension>(base);
        for (int& component : out)
        {
            component *= *exponent;
        }
        return out;
    }

    [[nodiscard]] DimensionResult parse_primary()
    {
        if (match(TokenKind::Minus) || match(TokenKind::Plus))
        {
            if (!check(TokenKind::IntLiteral) && !check(TokenKind::FloatLiteral))
            {
                return error("expected a number after sign");
            }
        }

        if (match(TokenKind::IntLiteral) || match(TokenKind::FloatLiteral))
        {
            return kDimensionless;
        }

        if (check(TokenKind::Identifier))
        {
            const std::string_view name = peek().lexeme;
            ++pos_;
            if (auto dim = registry().lookup(name))
            {
                return *dim;
            }
            return UnitError{"unknown unit '" + std::string(name) + "'"};
        }

        if (match(TokenKind::LParen))
        {
            if (depth_ >= kMaxNestingDepth)
            {
                return UnitError{"unit expression nested too deeply"};
            }
            ++depth_;
            auto inner = parse_product();
            --depth_;
            if (std::holds_alternative<UnitError>(inner))
            {
                return inner;
            }
            if (!match(TokenKind::RParen))
            {
                return error("expected ')'");
            }
            return inner;
        }

        if (check(TokenKind::Eof))
        {
            return error("unexpected end");
        }
        return error("unexpected '" + std::string(peek().lexeme) + "'");
    }
};

} // namespace

DimensionResult parse_dimension(std::string_view text)
{
    // `^` is accepted as a power operator alongside `**`.
    std::string normalized;
    normalized.reserve(text.size() + 4);
    for (const char c : text)
    {
        if (c == '^')
        {
            normalized += "**";
        }
        else
        {
            normalized.push_back(c);
        }
    }

    auto lexed = examkit::lexer::lex(normalized);
    if (auto* d = std::get_if<examkit::diag::Diagnostic>(&lexed))
    {
        return UnitError{"cannot parse unit expression '" + std::string(text) + "': " +
                         d->message};
    }
    const auto& tokens = std::get<std::vector<Token>>(lexed);
    return DimensionParser(tokens, text).parse();
}

std::variant<bool, UnitError> compatible(std::string_view value_expr,
                                         std::string_view expected_units)
{
    auto value = parse_dimension(value_expr);
    if (auto* err = std::get_if<UnitError>(&value))
    {
        return *err;
    }
    auto expected = parse_dimension(expected_units);
    if (auto* err = std::get_if<UnitError>(&expected))
    {
        return *err;
    }
    return std::get<Dimension>(value) == std::get<Dimension>(expected);
}

std::string format_dimension(const Dimension& dimension)
{
    static constexpr std::array<std::string_view, 7> kNames = {
        "[length]",      "[mass]",      "[time]",      "[current]",
        "[temperature]", "[substance]", "[luminosity]",
    };

    std::string numerator;
    std::string denominator;
    for (std::size_t i = 0; i < dimension.size(); ++i)
    {
        const int power = dimension[i];
        if (power == 0)
        {
            continue;
        }
        std::string& side = power > 0 ? numerator : denominator;
        if (!side.empty())
        {
            side += " * ";
        }
        side += kNames[i];
        const int magnitude = power > 0 ? power : -power;
        if (magnitude != 1)
        {
            side += " ** " + std::to_string(magnitude);
        }
    }

    if (numerator.empty() && denominator.empty())
    {
        return "dimensionless";
    }
    if (denominator.empty())
    {
        return numerator;
    }
    return (numerator.empty() ? std::string("1") : numerator) + " / " + denominator;
}

void register_builtins(examkit::runtime::SymbolTable& table)
{
    table.add_function(
        "units_compatible", examkit::runtime::kCapUnits, 2, 2,
        [](std::span<const Value> args,
           const examkit::runtime::BuiltinContext&) -> examkit::runtime::BuiltinResult
        {
            for (const Value& arg : args)
            {
                if (arg.kind != ValueKind::String)
                {
                    return examkit::runtime::BuiltinError{
                        "units_compatible() expects unit strings, got " +
                        std::string(examkit::vm::kind_name(arg.kind))};
                }
            }

            auto result = compatible(args[0].string_value, args[1].string_value);
            if (auto* err = std::get_if<UnitError>(&result))
            {
                return examkit::runtime::BuiltinError{"units_compatible: " + err->message};
            }
            return Value::bool_v(std::get<bool>(result));
        });
}

} // namespace examkit::units
