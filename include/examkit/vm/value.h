#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file value.h
 * @brief Runtime value representation used by the VM and builtins.
 */

namespace examkit::vm
{

/** @brief Kind of a runtime value. */
enum class ValueKind
{
    Int,
    Float,
    Bool,
    String,
    Record,
    Unit,
};

struct Record;

/**
 * @brief A dynamically typed value.
 *
 * Uses explicit fields for each kind; records are shared and immutable, so copying a
 * Value never copies record contents.
 */
struct Value
{
    ValueKind kind = ValueKind::Unit;
    std::int64_t int_value = 0;
    double float_value = 0.0;
    bool bool_value = false;
    std::string string_value;
    std::shared_ptr<const Record> record_value;

    static Value int_v(std::int64_t v)
    {
        Value out;
        out.kind = ValueKind::Int;
        out.int_value = v;
        return out;
    }

    static Value float_v(double v)
    {
        Value out;
        out.kind = ValueKind::Float;
        out.float_value = v;
        return out;
    }

    static Value bool_v(bool v)
    {
        Value out;
        out.kind = ValueKind::Bool;
        out.bool_value = v;
        return out;
    }

    static Value string_v(std::string v)
    {
        Value out;
        out.kind = ValueKind::String;
        out.string_value = std::move(v);
        return out;
    }

    static Value record_v(std::shared_ptr<const Record> v)
    {
        Value out;
        out.kind = ValueKind::Record;
        out.record_value = std::move(v);
        return out;
    }

    static Value unit_v() { return Value{}; }

    [[nodiscard]] bool is_number() const
    {
        return kind == ValueKind::Int || kind == ValueKind::Float;
    }

    /** @brief Numeric value widened to double; only meaningful when is_number(). */
    [[nodiscard]] double as_double() const
    {
        return kind == ValueKind::Int ? static_cast<double>(int_value) : float_value;
    }
};

/** @brief Immutable record: string keys in insertion order. */
struct Record
{
    std::vector<std::pair<std::string, Value>> fields;

    [[nodiscard]] const Value* find(std::string_view key) const
    {
        for (const auto& [name, value] : fields)
        {
            if (name == key)
            {
                return &value;
            }
        }
        return nullptr;
    }
};

/** @brief Build a record value from key/value pairs. */
[[nodiscard]] inline Value make_record(std::vector<std::pair<std::string, Value>> fields)
{
    auto record = std::make_shared<Record>();
    record->fields = std::move(fields);
    return Value::record_v(std::move(record));
}

/** @brief Lowercase kind name used in runtime error messages. */
[[nodiscard]] std::string_view kind_name(ValueKind kind);

/**
 * @brief Structural equality. Int and Float compare numerically, so `1 == 1.0`.
 */
[[nodiscard]] bool operator==(const Value& a, const Value& b);

/**
 * @brief Convert a runtime Value to text.
 *
 * Floats use the shortest round-trip form and always carry a decimal point or
 * exponent (`4.0`, `0.1`, `1e+20`); records print as `{key: value, ...}`.
 */
[[nodiscard]] std::string to_string(const Value& v);

/** @brief Text form of a double as produced by to_string(). */
[[nodiscard]] std::string format_float(double value);

} // namespace examkit::vm
