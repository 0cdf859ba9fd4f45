#include <array>
#include <charconv>
#include <cmath>
#include <examkit/vm/value.h>

namespace examkit::vm
{

std::string_view kind_name(ValueKind kind)
{
    switch (kind)
    {
    case ValueKind::Int:
        return "int";
    case ValueKind::Float:
        return "float";
    case ValueKind::Bool:
        return "bool";
    case ValueKind::String:
        return "string";
    case ValueKind::Record:
        return "record";
    case ValueKind::Unit:
        return "unit";
    }
    return "unknown";
}

bool operator==(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number())
    {
        if (a.kind == ValueKind::Int && b.kind == ValueKind::Int)
        {
            return a.int_value == b.int_value;
        }
        return a.as_double() == b.as_double();
    }
    if (a.kind != b.kind)
    {
        return false;
    }
    switch (a.kind)
    {
    case ValueKind::Bool:
        return a.bool_value == b.bool_value;
    case ValueKind::String:
        return a.string_value == b.string_value;
    case ValueKind::Record:
    {
        if (a.record_value == b.record_value)
        {
            return true;
        }
        if (a.record_value == nullptr || b.record_value == nullptr)
        {
            return false;
        }
        const auto& lhs = a.record_value->fields;
        const auto& rhs = b.record_value->fields;
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (const auto& [key, value] : lhs)
        {
            const Value* other = b.record_value->find(key);
            if (other == nullptr || !(value == *other))
            {
                return false;
            }
        }
        return true;
    }
    case ValueKind::Unit:
        return true;
    case ValueKind::Int:
    case ValueKind::Float:
        break;
    }
    return false;
}

std::string format_float(double value)
{
    if (std::isnan(value))
    {
        return "nan";
    }
    if (std::isinf(value))
    {
        return value < 0 ? "-inf" : "inf";
    }

    std::array<char, 64> buf{};
    const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{})
    {
        return "nan";
    }
    std::string out(buf.data(), end);
    if (out.find_first_of(".e") == std::string::npos)
    {
        out += ".0";
    }
    return out;
}

std::string to_string(const Value& v)
{
    switch (v.kind)
    {
    case ValueKind::Int:
        return std::to_string(v.int_value);
    case ValueKind::Float:
        return format_float(v.float_value);
    case ValueKind::Bool:
        return v.bool_value ? "true" : "false";
    case ValueKind::String:
        return v.string_value;
    case ValueKind::Record:
    {
        std::string out = "{";
        if (v.record_value != nullptr)
        {
            bool first = true;
            for (const auto& [key, value] : v.record_value->fields)
            {
                if (!first)
                {
                    out += ", ";
                }
                first = false;
                out += key;
                out += ": ";
                out += to_string(value);
            }
        }
        out += "}";
        return out;
    }
    case ValueKind::Unit:
        return "()";
    }
    return "<unknown>";
}

} // namespace examkit::vm
