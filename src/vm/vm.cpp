#include <chrono>
#include <cmath>
#include <cstdint>
#include <examkit/vm/vm.h>
#include <limits>
#include <string>
#include <variant>

namespace
{

using examkit::vm::OpCode;
using examkit::vm::Value;
using examkit::vm::ValueKind;

// Either the result of an operator or the runtime error it raised.
using OpResult = std::variant<Value, std::string>;

constexpr std::size_t kDeadlineCheckInterval = 1024;

std::size_t operand_width(OpCode op)
{
    switch (op)
    {
    case OpCode::Constant:
    case OpCode::LoadLocal:
    case OpCode::StoreLocal:
    case OpCode::Jump:
    case OpCode::JumpIfFalse:
    case OpCode::MakeRecord:
    case OpCode::GetField:
        return 2;
    case OpCode::Call:
    case OpCode::CallBuiltin:
        return 3;
    default:
        return 0;
    }
}

std::string quoted_kind(const Value& v)
{
    return "'" + std::string(examkit::vm::kind_name(v.kind)) + "'";
}

std::string unsupported(std::string_view op, const Value& a, const Value& b)
{
    return "unsupported operand types for " + std::string(op) + ": " + quoted_kind(a) +
           " and " + quoted_kind(b);
}

bool both_int(const Value& a, const Value& b)
{
    return a.kind == ValueKind::Int && b.kind == ValueKind::Int;
}

bool both_number(const Value& a, const Value& b)
{
    return a.is_number() && b.is_number();
}

OpResult int_pow(std::int64_t base, std::int64_t exp)
{
    std::int64_t result = 1;
    while (exp > 0)
    {
        if ((exp & 1) != 0 && __builtin_mul_overflow(result, base, &result))
        {
            return std::string("integer overflow");
        }
        exp >>= 1;
        if (exp > 0 && __builtin_mul_overflow(base, base, &base))
        {
            return std::string("integer overflow");
        }
    }
    return Value::int_v(result);
}

OpResult float_pow(double base, double exp)
{
    if (base == 0.0 && exp < 0.0)
    {
        return std::string("zero cannot be raised to a negative power");
    }
    if (base < 0.0 && std::isfinite(exp) && std::trunc(exp) != exp)
    {
        return std::string("negative number cannot be raised to a fractional power");
    }
    const double r = std::pow(base, exp);
    if (std::isinf(r) && std::isfinite(base) && std::isfinite(exp))
    {
        return std::string("float overflow in '**'");
    }
    return Value::float_v(r);
}

OpResult arithmetic(OpCode op, const Value& a, const Value& b, std::size_t max_string_bytes)
{
    switch (op)
    {
    case OpCode::Add:
        if (both_int(a, b))
        {
            std::int64_t out = 0;
            if (__builtin_add_overflow(a.int_value, b.int_value, &out))
            {
                return std::string("integer overflow");
            }
            return Value::int_v(out);
        }
        if (both_number(a, b))
        {
            return Value::float_v(a.as_double() + b.as_double());
        }
        if (a.kind == ValueKind::String && b.kind == ValueKind::String)
        {
            if (a.string_value.size() + b.string_value.size() > max_string_bytes)
            {
                return "string exceeds maximum size of " + std::to_string(max_string_bytes) +
                       " bytes";
            }
            return Value::string_v(a.string_value + b.string_value);
        }
        return unsupported("+", a, b);
    case OpCode::Sub:
        if (both_int(a, b))
        {
            std::int64_t out = 0;
            if (__builtin_sub_overflow(a.int_value, b.int_value, &out))
            {
                return std::string("integer overflow");
            }
            return Value::int_v(out);
        }
        if (both_number(a, b))
        {
            return Value::float_v(a.as_double() - b.as_double());
        }
        return unsupported("-", a, b);
    case OpCode::Mul:
        if (both_int(a, b))
        {
            std::int64_t out = 0;
            if (__builtin_mul_overflow(a.int_value, b.int_value, &out))
            {
                return std::string("integer overflow");
            }
            return Value::int_v(out);
        }
        if (both_number(a, b))
        {
            return Value::float_v(a.as_double() * b.as_double());
        }
        return unsupported("*", a, b);
    case OpCode::Div:
        if (!both_number(a, b))
        {
            return unsupported("/", a, b);
        }
        if (b.as_double() == 0.0)
        {
            return std::string("division by zero");
        }
        return Value::float_v(a.as_double() / b.as_double());
    case OpCode::Mod:
        if (both_int(a, b))
        {
            if (b.int_value == 0)
            {
                return std::string("modulo by zero");
            }
            if (b.int_value == -1)
            {
                return Value::int_v(0);
            }
            // Result takes the sign of the divisor.
            std::int64_t r = a.int_value % b.int_value;
            if (r != 0 && ((r < 0) != (b.int_value < 0)))
            {
                r += b.int_value;
            }
            return Value::int_v(r);
        }
        if (both_number(a, b))
        {
            const double divisor = b.as_double();
            if (divisor == 0.0)
            {
                return std::string("modulo by zero");
            }
            double r = std::fmod(a.as_double(), divisor);
            if (r != 0.0 && ((r < 0.0) != (divisor < 0.0)))
            {
                r += divisor;
            }
            return Value::float_v(r);
        }
        return unsupported("%", a, b);
    case OpCode::Pow:
        if (both_int(a, b) && b.int_value >= 0)
        {
            return int_pow(a.int_value, b.int_value);
        }
        if (both_number(a, b))
        {
            return float_pow(a.as_double(), b.as_double());
        }
        return unsupported("**", a, b);
    default:
        return std::string("invalid arithmetic opcode");
    }
}

OpResult compare(OpCode op, const Value& a, const Value& b)
{
    if (op == OpCode::Equal)
    {
        return Value::bool_v(a == b);
    }
    if (op == OpCode::NotEqual)
    {
        return Value::bool_v(!(a == b));
    }

    // -1, 0, 1
    int order = 0;
    if (both_int(a, b))
    {
        order = (a.int_value < b.int_value) ? -1 : (a.int_value > b.int_value ? 1 : 0);
    }
    else if (both_number(a, b))
    {
        const double x = a.as_double();
        const double y = b.as_double();
        if (std::isnan(x) || std::isnan(y))
        {
            return Value::bool_v(false);
        }
        order = (x < y) ? -1 : (x > y ? 1 : 0);
    }
    else if (a.kind == ValueKind::String && b.kind == ValueKind::String)
    {
        const int c = a.string_value.compare(b.string_value);
        order = (c < 0) ? -1 : (c > 0 ? 1 : 0);
    }
    else
    {
        return "cannot compare " + quoted_kind(a) + " and " + quoted_kind(b);
    }

    switch (op)
    {
    case OpCode::Less:
        return Value::bool_v(order < 0);
    case OpCode::LessEqual:
        return Value::bool_v(order <= 0);
    case OpCode::Greater:
        return Value::bool_v(order > 0);
    case OpCode::GreaterEqual:
        return Value::bool_v(order >= 0);
    default:
        return std::string("invalid comparison opcode");
    }
}

} // namespace

namespace examkit::vm
{

void VM::push(Value value)
{
    stack_.push_back(std::move(value));
}

std::optional<Value> VM::pop()
{
    if (stack_.empty())
    {
        return std::nullopt;
    }
    Value value = std::move(stack_.back());
    stack_.pop_back();
    return value;
}

VmResult VM::call(const Chunk& chunk, std::size_t function_index, std::vector<Value> args)
{
    stack_.clear();
    locals_.clear();
    frames_.clear();
    fuel_used_ = 0;

    auto fail = [](std::string error, std::optional<examkit::source::Span> span)
    {
        return VmResult{
            .ok = false, .value = Value::unit_v(), .error = std::move(error), .error_span = span};
    };

    if (function_index >= chunk.functions.size())
    {
        return fail("function index out of range", std::nullopt);
    }
    const FunctionInfo& entry = chunk.functions[function_index];
    if (args.size() != entry.arity)
    {
        return fail("function '" + entry.name + "' expects " + std::to_string(entry.arity) +
                        " arguments, got " + std::to_string(args.size()),
                    std::nullopt);
    }

    locals_.assign(entry.locals, Value::unit_v());
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        locals_[i] = std::move(args[i]);
    }
    frames_.push_back(Frame{.function = function_index, .return_ip = 0, .base = 0, .stack_base = 0});

    const auto deadline = std::chrono::steady_clock::now() + limits_.timeout;
    const examkit::runtime::BuiltinContext builtin_ctx{
        .max_string_bytes = limits_.max_string_bytes,
        .solver_timeout_ms = limits_.solver_timeout_ms,
        .deadline = deadline,
    };
    auto timed_out = [&]
    {
        return fail("execution timed out after " + std::to_string(limits_.timeout.count()) +
                        " ms",
                    std::nullopt);
    };

    std::size_t ip = entry.entry;
    while (true)
    {
        if (ip >= chunk.code.size())
        {
            return fail("instruction pointer out of range", std::nullopt);
        }
        if (fuel_used_ >= limits_.fuel)
        {
            return fail("out of fuel (limit " + std::to_string(limits_.fuel) + " instructions)",
                        std::nullopt);
        }
        ++fuel_used_;
        if (fuel_used_ % kDeadlineCheckInterval == 0 &&
            std::chrono::steady_clock::now() >= deadline)
        {
            return timed_out();
        }

        const std::size_t op_index = ip;
        const auto op = static_cast<OpCode>(chunk.code[ip++]);
        const auto span = (op_index < chunk.spans.size())
                              ? std::optional<examkit::source::Span>(chunk.spans[op_index])
                              : std::nullopt;

        if (ip + operand_width(op) > chunk.code.size())
        {
            return fail("truncated instruction", span);
        }
        auto read_u16 = [&]
        {
            const std::uint16_t lo = chunk.code[ip++];
            const std::uint16_t hi = chunk.code[ip++];
            return static_cast<std::uint16_t>(lo | (hi << 8));
        };

        Frame& frame = frames_.back();

        switch (op)
        {
        case OpCode::Constant:
        {
            const std::uint16_t idx = read_u16();
            if (idx >= chunk.constants.size())
            {
                return fail("constant index out of range", span);
            }
            push(chunk.constants[idx]);
            break;
        }
        case OpCode::LoadLocal:
        {
            const std::size_t slot = frame.base + read_u16();
            if (slot >= locals_.size())
            {
                return fail("local index out of range", span);
            }
            push(locals_[slot]);
            break;
        }
        case OpCode::StoreLocal:
        {
            const std::size_t slot = frame.base + read_u16();
            auto value = pop();
            if (!value.has_value())
            {
                return fail("stack underflow", span);
            }
            if (slot >= locals_.size())
            {
                return fail("local index out of range", span);
            }
            locals_[slot] = std::move(*value);
            break;
        }
        case OpCode::Add:
        case OpCode::Sub:
        case OpCode::Mul:
        case OpCode::Div:
        case OpCode::Mod:
        case OpCode::Pow:
        case OpCode::Equal:
        case OpCode::NotEqual:
        case OpCode::Less:
        case OpCode::LessEqual:
        case OpCode::Greater:
        case OpCode::GreaterEqual:
        {
            auto rhs = pop();
            auto lhs = pop();
            if (!lhs.has_value() || !rhs.has_value())
            {
                return fail("stack underflow", span);
            }
            const bool is_arith = op == OpCode::Add || op == OpCode::Sub || op == OpCode::Mul ||
                                  op == OpCode::Div || op == OpCode::Mod || op == OpCode::Pow;
            OpResult result = is_arith
                                  ? arithmetic(op, *lhs, *rhs, limits_.max_string_bytes)
                                  : compare(op, *lhs, *rhs);
            if (auto* err = std::get_if<std::string>(&result))
            {
                return fail(std::move(*err), span);
            }
            push(std::get<Value>(std::move(result)));
            break;
        }
        case OpCode::Neg:
        {
            auto value = pop();
            if (!value.has_value())
            {
                return fail("stack underflow", span);
            }
            if (value->kind == ValueKind::Int)
            {
                if (value->int_value == std::numeric_limits<std::int64_t>::min())
                {
                    return fail("integer overflow", span);
                }
                push(Value::int_v(-value->int_value));
                break;
            }
            if (value->kind == ValueKind::Float)
            {
                push(Value::float_v(-value->float_value));
                break;
            }
            return fail("bad operand type for unary -: " + quoted_kind(*value), span);
        }
        case OpCode::Not:
        {
            auto value = pop();
            if (!value.has_value())
            {
                return fail("stack underflow", span);
            }
            if (value->kind != ValueKind::Bool)
            {
                return fail("'!' expects bool, got " + quoted_kind(*value), span);
            }
            push(Value::bool_v(!value->bool_value));
            break;
        }
        case OpCode::Pop:
        {
            if (!pop().has_value())
            {
                return fail("stack underflow", span);
            }
            break;
        }
        case OpCode::Jump:
        {
            const std::uint16_t target = read_u16();
            if (static_cast<std::size_t>(target) >= chunk.code.size())
            {
                return fail("jump target out of range", span);
            }
            ip = static_cast<std::size_t>(target);
            break;
        }
        case OpCode::JumpIfFalse:
        {
            const std::uint16_t target = read_u16();
            auto cond = pop();
            if (!cond.has_value())
            {
                return fail("stack underflow", span);
            }
            if (cond->kind != ValueKind::Bool)
            {
                return fail("condition must be bool, got " + quoted_kind(*cond), span);
            }
            if (!cond->bool_value)
            {
                if (static_cast<std::size_t>(target) >= chunk.code.size())
                {
                    return fail("jump target out of range", span);
                }
                ip = static_cast<std::size_t>(target);
            }
            break;
        }
        case OpCode::Call:
        {
            const std::uint16_t target = read_u16();
            const std::size_t argc = chunk.code[ip++];
            if (target >= chunk.functions.size())
            {
                return fail("call target out of range", span);
            }
            const FunctionInfo& callee = chunk.functions[target];
            if (argc != callee.arity || argc > stack_.size())
            {
                return fail("bad call to '" + callee.name + "'", span);
            }
            if (frames_.size() >= limits_.max_call_depth)
            {
                return fail("maximum call depth of " + std::to_string(limits_.max_call_depth) +
                                " exceeded",
                            span);
            }

            const std::size_t base = locals_.size();
            locals_.resize(base + callee.locals, Value::unit_v());
            const std::size_t first_arg = stack_.size() - argc;
            for (std::size_t i = 0; i < argc; ++i)
            {
                locals_[base + i] = std::move(stack_[first_arg + i]);
            }
            stack_.resize(first_arg);

            frames_.push_back(Frame{
                .function = target, .return_ip = ip, .base = base, .stack_base = first_arg});
            ip = callee.entry;
            break;
        }
        case OpCode::CallBuiltin:
        {
            const std::uint16_t index = read_u16();
            const std::size_t argc = chunk.code[ip++];
            if (index >= symbols_.size() || argc > stack_.size())
            {
                return fail("bad builtin call", span);
            }
            const auto& symbol = symbols_.at(index);
            if (!symbol.fn)
            {
                return fail("'" + symbol.name + "' is not callable", span);
            }

            const std::size_t first_arg = stack_.size() - argc;
            auto result = symbol.fn(std::span<const Value>(stack_.data() + first_arg, argc),
                                    builtin_ctx);
            stack_.resize(first_arg);
            // A single builtin can outlast the whole budget; its result no longer counts.
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return timed_out();
            }
            if (auto* err = std::get_if<examkit::runtime::BuiltinError>(&result))
            {
                return fail(std::move(err->message), span);
            }
            Value value = std::get<Value>(std::move(result));
            if (value.kind == ValueKind::String &&
                value.string_value.size() > limits_.max_string_bytes)
            {
                return fail("string exceeds maximum size of " +
                                std::to_string(limits_.max_string_bytes) + " bytes",
                            span);
            }
            push(std::move(value));
            break;
        }
        case OpCode::Ret:
        {
            auto result = pop();
            if (!result.has_value())
            {
                return fail("missing return value", span);
            }
            const Frame finished = frames_.back();
            frames_.pop_back();
            locals_.resize(finished.base);
            stack_.resize(finished.stack_base);
            if (frames_.empty())
            {
                return VmResult{.ok = true,
                                .value = std::move(*result),
                                .error = {},
                                .error_span = std::nullopt};
            }
            push(std::move(*result));
            ip = finished.return_ip;
            break;
        }
        case OpCode::MakeRecord:
        {
            const std::size_t count = read_u16();
            if (count * 2 > stack_.size())
            {
                return fail("stack underflow", span);
            }
            std::vector<std::pair<std::string, Value>> fields;
            fields.reserve(count);
            const std::size_t first = stack_.size() - count * 2;
            for (std::size_t i = 0; i < count; ++i)
            {
                Value& key = stack_[first + i * 2];
                Value& value = stack_[first + i * 2 + 1];
                if (key.kind != ValueKind::String)
                {
                    return fail("record key must be a string", span);
                }
                fields.emplace_back(std::move(key.string_value), std::move(value));
            }
            stack_.resize(first);
            push(make_record(std::move(fields)));
            break;
        }
        case OpCode::GetField:
        {
            const std::uint16_t key_index = read_u16();
            if (key_index >= chunk.constants.size() ||
                chunk.constants[key_index].kind != ValueKind::String)
            {
                return fail("field name constant out of range", span);
            }
            const std::string& key = chunk.constants[key_index].string_value;
            auto base = pop();
            if (!base.has_value())
            {
                return fail("stack underflow", span);
            }
            if (base->kind != ValueKind::Record)
            {
                return fail("cannot read field '" + key + "' of " + quoted_kind(*base), span);
            }
            const Value* found = base->record_value->find(key);
            if (found == nullptr)
            {
                return fail("record has no field '" + key + "'", span);
            }
            push(*found);
            break;
        }
        default:
            return fail("invalid opcode", span);
        }
    }
}

} // namespace examkit::vm
