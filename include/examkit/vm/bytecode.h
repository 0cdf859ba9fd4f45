#pragma once

#include <cstddef>
#include <cstdint>
#include <examkit/source/span.h>
#include <examkit/vm/value.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace examkit::vm
{

enum class OpCode : std::uint8_t
{
    Constant,   // u16 constant index
    LoadLocal,  // u16 slot
    StoreLocal, // u16 slot
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    Neg,
    Not,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Pop,
    Jump,        // u16 absolute target
    JumpIfFalse, // u16 absolute target
    Call,        // u16 function index, u8 argc
    CallBuiltin, // u16 symbol index, u8 argc
    Ret,
    MakeRecord, // u16 field count; pops key/value pairs
    GetField,   // u16 constant index of the key
};

/** @brief Entry in a chunk's function table. */
struct FunctionInfo
{
    std::string name;
    std::size_t entry = 0;
    std::size_t arity = 0;
    std::size_t locals = 0; // slots including parameters
};

struct Chunk
{
    std::vector<std::uint8_t> code;
    std::vector<Value> constants;
    std::vector<examkit::source::Span> spans;
    std::vector<FunctionInfo> functions;

    std::size_t add_constant(Value value)
    {
        constants.push_back(std::move(value));
        return constants.size() - 1;
    }

    void emit(OpCode op, examkit::source::Span span = {})
    {
        code.push_back(static_cast<std::uint8_t>(op));
        spans.push_back(span);
    }

    void emit_u8(std::uint8_t value, examkit::source::Span span = {})
    {
        code.push_back(value);
        spans.push_back(span);
    }

    void emit_u16(std::uint16_t value, examkit::source::Span span = {})
    {
        code.push_back(static_cast<std::uint8_t>(value & 0xFF));
        code.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        spans.push_back(span);
        spans.push_back(span);
    }

    void emit_constant(Value value, examkit::source::Span span = {})
    {
        const auto idx = add_constant(std::move(value));
        emit(OpCode::Constant, span);
        emit_u16(static_cast<std::uint16_t>(idx), span);
    }

    void emit_local(OpCode op, std::uint16_t slot, examkit::source::Span span = {})
    {
        emit(op, span);
        emit_u16(slot, span);
    }

    void patch_u16(std::size_t pos, std::uint16_t value)
    {
        code[pos] = static_cast<std::uint8_t>(value & 0xFF);
        code[pos + 1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    }

    [[nodiscard]] std::optional<std::size_t> find_function(std::string_view name) const
    {
        for (std::size_t i = 0; i < functions.size(); ++i)
        {
            if (functions[i].name == name)
            {
                return i;
            }
        }
        return std::nullopt;
    }
};

} // namespace examkit::vm
