#include "kiln/compiler/instruction.hpp"

#include <array>
#include <utility>

namespace kiln::compiler {

namespace {

struct OpcodeInfo {
    Opcode op;
    const char* name;
    OperandLayout layout;
};

constexpr std::array<OpcodeInfo, 14> kOpcodes = {{
    {Opcode::PUSH_NULL, "push.null", OperandLayout::NONE},
    {Opcode::PUSH_TRUE, "push.true", OperandLayout::NONE},
    {Opcode::PUSH_FALSE, "push.false", OperandLayout::NONE},
    {Opcode::PUSH_INT, "push.int", OperandLayout::INTEGER},
    {Opcode::PUSH_FLOAT, "push.float", OperandLayout::REAL},
    {Opcode::PUSH_STRING, "push.string", OperandLayout::TEXT},
    {Opcode::ARRAY, "array", OperandLayout::INTEGER},
    {Opcode::ENTRY, "entry", OperandLayout::TEXT},
    {Opcode::NEW, "new", OperandLayout::TEXT_INTEGER},
    {Opcode::PROPERTY, "property", OperandLayout::TEXT},
    {Opcode::CALL, "call", OperandLayout::TEXT_INTEGER},
    {Opcode::ENV, "env", OperandLayout::TEXT_INTEGER},
    {Opcode::CONCAT, "concat", OperandLayout::INTEGER},
    {Opcode::RET, "ret", OperandLayout::NONE},
}};

const OpcodeInfo& info(Opcode op) {
    return kOpcodes[static_cast<size_t>(op)];
}

}  // namespace

const char* opcode_name(Opcode op) { return info(op).name; }

OperandLayout operand_layout(Opcode op) { return info(op).layout; }

std::optional<Opcode> opcode_from_name(const std::string& name) {
    for (const auto& entry : kOpcodes) {
        if (name == entry.name) {
            return entry.op;
        }
    }
    return std::nullopt;
}

}  // namespace kiln::compiler
