#include "kiln/compiler/code_generator.hpp"

#include <charconv>
#include <sstream>

namespace kiln::compiler {

namespace {

const char* const kIndent = "    ";

// Shortest text that reads back to the same double, independent of locale
std::string format_real(double value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, result.ptr);
}

}  // namespace

std::string CodeGenerator::quote(const std::string& text) {
    std::string quoted = "\"";
    for (char c : text) {
        switch (c) {
            case '"':
                quoted += "\\\"";
                break;
            case '\\':
                quoted += "\\\\";
                break;
            case '\n':
                quoted += "\\n";
                break;
            case '\t':
                quoted += "\\t";
                break;
            case '\r':
                quoted += "\\r";
                break;
            default:
                quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

std::string CodeGenerator::format_instruction(const Instruction& instruction) {
    std::string line = opcode_name(instruction.op);
    switch (operand_layout(instruction.op)) {
        case OperandLayout::NONE:
            break;
        case OperandLayout::INTEGER:
            line += " " + std::to_string(instruction.integer);
            break;
        case OperandLayout::REAL:
            line += " " + format_real(instruction.real);
            break;
        case OperandLayout::TEXT:
            line += " " + quote(instruction.text);
            break;
        case OperandLayout::TEXT_INTEGER:
            line += " " + quote(instruction.text) + " " +
                    std::to_string(instruction.integer);
            break;
    }
    return line;
}

GeneratedRoutine CodeGenerator::generate(const CompilationPlan& plan,
                                         const std::string& entry_id) {
    GeneratedRoutine routine;
    routine.entry_id = entry_id;
    routine.routine_name = "get" + std::to_string(++counter_);

    std::ostringstream source;
    source << "routine " << routine.routine_name << "\n";
    for (const auto& instruction : plan.code) {
        source << kIndent << format_instruction(instruction) << "\n";
    }
    source << "end\n";
    routine.source = source.str();
    return routine;
}

std::string CodeGenerator::assemble(
    const std::vector<GeneratedRoutine>& routines,
    const ArtifactIdentity& identity) const {
    std::ostringstream out;
    out << "; Generated by kiln. Do not edit.\n";
    out << "container " << identity.name << " extends "
        << quote(identity.parent_type) << "\n";

    for (const auto& routine : routines) {
        out << "\n" << routine.source;
    }

    out << "\ndispatch\n";
    for (const auto& routine : routines) {
        out << kIndent << quote(routine.entry_id) << " "
            << routine.routine_name << "\n";
    }
    out << "end\n";
    return out.str();
}

}  // namespace kiln::compiler
