#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kiln::compiler {

/**
 * @brief Operations of the resolution stack machine
 *
 * Operands are pushed in postfix order. Objects under construction stay on
 * the stack while their properties and method calls are applied.
 */
enum class Opcode {
    PUSH_NULL,    // push.null
    PUSH_TRUE,    // push.true
    PUSH_FALSE,   // push.false
    PUSH_INT,     // push.int N
    PUSH_FLOAT,   // push.float D
    PUSH_STRING,  // push.string "s"
    ARRAY,        // array N: pops N key/value pairs, key pushed first
    ENTRY,        // entry "id": resolves an entry through the container
    NEW,          // new "Type" N: pops N constructor arguments
    PROPERTY,     // property "name": pops a value, sets it on the object below
    CALL,         // call "method" N: pops N arguments, calls the object below
    ENV,          // env "NAME" SKIP: pushes the variable and skips SKIP
                  // instructions, else runs the default block that follows
    CONCAT,       // concat N: pops N scalars, pushes their concatenation
    RET           // ret: the top of the stack is the entry value
};

// Operands carried by an opcode in the artifact text
enum class OperandLayout { NONE, INTEGER, REAL, TEXT, TEXT_INTEGER };

struct Instruction {
    Opcode op = Opcode::RET;
    std::string text;
    int64_t integer = 0;
    double real = 0.0;

    static Instruction simple(Opcode op) { return {op, {}, 0, 0.0}; }
    static Instruction with_integer(Opcode op, int64_t integer) {
        return {op, {}, integer, 0.0};
    }
    static Instruction with_real(Opcode op, double real) {
        return {op, {}, 0, real};
    }
    static Instruction with_text(Opcode op, std::string text,
                                 int64_t integer = 0) {
        return {op, std::move(text), integer, 0.0};
    }

    bool operator==(const Instruction& other) const {
        return op == other.op && text == other.text &&
               integer == other.integer && real == other.real;
    }
};

const char* opcode_name(Opcode op);
std::optional<Opcode> opcode_from_name(const std::string& name);
OperandLayout operand_layout(Opcode op);

using Code = std::vector<Instruction>;

/**
 * @brief Instructions resolving one compilable entry, ending with ret
 */
struct CompilationPlan {
    std::string entry_id;
    Code code;
};

struct Routine {
    std::string name;
    Code code;
};

}  // namespace kiln::compiler
