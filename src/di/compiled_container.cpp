#include "kiln/di/compiled_container.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "kiln/log/logger.hpp"

namespace kiln::di {

using compiler::Instruction;
using compiler::Opcode;

namespace {

// A stack slot remembers the type of objects built by `new` so that later
// `property` and `call` instructions can reach their setters and methods
struct Slot {
    Value value;
    const TypeDescriptor* type = nullptr;
};

class Machine {
public:
    explicit Machine(const std::string& entry_id) : entry_id_(entry_id) {}

    [[noreturn]] void fail(const std::string& message) const {
        throw DependencyError("Entry '" + entry_id_ +
                              "' cannot be resolved: " + message);
    }

    void push(Value value, const TypeDescriptor* type = nullptr) {
        stack_.push_back({std::move(value), type});
    }

    Slot pop() {
        if (stack_.empty()) {
            fail("compiled routine underflows its stack");
        }
        Slot slot = std::move(stack_.back());
        stack_.pop_back();
        return slot;
    }

    // Last `count` values, in the order they were pushed
    std::vector<Value> pop_values(int64_t count) {
        if (count < 0 || static_cast<size_t>(count) > stack_.size()) {
            fail("compiled routine underflows its stack");
        }
        std::vector<Value> values;
        values.reserve(static_cast<size_t>(count));
        auto first = stack_.end() - count;
        for (auto it = first; it != stack_.end(); ++it) {
            values.push_back(std::move(it->value));
        }
        stack_.erase(first, stack_.end());
        return values;
    }

    const Slot& object_under_construction() const {
        if (stack_.empty() || stack_.back().type == nullptr) {
            fail("compiled routine has no object under construction");
        }
        return stack_.back();
    }

    size_t depth() const { return stack_.size(); }

private:
    const std::string& entry_id_;
    std::vector<Slot> stack_;
};

ArrayKey to_key(Machine& machine, const Value& key) {
    if (key.is_int()) {
        return key.as_int();
    }
    if (key.is_string()) {
        return key.as_string();
    }
    machine.fail(std::string("array key of type ") +
                 Value::type_label(key.type()));
}

}  // namespace

CompiledContainer::CompiledContainer(Context context)
    : Container(std::move(context.definitions), std::move(context.types),
                context.autowiring),
      program_(std::move(context.program)) {
    if (!program_) {
        throw std::invalid_argument(
            "CompiledContainer requires a loaded artifact program");
    }
}

bool CompiledContainer::has(const std::string& id) const {
    return is_entry_compiled(id) || Container::has(id);
}

void CompiledContainer::set(const std::string&, Definition) {
    throw ContainerImmutableError();
}

bool CompiledContainer::is_entry_compiled(const std::string& id) const {
    return program_->dispatch.count(id) > 0;
}

std::vector<std::string> CompiledContainer::compiled_entries() const {
    std::vector<std::string> ids;
    ids.reserve(program_->dispatch.size());
    for (const auto& [id, routine] : program_->dispatch) {
        ids.push_back(id);
    }
    return ids;
}

Value CompiledContainer::resolve(const std::string& id) {
    if (const compiler::Routine* routine = program_->find_routine_for(id)) {
        KILN_LOG_TRACE << "Resolving '" << id << "' with compiled routine "
                       << routine->name;
        return execute(*routine, id);
    }
    return Container::resolve(id);
}

Value CompiledContainer::execute(const compiler::Routine& routine,
                                 const std::string& entry_id) {
    Machine machine(entry_id);
    const auto& code = routine.code;

    for (size_t pc = 0; pc < code.size(); ++pc) {
        const Instruction& instruction = code[pc];
        switch (instruction.op) {
            case Opcode::PUSH_NULL:
                machine.push(Value());
                break;
            case Opcode::PUSH_TRUE:
                machine.push(Value(true));
                break;
            case Opcode::PUSH_FALSE:
                machine.push(Value(false));
                break;
            case Opcode::PUSH_INT:
                machine.push(Value(instruction.integer));
                break;
            case Opcode::PUSH_FLOAT:
                machine.push(Value(instruction.real));
                break;
            case Opcode::PUSH_STRING:
                machine.push(Value(instruction.text));
                break;
            case Opcode::ARRAY: {
                std::vector<Value> pairs =
                    machine.pop_values(instruction.integer * 2);
                Array array;
                for (size_t i = 0; i < pairs.size(); i += 2) {
                    array.set(to_key(machine, pairs[i]),
                              std::move(pairs[i + 1]));
                }
                machine.push(Value(std::move(array)));
                break;
            }
            case Opcode::ENTRY:
                machine.push(get(instruction.text));
                break;
            case Opcode::NEW: {
                const TypeDescriptor* type = types().find(instruction.text);
                if (!type) {
                    machine.fail("class " + instruction.text +
                                 " is not registered");
                }
                std::vector<Value> arguments =
                    machine.pop_values(instruction.integer);
                Value instance = attribute_errors(
                    entry_id, [&] { return type->instantiate(arguments); });
                machine.push(std::move(instance), type);
                break;
            }
            case Opcode::PROPERTY: {
                Slot value = machine.pop();
                const Slot& target = machine.object_under_construction();
                attribute_errors(entry_id, [&] {
                    target.type->set_property(target.value.as_object(),
                                              instruction.text, value.value);
                });
                break;
            }
            case Opcode::CALL: {
                std::vector<Value> arguments =
                    machine.pop_values(instruction.integer);
                const Slot& target = machine.object_under_construction();
                attribute_errors(entry_id, [&] {
                    target.type->call_method(target.value.as_object(),
                                             instruction.text, arguments);
                });
                break;
            }
            case Opcode::ENV:
                if (const char* value = std::getenv(instruction.text.c_str())) {
                    machine.push(Value(std::string(value)));
                    pc += static_cast<size_t>(instruction.integer);
                } else if (instruction.integer == 0) {
                    machine.fail("environment variable '" + instruction.text +
                                 "' is not defined");
                }
                break;
            case Opcode::CONCAT: {
                std::vector<Value> parts =
                    machine.pop_values(instruction.integer);
                std::string result;
                for (const auto& part : parts) {
                    result += attribute_errors(
                        entry_id, [&] { return part.to_string(); });
                }
                machine.push(Value(std::move(result)));
                break;
            }
            case Opcode::RET: {
                if (machine.depth() != 1) {
                    machine.fail("compiled routine " + routine.name +
                                 " returns with " +
                                 std::to_string(machine.depth()) +
                                 " values on its stack");
                }
                return machine.pop().value;
            }
        }
    }
    throw DependencyError("Entry '" + entry_id + "' cannot be resolved: " +
                          "compiled routine " + routine.name +
                          " does not return");
}

}  // namespace kiln::di
