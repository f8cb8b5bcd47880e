#include "kiln/compiler/artifact_reader.hpp"

#include <charconv>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace kiln::compiler {

namespace {

struct Token {
    std::string text;
    bool quoted = false;
};

class Parser {
public:
    Parser(const std::string& source, std::string origin)
        : input_(source), origin_(std::move(origin)) {}

    ArtifactProgram parse() {
        std::vector<Token> tokens;
        if (!next_line(tokens)) {
            fail("empty artifact");
        }
        parse_header(tokens);

        bool has_dispatch = false;
        while (next_line(tokens)) {
            const Token& keyword = tokens.front();
            if (!keyword.quoted && keyword.text == "routine") {
                parse_routine(tokens);
            } else if (!keyword.quoted && keyword.text == "dispatch") {
                if (has_dispatch) {
                    fail("duplicate dispatch block");
                }
                expect_arity(tokens, 1);
                parse_dispatch();
                has_dispatch = true;
            } else {
                fail("unexpected '" + keyword.text + "'");
            }
        }

        if (!has_dispatch) {
            fail("missing dispatch block");
        }
        return std::move(program_);
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw ArtifactError("Invalid artifact " + origin_ + ":" +
                            std::to_string(line_number_) + ": " + message);
    }

    // Reads the next line holding at least one token
    bool next_line(std::vector<Token>& tokens) {
        std::string line;
        while (std::getline(input_, line)) {
            ++line_number_;
            tokens = tokenize(line);
            if (!tokens.empty()) {
                return true;
            }
        }
        return false;
    }

    std::vector<Token> tokenize(const std::string& line) const {
        std::vector<Token> tokens;
        size_t i = 0;
        while (i < line.size()) {
            char c = line[i];
            if (c == ' ' || c == '\t' || c == '\r') {
                ++i;
            } else if (c == ';') {
                break;
            } else if (c == '"') {
                tokens.push_back({read_quoted(line, i), true});
            } else {
                size_t start = i;
                while (i < line.size() && line[i] != ' ' && line[i] != '\t' &&
                       line[i] != '\r' && line[i] != '"' && line[i] != ';') {
                    ++i;
                }
                tokens.push_back({line.substr(start, i - start), false});
            }
        }
        return tokens;
    }

    // `i` points at the opening quote; leaves it past the closing one
    std::string read_quoted(const std::string& line, size_t& i) const {
        std::string text;
        ++i;
        while (i < line.size()) {
            char c = line[i++];
            if (c == '"') {
                return text;
            }
            if (c != '\\') {
                text += c;
                continue;
            }
            if (i >= line.size()) {
                break;
            }
            switch (line[i++]) {
                case '"':
                    text += '"';
                    break;
                case '\\':
                    text += '\\';
                    break;
                case 'n':
                    text += '\n';
                    break;
                case 't':
                    text += '\t';
                    break;
                case 'r':
                    text += '\r';
                    break;
                default:
                    fail("unknown escape sequence");
            }
        }
        fail("unterminated string");
    }

    void expect_arity(const std::vector<Token>& tokens, size_t count) const {
        if (tokens.size() != count) {
            fail("expected " + std::to_string(count) + " tokens, found " +
                 std::to_string(tokens.size()));
        }
    }

    const std::string& word(const Token& token) const {
        if (token.quoted) {
            fail("unexpected string \"" + token.text + "\"");
        }
        return token.text;
    }

    const std::string& quoted(const Token& token) const {
        if (!token.quoted) {
            fail("expected a quoted string, found '" + token.text + "'");
        }
        return token.text;
    }

    int64_t integer(const Token& token) const {
        const std::string& text = word(token);
        try {
            size_t consumed = 0;
            int64_t value = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return value;
            }
        } catch (const std::logic_error&) {
        }
        fail("invalid integer '" + text + "'");
    }

    int64_t count(const Token& token) const {
        int64_t value = integer(token);
        if (value < 0) {
            fail("negative count " + token.text);
        }
        return value;
    }

    double real(const Token& token) const {
        const std::string& text = word(token);
        const char* end = text.data() + text.size();
        double value = 0.0;
        auto result = std::from_chars(text.data(), end, value);
        if (result.ec != std::errc() || result.ptr != end) {
            fail("invalid number '" + text + "'");
        }
        return value;
    }

    void parse_header(const std::vector<Token>& tokens) {
        expect_arity(tokens, 4);
        if (word(tokens[0]) != "container" || word(tokens[2]) != "extends") {
            fail("expected 'container <name> extends \"<parent>\"'");
        }
        program_.container_name = word(tokens[1]);
        program_.parent_type = quoted(tokens[3]);
    }

    void parse_routine(const std::vector<Token>& header) {
        expect_arity(header, 2);
        Routine routine{word(header[1]), {}};
        if (!routine_names_.insert(routine.name).second) {
            fail("duplicate routine " + routine.name);
        }
        std::vector<size_t> lines;

        std::vector<Token> tokens;
        while (next_line(tokens)) {
            if (!tokens.front().quoted && tokens.front().text == "end") {
                expect_arity(tokens, 1);
                if (routine.code.empty() ||
                    routine.code.back().op != Opcode::RET) {
                    fail("routine " + routine.name + " does not end with ret");
                }
                check_skips(routine, lines);
                program_.routines.push_back(std::move(routine));
                return;
            }
            routine.code.push_back(parse_instruction(tokens));
            lines.push_back(line_number_);
        }
        fail("routine " + routine.name + " is not terminated by 'end'");
    }

    Instruction parse_instruction(const std::vector<Token>& tokens) const {
        const std::string& name = word(tokens.front());
        auto op = opcode_from_name(name);
        if (!op) {
            fail("unknown instruction '" + name + "'");
        }

        switch (operand_layout(*op)) {
            case OperandLayout::NONE:
                expect_arity(tokens, 1);
                return Instruction::simple(*op);
            case OperandLayout::INTEGER:
                expect_arity(tokens, 2);
                if (*op == Opcode::PUSH_INT) {
                    return Instruction::with_integer(*op, integer(tokens[1]));
                }
                return Instruction::with_integer(*op, count(tokens[1]));
            case OperandLayout::REAL:
                expect_arity(tokens, 2);
                return Instruction::with_real(*op, real(tokens[1]));
            case OperandLayout::TEXT:
                expect_arity(tokens, 2);
                return Instruction::with_text(*op, quoted(tokens[1]));
            case OperandLayout::TEXT_INTEGER:
                expect_arity(tokens, 3);
                return Instruction::with_text(*op, quoted(tokens[1]),
                                              count(tokens[2]));
        }
        fail("unknown instruction '" + name + "'");
    }

    // An env skip must land on an instruction of the same routine
    void check_skips(const Routine& routine,
                     const std::vector<size_t>& lines) const {
        for (size_t i = 0; i < routine.code.size(); ++i) {
            const Instruction& instruction = routine.code[i];
            if (instruction.op == Opcode::ENV &&
                i + 1 + static_cast<size_t>(instruction.integer) >=
                    routine.code.size()) {
                throw ArtifactError(
                    "Invalid artifact " + origin_ + ":" +
                    std::to_string(lines[i]) + ": env skips past " +
                    "the end of routine " + routine.name);
            }
        }
    }

    void parse_dispatch() {
        std::vector<Token> tokens;
        while (next_line(tokens)) {
            if (!tokens.front().quoted && tokens.front().text == "end") {
                expect_arity(tokens, 1);
                return;
            }
            expect_arity(tokens, 2);
            const std::string& entry_id = quoted(tokens[0]);
            const std::string& routine_name = word(tokens[1]);

            size_t index = 0;
            while (index < program_.routines.size() &&
                   program_.routines[index].name != routine_name) {
                ++index;
            }
            if (index == program_.routines.size()) {
                fail("dispatch to unknown routine " + routine_name);
            }
            if (!program_.dispatch.emplace(entry_id, index).second) {
                fail("entry \"" + entry_id + "\" is dispatched twice");
            }
        }
        fail("dispatch block is not terminated by 'end'");
    }

    std::istringstream input_;
    std::string origin_;
    size_t line_number_ = 0;
    ArtifactProgram program_;
    std::set<std::string> routine_names_;
};

}  // namespace

const Routine* ArtifactProgram::find_routine_for(
    const std::string& entry_id) const {
    auto it = dispatch.find(entry_id);
    return it != dispatch.end() ? &routines.at(it->second) : nullptr;
}

ArtifactProgram ArtifactReader::parse(const std::string& source,
                                      const std::string& origin) {
    return Parser(source, origin).parse();
}

}  // namespace kiln::compiler
