#include "parser.hpp"
#include "error.hpp"
#include <algorithm>
#include <stack>

namespace tapejit {
    [[noreturn]]
    void fail_not_opened_loop(Token const& token);
    [[noreturn]]
    void fail_not_closed_loop(Token const& token);

    auto operator==(Op const& lhs, Op const& rhs) -> bool {
        if (lhs.m_type != rhs.m_type)
            return false;
        switch (lhs.m_type) {
            case Op::Type::MovePointer:   return lhs.move_arg == rhs.move_arg;
            case Op::Type::AddValue:      return lhs.add_arg == rhs.add_arg;
            case Op::Type::SetValue:      return lhs.set_arg == rhs.set_arg;
            case Op::Type::ScanUntilZero: return lhs.scan_arg == rhs.scan_arg;
            case Op::Type::LoopStart:
            case Op::Type::LoopEnd:       return lhs.loop_arg == rhs.loop_arg;
            case Op::Type::Output:
            case Op::Type::Input:         return true;
        }
        return false;
    }

    auto is_instruction(char ch) -> bool {
        switch (ch) {
            case '+': case '-': case '<': case '>':
            case '.': case ',': case '[': case ']':
                return true;
            default:
                return false;
        }
    }

    auto lex_program(std::string_view source) -> std::vector<Token> {
        auto ret = std::vector<Token>();
        ret.reserve(std::min<size_t>(source.size(), 1024 * 1024));

        std::stack<Token> open_loops;
        uint32_t line = 1;
        uint32_t column = 0;

        for (auto const ch : source) {
            column++;
            if (ch == '\n') {
                line++;
                column = 0;
                continue;
            }
            if (!is_instruction(ch))
                continue;

            auto const token = Token{ .symbol = ch, .line = line, .column = column };
            if (ch == '[') {
                open_loops.push(token);
            } else if (ch == ']') {
                if (open_loops.empty())
                    fail_not_opened_loop(token);
                open_loops.pop();
            }
            ret.push_back(token);
        }
        if (!open_loops.empty())
            fail_not_closed_loop(open_loops.top());

        return ret;
    }

    auto build_program(std::span<Token const> tokens) -> Program {
        auto ret = Program();
        ret.reserve(tokens.size());
        std::stack<size_t> loop_stack;
        std::stack<Token> loop_tokens;

        for (auto const& token : tokens) {
            auto const c_pos = ret.size();

            switch (token.symbol) {
                case '+': ret.push_back( Op::add(1) ); break;
                case '-': ret.push_back( Op::add(255) ); break;
                case '<': ret.push_back( Op::move(-1) ); break;
                case '>': ret.push_back( Op::move(1) ); break;
                case '.': ret.push_back( Op::output() ); break;
                case ',': ret.push_back( Op::input() ); break;
                case '[':
                    loop_stack.push( c_pos );
                    loop_tokens.push( token );
                    ret.push_back( Op::loop_start(c_pos) );
                    break;
                case ']':
                    if (loop_stack.empty()) {
                        fail_not_opened_loop(token);
                    } else {
                        auto loop_beg = loop_stack.top();
                        loop_stack.pop();
                        loop_tokens.pop();
                        ret.push_back( Op::loop_end(loop_beg) );
                        ret[loop_beg].loop_arg = c_pos;
                    }
                    break;
                default: break;
            }
        }
        if (!loop_tokens.empty())
            fail_not_closed_loop(loop_tokens.top());

        return ret;
    }

    auto parse_program(std::string_view source) -> Program {
        auto const tokens = lex_program(source);
        return build_program(tokens);
    }

    auto loops_are_linked(std::span<Op const> program) -> bool {
        std::stack<size_t> loop_stack;
        for (size_t i = 0; i < program.size(); i++) {
            auto const& op = program[i];
            if (op.m_type == Op::Type::LoopStart) {
                if (op.loop_arg <= i || op.loop_arg >= program.size())
                    return false;
                loop_stack.push(i);
            } else if (op.m_type == Op::Type::LoopEnd) {
                if (loop_stack.empty() || loop_stack.top() != op.loop_arg)
                    return false;
                if (program[op.loop_arg].loop_arg != i)
                    return false;
                loop_stack.pop();
            }
        }
        return loop_stack.empty();
    }

    void fail_not_opened_loop(Token const& token) {
        throw Error(ErrorKind::UnbalancedLoop,
            "loop ending operator (\"]\") at {}:{} has no corresponding loop beginning operator (\"[\")",
            token.line, token.column);
    }
    void fail_not_closed_loop(Token const& token) {
        throw Error(ErrorKind::UnbalancedLoop,
            "loop beginning operator (\"[\") at {}:{} is never closed", token.line, token.column);
    }
}
