#include "optimizer.hpp"
#include "error.hpp"
#include "parser.hpp"
#include <initializer_list>
#include <stack>

namespace tapejit {
    bool matches(std::span<Op const> code, std::initializer_list<Op::Type> sequence);

    auto fuse_runs(std::span<Op const> buffer_in) -> std::vector<Op> {
        std::vector<Op> buffer;
        buffer.reserve(buffer_in.size());

        for (auto const& op : buffer_in) {
            auto const same_kind = !buffer.empty() && buffer.back().m_type == op.m_type;

            if (op.m_type == Op::Type::AddValue) {
                if (same_kind) {
                    buffer.back().add_arg = uint8_t(buffer.back().add_arg + op.add_arg);
                    if (buffer.back().add_arg == 0)
                        buffer.pop_back();
                } else if (op.add_arg != 0) {
                    buffer.push_back(op);
                }
                continue;
            }
            if (op.m_type == Op::Type::MovePointer) {
                if (same_kind) {
                    buffer.back().move_arg += op.move_arg;
                    if (buffer.back().move_arg == 0)
                        buffer.pop_back();
                } else if (op.move_arg != 0) {
                    buffer.push_back(op);
                }
                continue;
            }
            buffer.push_back(op);
        }
        return buffer;
    }

    auto reduce_idioms(std::span<Op const> buffer_in) -> std::vector<Op> {
        std::vector<Op> buffer;
        buffer.reserve(buffer_in.size());

        while (not buffer_in.empty()) {
            if (matches(buffer_in, { Op::Type::LoopStart, Op::Type::AddValue, Op::Type::LoopEnd })) {
                // [-] and [+]
                if (buffer_in[1].add_arg == 1 || buffer_in[1].add_arg == 255) {
                    buffer_in = buffer_in.subspan<3>();
                    buffer.push_back( Op::set(0) );
                    continue;
                }
            }
            if (matches(buffer_in, { Op::Type::LoopStart, Op::Type::MovePointer, Op::Type::LoopEnd })) {
                buffer.push_back( Op::scan(buffer_in[1].move_arg) );
                buffer_in = buffer_in.subspan<3>();
                continue;
            }

            buffer.push_back(buffer_in[0]);
            buffer_in = buffer_in.subspan<1>();
        }
        return buffer;
    }

    auto optimize(std::span<Op const> buffer_in) -> std::vector<Op> {
        auto buffer = reduce_idioms(fuse_runs(buffer_in));
        do_loop_relink(buffer);
        return buffer;
    }

    void do_loop_relink(std::span<Op> buffer) {
        std::stack<size_t> loop_stack;
        for (size_t i = 0; i < buffer.size(); i++) {
            if (buffer[i].m_type == Op::Type::LoopStart)
                loop_stack.push( i );
            else if (buffer[i].m_type == Op::Type::LoopEnd) {
                if (loop_stack.empty())
                    throw Error(ErrorKind::UnbalancedLoop, "loop end at instruction {} has no loop start", i);
                auto loop_beg = loop_stack.top();
                loop_stack.pop();
                buffer[loop_beg].loop_arg = i;
                buffer[i].loop_arg = loop_beg;
            }
        }
        if (!loop_stack.empty())
            throw Error(ErrorKind::UnbalancedLoop, "loop start at instruction {} is never closed", loop_stack.top());
    }

    bool matches(std::span<Op const> code, std::initializer_list<Op::Type> sequence) {
        if (code.size() < sequence.size())
            return false;
        size_t i = 0;
        for (auto const type : sequence)
            if (code[i++].m_type != type)
                return false;
        return true;
    }

}
