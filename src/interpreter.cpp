#include "interpreter.hpp"
#include "parser.hpp"
#include <cstdint>
#include <span>

namespace tapejit {

    Interpreter::Interpreter(std::span<Op const> bytecode, Tape& tape, Runtime& runtime) :
        m_tape(tape),
        m_runtime(runtime),
        m_ip(0),
        m_bytecode(bytecode)
    {}

    auto Interpreter::finished() const -> bool {
        return m_ip == m_bytecode.size();
    }
    auto Interpreter::run_one_step() -> bool {
        if (finished())
            return false;

        auto const& c_inst = m_bytecode[m_ip++];
        switch (c_inst.m_type) {
            case Op::Type::AddValue:
                m_tape.current() += c_inst.add_arg;
                break;
            case Op::Type::MovePointer:
                m_tape.move(c_inst.move_arg);
                break;
            case Op::Type::Input:
                m_tape.current() = m_runtime.read_into(m_tape.current());
                break;
            case Op::Type::Output:
                m_runtime.write_byte(m_tape.current());
                break;
            case Op::Type::LoopStart:
                if (m_tape.current() == 0) {
                    m_ip = c_inst.loop_arg+1;
                }
                break;
            case Op::Type::LoopEnd:
                if (m_tape.current() != 0) {
                    m_ip = c_inst.loop_arg;
                }
                break;
            case Op::Type::SetValue:
                m_tape.current() = c_inst.set_arg;
                break;
            case Op::Type::ScanUntilZero:
                while (m_tape.current() != 0)
                    m_tape.move(c_inst.scan_arg);
                break;
        }

        return true;
    }
    void Interpreter::run_until_end() {
        while (this->run_one_step());
        m_runtime.flush();
    }
}
