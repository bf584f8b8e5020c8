#pragma once

#include "parser.hpp"
#include "runtime.hpp"
#include "tape.hpp"
#include <cstdint>
#include <span>

namespace tapejit {

    struct Interpreter {
        Tape& m_tape;
        Runtime& m_runtime;
        size_t m_ip;
        std::span<Op const> m_bytecode;

        Interpreter(std::span<Op const> bytecode, Tape& tape, Runtime& runtime);
        ~Interpreter() = default;
        Interpreter(Interpreter const&) = delete;
        Interpreter& operator = (Interpreter const&) = delete;

        void run_until_end();

        [[nodiscard]]
        auto run_one_step() -> bool;
        [[nodiscard]]
        auto finished() const -> bool;
    };

}
