#pragma once

#include "options.hpp"
#include "parser.hpp"
#include "tape.hpp"
#include <istream>
#include <ostream>
#include <span>
#include <string_view>

namespace tapejit {

    // source -> lexer -> builder -> optional optimizer
    [[nodiscard]]
    auto compile_program(std::string_view source, bool optimize) -> Program;

    // Runs a finished program on the chosen backend against `tape`.
    // Throws Error on TapeUnderflow, CodegenFailure or IoFailure.
    void run_program(std::span<Op const> program, EngineOptions const& options,
                     Tape& tape, std::istream& input, std::ostream& output);

    // Whole pipeline on a fresh tape.
    void execute(std::string_view source, EngineOptions const& options,
                 std::istream& input, std::ostream& output);

}
