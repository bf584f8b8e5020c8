#include "engine.hpp"
#include "interpreter.hpp"
#include "jit.hpp"
#include "optimizer.hpp"
#include "runtime.hpp"

#include <fmt/format.h>

namespace tapejit {

    auto compile_program(std::string_view source, bool optimize) -> Program {
        auto program = parse_program(source);
        if (optimize)
            program = tapejit::optimize(program);
        return program;
    }

    void run_program(std::span<Op const> program, EngineOptions const& options,
                     Tape& tape, std::istream& input, std::ostream& output) {
        auto runtime = Runtime(input, output);

        switch (options.backend) {
            case Backend::Interpreter: {
                auto interpreter = Interpreter(program, tape, runtime);
                interpreter.run_until_end();
                break;
            }
            case Backend::Jit: {
                auto jit = JIT(program);
                jit.do_codegen();
                if (options.debug_info)
                    fmt::print(stderr, "jit: {} instructions compiled to {} bytes\n", program.size(), jit.code_size());
                jit.run_until_end(tape, runtime);
                break;
            }
        }
    }

    void execute(std::string_view source, EngineOptions const& options,
                 std::istream& input, std::ostream& output) {
        auto const program = compile_program(source, options.optimize);
        if (options.debug_info)
            fmt::print(stderr, "program: {} instructions{}\n", program.size(), options.optimize ? " (optimized)" : "");

        auto tape = Tape();
        run_program(program, options, tape, input, output);
        if (options.debug_info)
            fmt::print(stderr, "tape: {} cells, pointer at {}\n", tape.size(), tape.pointer());
    }

}
