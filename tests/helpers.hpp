#pragma once

#undef NDEBUG
#include <cassert>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine.hpp"
#include "error.hpp"
#include "jit.hpp"
#include "options.hpp"
#include "tape.hpp"

// Stops after the fifth '.', prints "Hello"
inline constexpr std::string_view hello_short =
    "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.";
inline constexpr std::string_view hello_world =
    "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++."
    ">>.<-.<.+++.------.--------.>>+.>++.";

inline tapejit::EngineOptions mode(tapejit::Backend backend, bool optimize) {
    return tapejit::EngineOptions{ .optimize = optimize, .backend = backend, .debug_info = false };
}

// Compiles and runs `code` on `tape`, returns everything written to the output.
inline std::string run(std::string_view code, tapejit::EngineOptions const& options, tapejit::Tape& tape,
                       std::string const& input = "") {
    std::istringstream in(input);
    std::ostringstream out;
    auto const program = tapejit::compile_program(code, options.optimize);
    tapejit::run_program(program, options, tape, in, out);
    return out.str();
}

inline std::string run(std::string_view code, tapejit::EngineOptions const& options, std::string const& input = "") {
    tapejit::Tape tape;
    return run(code, options, tape, input);
}

// Runs `fn` and returns the kind of the tapejit::Error it threw; asserts that it threw.
template <typename Fn>
tapejit::ErrorKind expect_error(Fn&& fn) {
    try {
        fn();
    } catch (tapejit::Error const& e) {
        return e.kind();
    }
    assert(false && "expected a tapejit::Error");
    return tapejit::ErrorKind::CodegenFailure;
}

// Backends this build can run; the JIT only where a code generator exists
inline std::vector<tapejit::Backend> available_backends() {
    if (tapejit::jit_supported())
        return { tapejit::Backend::Interpreter, tapejit::Backend::Jit };
    return { tapejit::Backend::Interpreter };
}
