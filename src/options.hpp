#pragma once

#include <string>

namespace tapejit {

    enum class Backend {
        Jit,
        Interpreter,
    };

    // What the core needs to know about a run
    struct EngineOptions {
        bool optimize = false;
        Backend backend = Backend::Jit;
        bool debug_info = false;
    };

    // Everything the command line can set
    struct CLIOpts {
        std::string program_path;
        bool optimize = false;
        bool run_interpreter = false;
        bool print_and_exit = false;
        bool debug_info = false;

        [[nodiscard]]
        auto engine_options() const -> EngineOptions {
            return EngineOptions{
                .optimize = optimize,
                .backend = run_interpreter ? Backend::Interpreter : Backend::Jit,
                .debug_info = debug_info,
            };
        }
    };

}
