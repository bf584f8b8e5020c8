#include "engine.hpp"
#include "error.hpp"
#include "listing.hpp"
#include "options.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include <fmt/color.h>

#ifndef TAPEJIT_VERSION
#define TAPEJIT_VERSION "0.0.0"
#endif

std::optional<std::string> load_program(std::string const& path);
void print_error(std::string_view message);
void print_usage(char const* argv);

int main(int const argc, char const *argv[]) {
    tapejit::CLIOpts cli_opts;

    for (int i = 1; i < argc; i++) {
        auto arg = std::string_view{ argv[i] };
        if (arg.starts_with("-")) {
            if (arg == "-o") {
                cli_opts.optimize = true;
            } else if (arg == "-i") {
                cli_opts.run_interpreter = true;
            } else if (arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-V") {
                fmt::print("tapejit {}\n", TAPEJIT_VERSION);
                return 0;
            } else if (arg == "-p") {
                cli_opts.print_and_exit = true;
            } else if (arg == "-v") {
                cli_opts.debug_info = true;
            } else {
                print_error(fmt::format("unknown flag: {}", arg));
                print_usage(argv[0]);
                return 1;
            }
        } else {
            cli_opts.program_path = argv[i];
        }
    }
    if (cli_opts.program_path.empty()) {
        print_error("file to run not specified");
        print_usage(argv[0]);
        return 1;
    }
    auto const program = load_program(cli_opts.program_path);
    if (!program)
        return 1;

    try {
        if (cli_opts.print_and_exit) {
            auto const bytecode = tapejit::compile_program(*program, cli_opts.optimize);
            fmt::print("{}", tapejit::format_program(bytecode));
            return 0;
        }
        tapejit::execute(*program, cli_opts.engine_options(), std::cin, std::cout);
    } catch (tapejit::Error const& e) {
        std::cout.flush();
        print_error(fmt::format("{}: {}", tapejit::error_kind_name(e.kind()), e.what()));
        return tapejit::exit_code(e.kind());
    } catch (std::exception const& e) {
        std::cout.flush();
        print_error(e.what());
        return 1;
    }
    return 0;
}

std::optional<std::string> load_program(std::string const& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        print_error(fmt::format("{} is not a regular file", path));
        return std::nullopt;
    }
    auto const fsize = std::filesystem::file_size(path, ec);
    if (ec) {
        print_error(fmt::format("cannot stat {}: {}", path, ec.message()));
        return std::nullopt;
    }
    if (fsize > 16*1024*1024) {
        print_error(fmt::format("file is too big ({} KB)", (fsize + 511) / 1024));
        return std::nullopt;
    }
    auto handle = std::ifstream( path, std::ios::binary );
    std::string buffer;
    buffer.resize(fsize, 0);
    if (!handle.read(buffer.data(), std::streamsize(fsize))) {
        print_error(fmt::format("failed to read {}", path));
        return std::nullopt;
    }
    return buffer;
}

void print_error(std::string_view message) {
    fmt::print(stderr, fmt::fg(fmt::color::red) | fmt::emphasis::bold, "error");
    fmt::print(stderr, ": {}\n", message);
}

void print_usage(char const* argv) {
    fmt::print(R"(Usage:
{} [-o] [-i] SOURCE_FILE
OPTIONS:
    -o      run the optimizer before execution
    -i      use interpreter instead of JIT
    -p      print bytecode and exit
    -v      print diagnostics to stderr
    -h      print this message
    -V      print version
)", argv);
}
