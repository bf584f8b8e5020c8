#include "helpers.hpp"

#include <sstream>
#include <string>
#include <vector>

#include "interpreter.hpp"
#include "optimizer.hpp"
#include "parser.hpp"
#include "runtime.hpp"

using tapejit::Backend;

static void test_hello() {
    for (bool const optimize : { false, true }) {
        assert(run(hello_short, mode(Backend::Interpreter, optimize)) == "Hello");
        assert(run(hello_world, mode(Backend::Interpreter, optimize)) == "Hello World!\n");
    }
}

static void test_echo() {
    for (bool const optimize : { false, true }) {
        assert(run(",.", mode(Backend::Interpreter, optimize), "\x41") == "\x41");
        assert(run(",.,.,.", mode(Backend::Interpreter, optimize), "abc") == "abc");
    }
}

static void test_eof_leaves_cell_unchanged() {
    tapejit::Tape tape;
    tape.current() = 42;
    auto const out = run(",.", mode(Backend::Interpreter, false), tape, "");
    assert(out == "*");
    assert(tape.current() == 42);
}

static void test_wrapping() {
    tapejit::Tape tape;
    run("-", mode(Backend::Interpreter, false), tape);
    assert(tape.current() == 255);
    run("++", mode(Backend::Interpreter, true), tape);
    assert(tape.current() == 1);
}

static void test_loops() {
    tapejit::Tape tape;
    run("++[>++<-]", mode(Backend::Interpreter, false), tape);
    assert(tape[0] == 0);
    assert(tape[1] == 4);
    assert(tape.pointer() == 0);
}

// [-] on a cell holding 200: the plain loop takes 200 iterations, the
// optimized program a single SetValue
static void test_clear_loop_from_200() {
    std::istringstream in;
    std::ostringstream out;
    tapejit::Runtime runtime(in, out);

    auto const plain = tapejit::parse_program("[-]");
    tapejit::Tape plain_tape;
    plain_tape.current() = 200;
    tapejit::Interpreter interpreter(plain, plain_tape, runtime);
    size_t iterations = 0;
    while (!interpreter.finished()) {
        if (interpreter.m_ip == 1)
            iterations++;
        assert(interpreter.run_one_step());
    }
    assert(iterations == 200);
    assert(plain_tape.current() == 0);

    auto const fast = tapejit::optimize(plain);
    assert(fast.size() == 1 && fast[0] == tapejit::Op::set(0));
    tapejit::Tape fast_tape;
    fast_tape.current() = 200;
    tapejit::Interpreter fast_interpreter(fast, fast_tape, runtime);
    fast_interpreter.run_until_end();
    assert(fast_tape.current() == 0);
    assert(fast_tape.cells() == plain_tape.cells());
}

// +[] is well formed, it just never stops
static void test_infinite_loop_is_not_a_build_error() {
    for (bool const optimize : { false, true }) {
        auto const program = tapejit::compile_program("+[]", optimize);
        std::istringstream in;
        std::ostringstream out;
        tapejit::Runtime runtime(in, out);
        tapejit::Tape tape;
        tapejit::Interpreter interpreter(program, tape, runtime);
        for (int i = 0; i < 100000; i++)
            assert(interpreter.run_one_step());
        assert(!interpreter.finished());
        assert(tape.current() == 1);
    }
}

static void test_underflow() {
    for (bool const optimize : { false, true }) {
        auto const options = mode(Backend::Interpreter, optimize);
        assert(expect_error([&] { run("<", options); }) == tapejit::ErrorKind::TapeUnderflow);
        assert(expect_error([&] { run(">><<<", options); }) == tapejit::ErrorKind::TapeUnderflow);
        assert(expect_error([&] { run("+[<]", options); }) == tapejit::ErrorKind::TapeUnderflow);
    }
}

static void test_output_before_underflow_is_kept() {
    std::istringstream in;
    std::ostringstream out;
    tapejit::Tape tape;
    auto const program = tapejit::compile_program("+++.<", false);
    auto const kind = expect_error([&] {
        tapejit::run_program(program, mode(Backend::Interpreter, false), tape, in, out);
    });
    assert(kind == tapejit::ErrorKind::TapeUnderflow);
    assert(out.str() == "\x03");
}

static void test_tape_grows_right() {
    for (bool const optimize : { false, true }) {
        tapejit::Tape tape;
        auto const far = std::string(tapejit::Tape::initial_size * 3, '>');
        run(far + "+++", mode(Backend::Interpreter, optimize), tape);
        assert(tape.pointer() == tapejit::Tape::initial_size * 3);
        assert(tape.size() > tapejit::Tape::initial_size * 3);
        assert(tape.current() == 3);
    }
    // a scan that walks past the end of the tape
    tapejit::Tape tape(8);
    for (size_t i = 0; i < 8; i++)
        tape[i] = 1;
    run("[>]+", mode(Backend::Interpreter, true), tape);
    assert(tape.pointer() == 8);
    assert(tape.current() == 1);
}

static void test_unbalanced() {
    for (bool const optimize : { false, true })
        assert(expect_error([&] { run("]", mode(Backend::Interpreter, optimize)); }) == tapejit::ErrorKind::UnbalancedLoop);
}

int main() {
    test_hello();
    test_echo();
    test_eof_leaves_cell_unchanged();
    test_wrapping();
    test_loops();
    test_clear_loop_from_200();
    test_infinite_loop_is_not_a_build_error();
    test_underflow();
    test_output_before_underflow_is_kept();
    test_tape_grows_right();
    test_unbalanced();
    return 0;
}
