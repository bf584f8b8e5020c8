#include "helpers.hpp"

#include <string>
#include <vector>

#include "parser.hpp"

using tapejit::Op;

static void test_comments_are_dropped() {
    auto const tokens = tapejit::lex_program("a+b\n  -c.,#!");
    assert(tokens.size() == 4);
    assert(tokens[0].symbol == '+' && tokens[0].line == 1 && tokens[0].column == 2);
    assert(tokens[1].symbol == '-' && tokens[1].line == 2 && tokens[1].column == 3);
    assert(tokens[2].symbol == '.');
    assert(tokens[3].symbol == ',');
    assert(tapejit::parse_program("hello world, no code here").size() == 1);
    assert(tapejit::parse_program("").empty());
}

static void test_build_links_loops() {
    auto const program = tapejit::parse_program("+[,.]");
    std::vector<Op> const expected = {
        Op::add(1),
        Op::loop_start(4),
        Op::input(),
        Op::output(),
        Op::loop_end(1),
    };
    assert(program == expected);
}

static void test_single_char_ops() {
    auto const program = tapejit::parse_program("+-<>");
    assert(program[0] == Op::add(1));
    assert(program[1] == Op::add(255));
    assert(program[2] == Op::move(-1));
    assert(program[3] == Op::move(1));
}

static void test_nested_loops_are_linked() {
    for (auto const source : { std::string_view("[[][[]]]"), std::string_view("+[>[-]<[>+<-]]"), std::string_view("[][][]"), hello_world }) {
        auto const program = tapejit::parse_program(source);
        assert(tapejit::loops_are_linked(program));
        for (size_t i = 0; i < program.size(); i++) {
            if (program[i].m_type == Op::Type::LoopStart) {
                auto const j = program[i].loop_arg;
                assert(program[j].m_type == Op::Type::LoopEnd);
                assert(program[j].loop_arg == i);
            }
        }
    }
}

static void test_unbalanced_loops() {
    assert(expect_error([] { (void)tapejit::parse_program("]"); }) == tapejit::ErrorKind::UnbalancedLoop);
    assert(expect_error([] { (void)tapejit::parse_program("["); }) == tapejit::ErrorKind::UnbalancedLoop);
    assert(expect_error([] { (void)tapejit::parse_program("[[]"); }) == tapejit::ErrorKind::UnbalancedLoop);
    assert(expect_error([] { (void)tapejit::parse_program("[]]["); }) == tapejit::ErrorKind::UnbalancedLoop);
}

static void test_error_location() {
    try {
        (void)tapejit::lex_program("++\n+]");
        assert(false);
    } catch (tapejit::Error const& e) {
        assert(std::string(e.what()).find("2:2") != std::string::npos);
    }
    try {
        (void)tapejit::lex_program("[\n [ ]");
        assert(false);
    } catch (tapejit::Error const& e) {
        assert(std::string(e.what()).find("1:1") != std::string::npos);
    }
}

static void test_builder_rejects_unvalidated_tokens() {
    std::vector<tapejit::Token> const tokens = { { .symbol = ']', .line = 1, .column = 1 } };
    assert(expect_error([&] { (void)tapejit::build_program(tokens); }) == tapejit::ErrorKind::UnbalancedLoop);
}

static void test_loops_are_linked_detects_broken_links() {
    std::vector<Op> program = { Op::loop_start(1), Op::loop_end(0) };
    assert(tapejit::loops_are_linked(program));
    program[0].loop_arg = 0;
    assert(!tapejit::loops_are_linked(program));
    std::vector<Op> const crossing = { Op::loop_start(2), Op::loop_start(3), Op::loop_end(0), Op::loop_end(1) };
    assert(!tapejit::loops_are_linked(crossing));
}

int main() {
    test_comments_are_dropped();
    test_build_links_loops();
    test_single_char_ops();
    test_nested_loops_are_linked();
    test_unbalanced_loops();
    test_error_location();
    test_builder_rejects_unvalidated_tokens();
    test_loops_are_linked_detects_broken_links();
    return 0;
}
