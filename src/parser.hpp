#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace tapejit {

    struct Op {
        enum class Type {
            MovePointer,
            AddValue,
            Output,
            Input,
            LoopStart,
            LoopEnd,

            // Optimized operations
            SetValue,
            ScanUntilZero,
        } m_type;
        union {
            uint8_t add_arg;      // wraps modulo 256, 255 is a decrement
            uint8_t set_arg;
            int64_t move_arg;
            int64_t scan_arg;
            size_t loop_arg;      // index of the matching loop instruction
        };

        [[nodiscard]]
        static auto move(int64_t delta) -> Op { return Op{ .m_type = Type::MovePointer, .move_arg = delta }; }
        [[nodiscard]]
        static auto add(uint8_t delta) -> Op { return Op{ .m_type = Type::AddValue, .add_arg = delta }; }
        [[nodiscard]]
        static auto set(uint8_t value) -> Op { return Op{ .m_type = Type::SetValue, .set_arg = value }; }
        [[nodiscard]]
        static auto scan(int64_t step) -> Op { return Op{ .m_type = Type::ScanUntilZero, .scan_arg = step }; }
        [[nodiscard]]
        static auto output() -> Op { return Op{ .m_type = Type::Output, .loop_arg = 0 }; }
        [[nodiscard]]
        static auto input() -> Op { return Op{ .m_type = Type::Input, .loop_arg = 0 }; }
        [[nodiscard]]
        static auto loop_start(size_t end) -> Op { return Op{ .m_type = Type::LoopStart, .loop_arg = end }; }
        [[nodiscard]]
        static auto loop_end(size_t start) -> Op { return Op{ .m_type = Type::LoopEnd, .loop_arg = start }; }

        friend auto operator==(Op const& lhs, Op const& rhs) -> bool;
    };

    using Program = std::vector<Op>;

    // One instruction character of the source, with its 1-based position
    struct Token {
        char symbol;
        uint32_t line;
        uint32_t column;
    };

    [[nodiscard]]
    auto is_instruction(char ch) -> bool;

    // Drops comment characters and checks that brackets are balanced.
    // Throws Error(UnbalancedLoop) pointing at the offending bracket.
    [[nodiscard]]
    auto lex_program(std::string_view source) -> std::vector<Token>;

    // Turns tokens into a Program with every loop linked to its partner.
    [[nodiscard]]
    auto build_program(std::span<Token const> tokens) -> Program;

    [[nodiscard]]
    auto parse_program(std::string_view source) -> Program;

    // True when every LoopStart/LoopEnd pair points at each other and pairs nest.
    [[nodiscard]]
    auto loops_are_linked(std::span<Op const> program) -> bool;

}
