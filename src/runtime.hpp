#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>

namespace tapejit {

    // The two I/O primitives shared by the interpreter and the JIT.
    class Runtime {
    public:
        Runtime(std::istream& input, std::ostream& output);
        ~Runtime();
        Runtime(Runtime const&) = delete;
        Runtime& operator = (Runtime const&) = delete;

        // Empty at end of input. Pending output is flushed first so that
        // prompts are visible before the program blocks on input.
        [[nodiscard]]
        auto read_byte() -> std::optional<uint8_t>;
        void write_byte(uint8_t value);
        void flush();

        // Input instruction: end of input leaves the cell unchanged.
        [[nodiscard]]
        auto read_into(uint8_t current) -> uint8_t;

    private:
        std::istream& m_input;
        std::ostream& m_output;
    };

}
