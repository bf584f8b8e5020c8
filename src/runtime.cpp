#include "runtime.hpp"
#include "error.hpp"

namespace tapejit {

    Runtime::Runtime(std::istream& input, std::ostream& output) :
        m_input(input),
        m_output(output)
    {}

    Runtime::~Runtime() {
        m_output.flush();
    }

    auto Runtime::read_byte() -> std::optional<uint8_t> {
        flush();
        auto const ch = m_input.get();
        if (ch == std::istream::traits_type::eof()) {
            if (m_input.bad())
                throw Error(ErrorKind::IoFailure, "failed to read from the input stream");
            return std::nullopt;
        }
        return uint8_t(ch);
    }

    void Runtime::write_byte(uint8_t value) {
        m_output.put(char(value));
        if (!m_output)
            throw Error(ErrorKind::IoFailure, "failed to write to the output stream");
    }

    void Runtime::flush() {
        m_output.flush();
        if (!m_output)
            throw Error(ErrorKind::IoFailure, "failed to flush the output stream");
    }

    auto Runtime::read_into(uint8_t current) -> uint8_t {
        return read_byte().value_or(current);
    }

}
