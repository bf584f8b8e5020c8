#include "tape.hpp"
#include "error.hpp"
#include <algorithm>

namespace tapejit {

    Tape::Tape() : Tape(initial_size) {}

    Tape::Tape(size_t size) :
        m_cells(std::max<size_t>(size, 1), 0),
        m_ptr(0)
    {}

    void Tape::move(int64_t delta) {
        auto const new_ptr = int64_t(m_ptr) + delta;
        if (new_ptr < 0)
            throw Error(ErrorKind::TapeUnderflow, "pointer moved to cell {}, left of the tape start", new_ptr);
        reserve(size_t(new_ptr));
        m_ptr = size_t(new_ptr);
    }

    void Tape::reserve(size_t index) {
        if (index < m_cells.size())
            return;
        m_cells.resize(std::max(m_cells.size() * 2, index + 1), 0);
    }

    void Tape::set_pointer(size_t index) {
        reserve(index);
        m_ptr = index;
    }

    auto Tape::operator[](size_t index) -> uint8_t& {
        reserve(index);
        return m_cells[index];
    }

}
