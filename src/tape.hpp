#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tapejit {

    // Byte cells plus a pointer. Storage only grows to the right and the
    // pointer never leaves it; moving below cell 0 throws TapeUnderflow.
    class Tape {
    public:
        static constexpr size_t initial_size = 4096;

        Tape();
        explicit Tape(size_t size);

        void move(int64_t delta);
        // Grows storage so that `index` is addressable.
        void reserve(size_t index);

        [[nodiscard]]
        auto current() -> uint8_t& { return m_cells[m_ptr]; }
        [[nodiscard]]
        auto current() const -> uint8_t { return m_cells[m_ptr]; }
        [[nodiscard]]
        auto pointer() const -> size_t { return m_ptr; }
        void set_pointer(size_t index);

        [[nodiscard]]
        auto data() -> uint8_t* { return m_cells.data(); }
        [[nodiscard]]
        auto size() const -> size_t { return m_cells.size(); }
        [[nodiscard]]
        auto cells() const -> std::vector<uint8_t> const& { return m_cells; }
        [[nodiscard]]
        auto operator[](size_t index) -> uint8_t&;

    private:
        std::vector<uint8_t> m_cells;
        size_t m_ptr;
    };

}
