#pragma once

#include <cstddef>
#include <cstdint>

namespace tapejit {

    // Page-aligned memory for generated code. It starts out read/write and
    // is switched to read/execute once, never both at the same time. The
    // pages are released when the buffer goes out of scope.
    class ExecBuffer {
    public:
        explicit ExecBuffer(size_t size);
        ~ExecBuffer();
        ExecBuffer(ExecBuffer const&) = delete;
        ExecBuffer(ExecBuffer&&) = delete;
        ExecBuffer& operator = (ExecBuffer const&) = delete;
        ExecBuffer& operator = (ExecBuffer&&) = delete;

        void make_executable();

        [[nodiscard]]
        auto data() const -> uint8_t* { return static_cast<uint8_t*>(m_data); }
        [[nodiscard]]
        auto size() const -> size_t { return m_size; }
        [[nodiscard]]
        auto executable() const -> bool { return m_executable; }

        template <typename Fn>
        [[nodiscard]]
        auto entry() const -> Fn { return reinterpret_cast<Fn>(m_data); }

    private:
        void* m_data;
        size_t m_size;
        bool m_executable;
    };

}
