#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace tapejit {

    enum class ErrorKind {
        UnbalancedLoop,
        TapeUnderflow,
        CodegenFailure,
        IoFailure,
    };

    // Fatal error for the current run, surfaced to whoever invoked the engine
    class Error : public std::runtime_error {
    public:
        Error(ErrorKind kind, std::string const& message);

        template <typename... Args>
        Error(ErrorKind kind, fmt::format_string<Args...> format, Args&&... args) :
            Error(kind, fmt::format(format, std::forward<Args>(args)...))
        {}

        [[nodiscard]]
        auto kind() const noexcept -> ErrorKind { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    [[nodiscard]]
    auto error_kind_name(ErrorKind kind) -> std::string_view;

    // Process exit status used by the command line wrapper, stable across releases
    [[nodiscard]]
    auto exit_code(ErrorKind kind) -> int;

}
