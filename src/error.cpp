#include "error.hpp"

namespace tapejit {

    Error::Error(ErrorKind kind, std::string const& message) :
        std::runtime_error(message),
        m_kind(kind)
    {}

    auto error_kind_name(ErrorKind kind) -> std::string_view {
        switch (kind) {
            case ErrorKind::UnbalancedLoop: return "unbalanced loop";
            case ErrorKind::TapeUnderflow:  return "tape underflow";
            case ErrorKind::CodegenFailure: return "codegen failure";
            case ErrorKind::IoFailure:      return "i/o failure";
        }
        return "unknown error";
    }

    auto exit_code(ErrorKind kind) -> int {
        switch (kind) {
            case ErrorKind::UnbalancedLoop: return 2;
            case ErrorKind::TapeUnderflow:  return 3;
            case ErrorKind::CodegenFailure: return 4;
            case ErrorKind::IoFailure:      return 5;
        }
        return 1;
    }

}
