#include "jit.hpp"
#include "error.hpp"

// Built on processors without a code generator; the interpreter is the
// only backend there.

namespace tapejit {

    JIT::JIT(std::span<Op const> bytecode) :
        m_bytecode(bytecode),
        m_code_size(0)
    {}
    JIT::~JIT() = default;

    auto jit_supported() -> bool { return false; }

    void JIT::do_codegen() {
        throw Error(ErrorKind::CodegenFailure, "no native code generator for this processor, run with the interpreter (-i)");
    }
    void JIT::run_until_end(Tape&, Runtime&) {
        throw Error(ErrorKind::CodegenFailure, "no compiled code, do_codegen has to run first");
    }

}
