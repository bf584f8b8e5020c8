#include "jit.hpp"
#include "error.hpp"
#include "parser.hpp"

#include <asmjit/x86.h>
#include <fmt/format.h>

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>

namespace x64 = asmjit::x86;

// Register model, all callee saved so host calls leave them intact:
// r12 = &tape[0]
// r13 = pointer (index into the tape)
// r14 = tape size
// r15 = JitHost*
constexpr auto DATA_BASE  = x64::r12;
constexpr auto DATA_INDEX = x64::r13;
constexpr auto DATA_SIZE  = x64::r14;
constexpr auto HOST       = x64::r15;

struct EHandler : public asmjit::ErrorHandler {
	asmjit::Error m_error = asmjit::kErrorOk;
	std::string m_message;

	void handleError(asmjit::Error err, char const* msg, asmjit::BaseEmitter*) override {
		if (m_error == asmjit::kErrorOk) {
			m_error = err;
			m_message = msg;
		}
	}
};

// Host trampolines. They must not throw across the generated frames, so
// failures are parked in JitHost::pending and rethrown after the call.
uint32_t jit_write_byte(tapejit::JitHost* host, uint32_t value) noexcept {
	try {
		host->runtime->write_byte(uint8_t(value));
		return 0;
	} catch (...) {
		*host->pending = std::current_exception();
		return 1;
	}
}

int32_t jit_read_byte(tapejit::JitHost* host, uint32_t current) noexcept {
	try {
		return host->runtime->read_into(uint8_t(current));
	} catch (...) {
		*host->pending = std::current_exception();
		return -1;
	}
}

// Called when the pointer left [0, size). Returns the (possibly moved)
// tape base, or nullptr when the run has to stop.
uint8_t* jit_reserve(tapejit::JitHost* host, uint64_t index) noexcept {
	if (int64_t(index) < 0) {
		host->underflow = true;
		host->underflow_index = int64_t(index);
		return nullptr;
	}
	try {
		host->tape->reserve(index);
		host->size = host->tape->size();
		return host->tape->data();
	} catch (...) {
		*host->pending = std::current_exception();
		return nullptr;
	}
}

template <typename Fn>
asmjit::Imm host_address(Fn* fn) {
	return asmjit::Imm(uint64_t(fn));
}

x64::Mem current_cell() {
	return x64::byte_ptr(DATA_BASE, DATA_INDEX);
}

void emit_move(x64::Assembler& a, int64_t delta, asmjit::Label const& exit);
void do_codegen(x64::Assembler& a, std::span<tapejit::Op const> code, asmjit::Label const& exit);

namespace tapejit {

    JIT::JIT(std::span<Op const> bytecode) :
        m_bytecode(bytecode),
        m_code_size(0)
    {}
    JIT::~JIT() = default;

    auto jit_supported() -> bool { return true; }

    void JIT::do_codegen() {
        EHandler ehandler;

        asmjit::CodeHolder code_holder;
        auto err = code_holder.init(asmjit::Environment::host());
        if (err != asmjit::kErrorOk)
            throw Error(ErrorKind::CodegenFailure, "asmjit error: {}", asmjit::DebugUtils::errorAsString(err));
        code_holder.setErrorHandler(&ehandler);

        x64::Assembler a(&code_holder);
        auto exit_label = a.newLabel();

        // rsp is 8 off a 16 byte boundary on entry, five pushes realign it
        // for the host calls
        a.push(x64::rbp);
        a.mov(x64::rbp, x64::rsp);
        a.push(DATA_BASE);
        a.push(DATA_INDEX);
        a.push(DATA_SIZE);
        a.push(HOST);
        a.mov(DATA_BASE, x64::rdi);
        a.mov(DATA_SIZE, x64::rsi);
        a.mov(HOST, x64::rdx);
        a.mov(DATA_INDEX, x64::qword_ptr(HOST, int32_t(offsetof(JitHost, index))));

        ::do_codegen(a, m_bytecode, exit_label);

        a.bind(exit_label);
        a.mov(x64::qword_ptr(HOST, int32_t(offsetof(JitHost, index))), DATA_INDEX);
        a.pop(HOST);
        a.pop(DATA_SIZE);
        a.pop(DATA_INDEX);
        a.pop(DATA_BASE);
        a.pop(x64::rbp);
        a.ret();

        if (ehandler.m_error != asmjit::kErrorOk)
            throw Error(ErrorKind::CodegenFailure, "asmjit error: {} ({})", ehandler.m_message, ehandler.m_error);

        err = code_holder.flatten();
        if (err == asmjit::kErrorOk)
            err = code_holder.resolveUnresolvedLinks();
        if (err != asmjit::kErrorOk)
            throw Error(ErrorKind::CodegenFailure, "asmjit error: {}", asmjit::DebugUtils::errorAsString(err));

        auto const size = code_holder.codeSize();
        auto buffer = std::make_unique<ExecBuffer>(size);
        err = code_holder.relocateToBase(uint64_t(buffer->data()));
        if (err == asmjit::kErrorOk)
            err = code_holder.copyFlattenedData(buffer->data(), buffer->size(), asmjit::CopySectionFlags::kPadSectionBuffer);
        if (err != asmjit::kErrorOk)
            throw Error(ErrorKind::CodegenFailure, "asmjit error: {}", asmjit::DebugUtils::errorAsString(err));
        buffer->make_executable();

        m_code = std::move(buffer);
        m_code_size = size;
    }
    void JIT::run_until_end(Tape& tape, Runtime& runtime) {
        if (!m_code)
            throw Error(ErrorKind::CodegenFailure, "no compiled code, do_codegen has to run first");

        // single use, released on every way out of this function
        auto const code = std::move(m_code);

        std::exception_ptr pending;
        JitHost host{
            .size = tape.size(),
            .index = tape.pointer(),
            .tape = &tape,
            .runtime = &runtime,
            .pending = &pending,
            .underflow = false,
            .underflow_index = 0,
        };
        auto const main_function = code->entry<MFuncType>();
        main_function(tape.data(), tape.size(), &host);

        if (pending)
            std::rethrow_exception(pending);
        if (host.underflow)
            throw Error(ErrorKind::TapeUnderflow, "pointer moved to cell {}, left of the tape start", host.underflow_index);
        tape.set_pointer(host.index);
        runtime.flush();
    }
}

void emit_move(x64::Assembler& a, int64_t delta, asmjit::Label const& exit) {
	if (delta >= std::numeric_limits<int32_t>::min() && delta <= std::numeric_limits<int32_t>::max()) {
		a.add(DATA_INDEX, asmjit::Imm(int32_t(delta)));
	} else {
		a.mov(x64::rax, asmjit::Imm(delta));
		a.add(DATA_INDEX, x64::rax);
	}
	// unsigned compare catches both ends, a negative index wraps to a huge one
	auto in_bounds = a.newLabel();
	a.cmp(DATA_INDEX, DATA_SIZE);
	a.jb(in_bounds);
	a.mov(x64::rdi, HOST);
	a.mov(x64::rsi, DATA_INDEX);
	a.mov(x64::rax, host_address(&jit_reserve));
	a.call(x64::rax);
	a.test(x64::rax, x64::rax);
	a.jz(exit);
	a.mov(DATA_BASE, x64::rax);
	a.mov(DATA_SIZE, x64::qword_ptr(HOST, int32_t(offsetof(tapejit::JitHost, size))));
	a.bind(in_bounds);
}

void do_codegen(x64::Assembler& a, std::span<tapejit::Op const> code, asmjit::Label const& exit) {
	struct LoopLabels {
		asmjit::Label body;
		asmjit::Label end;
	};
	// pending forward branches, keyed by the index of their LoopStart
	std::unordered_map<size_t, LoopLabels> open_loops;

	for (size_t i = 0; i < code.size(); i++) {
		auto const& op = code[i];
		switch (op.m_type) {
		case tapejit::Op::Type::AddValue:
			a.add(current_cell(), asmjit::Imm(int8_t(op.add_arg)));
			break;
		case tapejit::Op::Type::MovePointer:
			emit_move(a, op.move_arg, exit);
			break;
		case tapejit::Op::Type::SetValue:
			a.mov(current_cell(), asmjit::Imm(int8_t(op.set_arg)));
			break;
		case tapejit::Op::Type::Output:
			a.mov(x64::rdi, HOST);
			a.movzx(x64::esi, current_cell());
			a.mov(x64::rax, host_address(&jit_write_byte));
			a.call(x64::rax);
			a.test(x64::eax, x64::eax);
			a.jnz(exit);
			break;
		case tapejit::Op::Type::Input:
			a.mov(x64::rdi, HOST);
			a.movzx(x64::esi, current_cell());
			a.mov(x64::rax, host_address(&jit_read_byte));
			a.call(x64::rax);
			a.test(x64::eax, x64::eax);
			a.js(exit);
			a.mov(current_cell(), x64::al);
			break;
		case tapejit::Op::Type::LoopStart: {
			auto labels = LoopLabels{ .body = a.newLabel(), .end = a.newLabel() };
			a.cmp(current_cell(), asmjit::Imm(0));
			a.je(labels.end);
			a.bind(labels.body);
			open_loops.emplace(i, labels);
			break;
		}
		case tapejit::Op::Type::LoopEnd: {
			auto const it = open_loops.find(op.loop_arg);
			if (it == open_loops.end())
				throw tapejit::Error(tapejit::ErrorKind::CodegenFailure, "loop end at instruction {} is not linked to an open loop", i);
			a.cmp(current_cell(), asmjit::Imm(0));
			a.jne(it->second.body);
			a.bind(it->second.end);
			open_loops.erase(it);
			break;
		}
		case tapejit::Op::Type::ScanUntilZero: {
			auto again = a.newLabel();
			auto done = a.newLabel();
			a.cmp(current_cell(), asmjit::Imm(0));
			a.je(done);
			a.bind(again);
			emit_move(a, op.scan_arg, exit);
			a.cmp(current_cell(), asmjit::Imm(0));
			a.jne(again);
			a.bind(done);
			break;
		}
		}
	}
	if (!open_loops.empty())
		throw tapejit::Error(tapejit::ErrorKind::CodegenFailure, "{} loops were never closed", open_loops.size());
}
