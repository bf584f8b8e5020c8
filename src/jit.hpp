#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <span>

#include "exec_buffer.hpp"
#include "parser.hpp"
#include "runtime.hpp"
#include "tape.hpp"

namespace tapejit {

// State shared by the generated code and the host trampolines it calls.
// The generated code reads `size` and `index` directly, keep it standard layout.
struct JitHost {
  uint64_t size;
  uint64_t index;
  Tape *tape;
  Runtime *runtime;
  std::exception_ptr *pending;
  bool underflow;
  int64_t underflow_index;
};

class JIT {
public:
  using MFuncType = void (*)(uint8_t *base, uint64_t size, JitHost *host);

  explicit JIT(std::span<Op const> bytecode);
  ~JIT();
  JIT(JIT const &) = delete;
  JIT(JIT &&) = delete;
  JIT &operator=(JIT const &) = delete;
  JIT &operator=(JIT &&) = delete;

  void do_codegen();
  // Runs the compiled code once; the code buffer is released afterwards.
  void run_until_end(Tape &tape, Runtime &runtime);

  [[nodiscard]] auto code_size() const -> size_t { return m_code_size; }
  [[nodiscard]] auto compiled() const -> bool { return m_code != nullptr; }

private:
  std::span<Op const> m_bytecode;
  std::unique_ptr<ExecBuffer> m_code;
  size_t m_code_size;
};

// False when this build has no native code generator for the host processor
[[nodiscard]] auto jit_supported() -> bool;

} // namespace tapejit
