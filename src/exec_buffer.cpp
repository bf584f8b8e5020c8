#include "exec_buffer.hpp"
#include "error.hpp"

#include <algorithm>
#include <limits>

#include <asmjit/core.h>

namespace tapejit {

    ExecBuffer::ExecBuffer(size_t size) :
        m_data(nullptr),
        m_size(0),
        m_executable(false)
    {
        auto const page = size_t(asmjit::VirtMem::info().pageSize);
        if (size > std::numeric_limits<size_t>::max() - page)
            throw Error(ErrorKind::CodegenFailure, "cannot allocate {} bytes of code memory", size);
        m_size = (std::max<size_t>(size, 1) + page - 1) / page * page;

        auto const err = asmjit::VirtMem::alloc(&m_data, m_size, asmjit::VirtMem::MemoryFlags::kAccessRW);
        if (err != asmjit::kErrorOk) {
            m_data = nullptr;
            throw Error(ErrorKind::CodegenFailure, "failed to allocate {} bytes of code memory: {}",
                m_size, asmjit::DebugUtils::errorAsString(err));
        }
    }

    ExecBuffer::~ExecBuffer() {
        if (m_data != nullptr)
            asmjit::VirtMem::release(m_data, m_size);
    }

    void ExecBuffer::make_executable() {
        if (m_executable)
            return;
        auto const err = asmjit::VirtMem::protect(m_data, m_size, asmjit::VirtMem::MemoryFlags::kAccessRX);
        if (err != asmjit::kErrorOk)
            throw Error(ErrorKind::CodegenFailure, "failed to make code memory executable: {}",
                asmjit::DebugUtils::errorAsString(err));
        asmjit::VirtMem::flushInstructionCache(m_data, m_size);
        m_executable = true;
    }

}
