#include "listing.hpp"

#include <fmt/format.h>
#include <iterator>

namespace tapejit {

    auto format_program(std::span<Op const> code) -> std::string {
        std::string out;
        auto it = std::back_inserter(out);
        size_t depth = 0;

        for (auto const& op : code) {
            if (op.m_type == Op::Type::LoopEnd && depth > 0)
                depth--;
            fmt::format_to(it, "{:{}}", "", depth);
            switch (op.m_type) {
            case Op::Type::AddValue:
                fmt::format_to(it, "<{}:{}>\n", int8_t(op.add_arg) < 0 ? '-' : '+', int8_t(op.add_arg));
                break;
            case Op::Type::MovePointer:
                fmt::format_to(it, "<{}:{}>\n", op.move_arg < 0 ? '<' : '>', op.move_arg);
                break;
            case Op::Type::Input:
                fmt::format_to(it, "<In>\n");
                break;
            case Op::Type::Output:
                fmt::format_to(it, "<Out>\n");
                break;
            case Op::Type::LoopStart:
                fmt::format_to(it, "<LoopBegin>\n");
                depth++;
                break;
            case Op::Type::LoopEnd:
                fmt::format_to(it, "<LoopEnd>\n");
                break;
            case Op::Type::SetValue:
                fmt::format_to(it, "<Set:{}>\n", op.set_arg);
                break;
            case Op::Type::ScanUntilZero:
                fmt::format_to(it, "<Scan:{}>\n", op.scan_arg);
                break;
            }
        }
        return out;
    }

}
