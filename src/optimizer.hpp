#pragma once

#include "parser.hpp"
#include <span>
#include <vector>

namespace tapejit {

    // Merges runs of MovePointer / AddValue and drops runs that cancel out.
    auto fuse_runs(std::span<Op const> buffer) -> std::vector<Op>;
    // Rewrites clear loops to SetValue(0) and scan loops to ScanUntilZero.
    auto reduce_idioms(std::span<Op const> buffer) -> std::vector<Op>;
    auto optimize(std::span<Op const> buffer) -> std::vector<Op>;
    void do_loop_relink(std::span<Op> buffer);

}
