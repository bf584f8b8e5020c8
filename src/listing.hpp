#pragma once

#include "parser.hpp"
#include <span>
#include <string>

namespace tapejit {

    // Human readable dump of a program, loop bodies indented one space per level.
    [[nodiscard]]
    auto format_program(std::span<Op const> code) -> std::string;

}
