#ifndef DFAKIT_PRESETS_H
#define DFAKIT_PRESETS_H

#include "automaton.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace dfakit::presets
{
    // "ab" followed by one or more "a"
    [[nodiscard]]
    auto ab_then_a() -> model::Automaton;

    // x+@x+.x+
    [[nodiscard]]
    auto email() -> model::Automaton;

    // ddd-ddd-dddd
    [[nodiscard]]
    auto phone_number() -> model::Automaton;

    [[nodiscard]]
    auto by_name(std::string_view name) -> std::optional<model::Automaton>;

    auto names() -> std::vector<std::string_view>;
}

#endif
