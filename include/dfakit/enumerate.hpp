#ifndef DFAKIT_ENUMERATE_H
#define DFAKIT_ENUMERATE_H

#include "automaton.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace dfakit::model
{
    // every word of exactly `length` symbols that walks the automaton from its
    // current state into a terminal state, in edge declaration order
    [[nodiscard]]
    auto enumerate_paths(const Automaton& automaton, std::size_t length) -> std::vector<std::string>;
}

#endif
