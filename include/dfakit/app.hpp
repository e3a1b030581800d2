#ifndef DFAKIT_APP_H
#define DFAKIT_APP_H

#include "automaton.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dfakit::app 
{
    struct Options
    {
        // exactly one of these names the automaton
        std::optional<std::filesystem::path> diagram;
        std::optional<std::string> preset;

        std::vector<std::string> accept_words;
        std::optional<std::size_t> enumerate_length;
        bool print_table{false};
    };

    // throws std::runtime_error if the automaton can't be loaded
    [[nodiscard]]
    auto load(const Options& options) -> model::Automaton;

    // the text printed for the requested queries, in the order
    // table, acceptance verdicts, enumerated paths
    [[nodiscard]]
    auto report(const model::Automaton& automaton, const Options& options) -> std::string;

    auto run(const Options& options) -> void;
}

#endif
