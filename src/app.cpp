#include "../include/dfakit/app.hpp"

#include "../include/dfakit/enumerate.hpp"
#include "../include/dfakit/model.hpp"
#include "../include/dfakit/parser.hpp"
#include "../include/dfakit/presets.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace dfakit::app
{
    auto load(const Options& options) -> model::Automaton
    {
        if (!options.diagram.has_value() && !options.preset.has_value())
        {
            throw std::runtime_error("<NO AUTOMATON> : give a diagram (-d) or a preset (-p)");
        }
        if (options.diagram.has_value() && options.preset.has_value())
        {
            throw std::runtime_error("<TWO AUTOMATA> : give either a diagram or a preset, not both");
        }

        if (options.preset.has_value())
        {
            auto automaton = presets::by_name(options.preset.value());
            if (!automaton)
            {
                throw std::runtime_error(fmt::format(
                    "<UNKNOWN PRESET> : '{}' is not one of {}",
                    options.preset.value(), fmt::join(presets::names(), ", ")));
            }
            spdlog::info("using preset '{}'", options.preset.value());
            return std::move(automaton.value());
        }

        // turn the diagram into tokens
        auto token_tuple =
            parser::read_diagram(options.diagram.value())
                .or_else(parser::HandleParseError);

        // break down the tuple into (s)tates and (a)rrows
        auto &[s, a] = token_tuple.value();

        auto automaton = model::build_automaton(s, a)
            .or_else(model::HandleModelError);

        spdlog::info("loaded {} with {} states", options.diagram->string(), automaton->states().size());
        return std::move(automaton.value());
    }

    auto report(const model::Automaton& automaton, const Options& options) -> std::string
    {
        std::string out;

        if (options.print_table)
        {
            out += fmt::format("initial: {}\n", automaton.initial());
            std::vector<model::State> terminals;
            for (const auto& state : automaton.states())
            {
                if (automaton.terminals().contains(state))
                {
                    terminals.push_back(state);
                }
            }
            out += fmt::format("terminal: {}\n", fmt::join(terminals, ", "));
            out += automaton.table().format();
        }

        for (const auto& word : options.accept_words)
        {
            out += fmt::format("{}: {}\n", word, automaton.accepts(word) ? "accepted" : "rejected");
        }

        if (options.enumerate_length.has_value())
        {
            auto paths = model::enumerate_paths(automaton, options.enumerate_length.value());
            for (const auto& path : paths)
            {
                out += fmt::format("{}\n", path);
            }
            out += fmt::format("{} path(s) of length {}\n", paths.size(), options.enumerate_length.value());
        }

        return out;
    }

    auto run(const Options& options) -> void
    {
        auto automaton = load(options);
        fmt::print("{}", report(automaton, options));
    }
}
