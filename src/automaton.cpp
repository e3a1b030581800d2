#include "../include/dfakit/automaton.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dfakit::model
{
    namespace ranges = std::ranges;

    Automaton::Automaton(
        std::shared_ptr<const TransitionTable> table,
        State initial,
        Terminals_t terminals
    )
        : m_table{std::move(table)},
          m_initial{initial},
          m_terminals{std::move(terminals)},
          m_current{std::move(initial)}
    {}

    auto Automaton::create(
        const std::vector<Edge>& edges,
        const State& initial,
        const std::vector<State>& terminals
    ) -> tl::expected<Automaton, AutomatonError>
    {
        auto table = std::make_shared<TransitionTable>();
        for (const auto& edge : edges)
        {
            if (!table->insert(edge))
            {
                spdlog::debug("rejecting edge {} -{}-> {}: {} already has an edge on '{}'",
                    edge.m_source, edge.m_symbol, edge.m_target, edge.m_source, edge.m_symbol);
                return tl::unexpected<AutomatonError>(
                    AutomatonError{ErrorKind::NonDeterministicEdge, edge.m_source, edge.m_symbol});
            }
        }

        spdlog::debug("built automaton with {} states and {} edges, initial state '{}'",
            table->states().size(), table->size(), initial);

        return Automaton(
            std::move(table),
            initial,
            Terminals_t(terminals.begin(), terminals.end())
        );
    }

    auto Automaton::out_edges() const -> const OutEdges_t &
    {
        return m_table->out_edges(m_current);
    }

    auto Automaton::is_terminal() const -> bool
    {
        return m_terminals.contains(m_current);
    }

    auto Automaton::is_stuck() const -> bool
    {
        return out_edges().empty();
    }

    auto Automaton::advance(Symbol symbol) -> tl::expected<void, AutomatonError>
    {
        auto next = m_table->target(m_current, symbol);
        if (!next)
        {
            return tl::unexpected<AutomatonError>(
                AutomatonError{ErrorKind::InvalidTransition, m_current, symbol});
        }
        m_current = std::move(next.value());
        return {};
    }

    auto Automaton::accepts(std::string_view word) const -> bool
    {
        Automaton runner{*this};
        runner.reset();

        for (const Symbol symbol : word)
        {
            // a missing edge just means the word is not in the language
            if (!runner.advance(symbol))
            {
                return false;
            }
        }
        return runner.is_terminal();
    }

    auto Automaton::reset() -> void
    {
        m_current = m_initial;
    }

    auto Automaton::states() const -> std::vector<State>
    {
        auto states = m_table->states();
        if (ranges::find(states, m_initial) == states.end())
        {
            states.insert(states.begin(), m_initial);
        }
        return states;
    }

    auto to_string(const AutomatonError& err) -> std::string
    {
        switch (err.m_kind)
        {
        case ErrorKind::NonDeterministicEdge:
            return fmt::format(
                "<CONSTRUCTION ERROR> : state '{}' has more than one destination on symbol '{}'"
                " - the automaton would not be deterministic",
                err.m_state, err.m_symbol);
        case ErrorKind::InvalidTransition:
            return fmt::format(
                "<INVALID TRANSITION ERROR> : state '{}' has no edge labelled '{}'",
                err.m_state, err.m_symbol);
        }
        return "Something unexpected went wrong ... try again.";
    }

    void HandleAutomatonError(const AutomatonError& err)
    {
        throw std::runtime_error(to_string(err));
    }
}
