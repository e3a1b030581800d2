#include "../include/dfakit/transition_table.hpp"
#include "../include/dfakit/utility.hpp"
#include "../include/dfakit/ranges_helpers.hpp"

#include <algorithm>
#include <ranges>

#include <fmt/format.h>

namespace dfakit::model
{
    namespace views  = std::views;
    namespace ranges = std::ranges;

    auto TransitionTable::insert(const Edge& edge) -> bool
    {
        auto& out = m_connections[edge.m_source];
        auto existing = ranges::find(out, edge.m_symbol, &OutEdge::m_symbol);
        if (existing != out.end())
        {
            return existing->m_target == edge.m_target;
        }

        out.push_back(OutEdge{edge.m_symbol, edge.m_target});
        m_edges.push_back(edge);
        note_state(edge.m_source);
        note_state(edge.m_target);
        return true;
    }

    auto TransitionTable::out_edges(const State& state) const -> const OutEdges_t &
    {
        static const OutEdges_t no_edges{};

        if (auto it = m_connections.find(state); it != m_connections.end())
        {
            return it->second;
        }
        return no_edges;
    }

    auto TransitionTable::target(const State& state, const Symbol symbol) const -> std::optional<State>
    {
        const auto& out = out_edges(state);
        if (auto it = ranges::find(out, symbol, &OutEdge::m_symbol); it != out.end())
        {
            return it->m_target;
        }
        return std::nullopt;
    }

    auto TransitionTable::contains(const State& state) const -> bool
    {
        return ranges::find(m_states, state) != m_states.end();
    }

    auto TransitionTable::alphabet() const -> std::vector<Symbol>
    {
        std::vector<Symbol> symbols;
        for (const auto& edge : m_edges)
        {
            if (ranges::find(symbols, edge.m_symbol) == symbols.end())
            {
                symbols.push_back(edge.m_symbol);
            }
        }
        return symbols;
    }

    auto TransitionTable::note_state(const State& state) -> void
    {
        if (!contains(state))
        {
            m_states.push_back(state);
        }
    }

    auto TransitionTable::format() const -> std::string
    {
        auto format_row = [this](const State& state)
        {
            auto arrows = out_edges(state)
                | views::transform([](const OutEdge& e){
                    return fmt::format("{} -> {}", e.m_symbol, e.m_target);
                })
                | utility::to<std::vector<std::string>>();
            return fmt::format("{}: {}", state, utility::join_non_empty_strings(arrows, ", "));
        };

        std::string table;
        for (const auto& state : m_states)
        {
            table += format_row(state);
            table += '\n';
        }
        return table;
    }

    auto TransitionTable::print() const -> void
    {
        fmt::print("{}", format());
    }
}
