#ifndef DFAKIT_TRANSITION_TABLE_H
#define DFAKIT_TRANSITION_TABLE_H

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dfakit::model
{
    using State  = std::string;
    using Symbol = char;

    struct Edge
    {
        Edge() = default;
        Edge(
            std::string_view source,
            const Symbol symbol,
            std::string_view target
        )
            : m_source{source},
              m_symbol{symbol},
              m_target{target} {}

        auto operator==(const Edge &) const -> bool = default;

        State m_source;
        Symbol m_symbol{};
        State m_target;
    };

    struct OutEdge
    {
        auto operator==(const OutEdge &) const -> bool = default;

        Symbol m_symbol;
        State m_target;
    };

    using Edges_t    = std::vector<Edge>;
    using OutEdges_t = std::vector<OutEdge>;

    // state -> (symbol -> state), with the out edges of each state kept in the
    // order they were inserted
    class TransitionTable
    {
    public:
        TransitionTable() = default;

        // false if the (source, symbol) pair already leads somewhere else,
        // inserting an identical edge twice is a no-op
        [[nodiscard]]
        auto insert(const Edge& edge) -> bool;

        auto out_edges(const State& state) const -> const OutEdges_t &;
        auto target(const State& state, const Symbol symbol) const -> std::optional<State>;

        auto contains(const State& state) const -> bool;

        auto edges() const -> const Edges_t & { return m_edges; }
        auto states() const -> const std::vector<State> & { return m_states; }
        auto alphabet() const -> std::vector<Symbol>;

        auto size() const -> std::size_t { return m_edges.size(); }
        auto empty() const -> bool { return m_edges.empty(); }

        // one line per state: "<state>: <symbol> -> <target>, ..."
        auto format() const -> std::string;
        auto print() const -> void;

    private:
        auto note_state(const State& state) -> void;

        std::unordered_map<State, OutEdges_t> m_connections;
        Edges_t m_edges;
        std::vector<State> m_states;
    };
}

#endif
