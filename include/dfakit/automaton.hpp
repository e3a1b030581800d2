#ifndef DFAKIT_AUTOMATON_H
#define DFAKIT_AUTOMATON_H

#include "transition_table.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <tl/expected.hpp>

namespace dfakit::model
{
    enum class ErrorKind
    {
        NonDeterministicEdge,
        InvalidTransition
    };

    struct AutomatonError
    {
        ErrorKind m_kind;
        std::string m_state;
        Symbol m_symbol;

        auto operator==(const AutomatonError &) const -> bool = default;
    };

    [[nodiscard]]
    auto to_string(const AutomatonError& err) -> std::string;

    void HandleAutomatonError(const AutomatonError& err);

    class Automaton
    {
    public:
        using Terminals_t = std::unordered_set<State>;

        // fails with NonDeterministicEdge if two edges leave the same state on the same symbol
        // but land on different states
        [[nodiscard]]
        static auto create(
            const std::vector<Edge>& edges,
            const State& initial,
            const std::vector<State>& terminals
        ) -> tl::expected<Automaton, AutomatonError>;

        // the outgoing edges of the current state, in declaration order
        auto out_edges() const -> const OutEdges_t &;

        auto is_terminal() const -> bool;
        auto is_stuck() const -> bool;

        // moves the cursor along the edge labelled by symbol, the cursor is
        // left where it was if there is no such edge
        [[nodiscard]]
        auto advance(Symbol symbol) -> tl::expected<void, AutomatonError>;

        // runs the word on a copy sitting on the initial state
        auto accepts(std::string_view word) const -> bool;

        auto reset() -> void;

        auto current() const -> const State & { return m_current; }
        auto initial() const -> const State & { return m_initial; }
        auto terminals() const -> const Terminals_t & { return m_terminals; }
        auto table() const -> const TransitionTable & { return *m_table; }

        // every state in the table plus the initial state, first seen first
        auto states() const -> std::vector<State>;

    private:
        Automaton(
            std::shared_ptr<const TransitionTable> table,
            State initial,
            Terminals_t terminals
        );

        // immutable after construction, copies of the automaton share it
        std::shared_ptr<const TransitionTable> m_table;
        State m_initial;
        Terminals_t m_terminals;
        State m_current;
    };
}

#endif
