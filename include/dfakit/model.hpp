#ifndef DFAKIT_MODEL_H
#define DFAKIT_MODEL_H

#include "automaton.hpp"
#include "diagram_elements.hpp"

#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace dfakit::model
{
    enum class ModelErrorKind
    {
        MissingInitialState,
        MultipleInitialStates,
        DanglingArrow,
        DuplicateStateName,
        Construction
    };

    struct ModelError
    {
        ModelErrorKind m_kind;
        // the offending state name or arrow id
        std::string m_detail;
        // set when the automaton itself refused the edges
        std::optional<AutomatonError> m_cause;
    };

    [[nodiscard]]
    auto to_string(const ModelError& err) -> std::string;

    void HandleModelError(const ModelError& err);

    // every arrow symbol becomes an edge between the named states, in arrow order
    [[nodiscard]]
    auto build_automaton(
        const States_t& states,
        const Arrows_t& arrows
    ) -> tl::expected<Automaton, ModelError>;
}

#endif
