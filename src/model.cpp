#include "../include/dfakit/model.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <unordered_map>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dfakit::model
{
    // namespaces aliases
    namespace views  = std::views;
    namespace ranges = std::ranges;

    namespace helpers
    {
        static auto unexpected(ModelErrorKind kind, std::string_view detail)
        {
            return tl::unexpected<ModelError>(ModelError{kind, std::string{detail}, std::nullopt});
        }
    }

    auto build_automaton(
        const States_t& states,
        const Arrows_t& arrows
    ) -> tl::expected<Automaton, ModelError>
    {
        // maps drawio id to state name
        std::unordered_map<std::string, std::string> id_state_map;
        for (const auto& state : states)
        {
            auto same_name = [&state](const auto& other){ return other.second == state.m_name; };
            if (ranges::any_of(id_state_map, same_name))
            {
                return helpers::unexpected(ModelErrorKind::DuplicateStateName, state.m_name);
            }
            id_state_map.emplace(state.m_id, state.m_name);
        }

        auto initials = states | views::filter(&parser::DiagramState::m_is_initial);
        auto initial = ranges::begin(initials);
        if (initial == ranges::end(initials))
        {
            return helpers::unexpected(ModelErrorKind::MissingInitialState, "");
        }
        if (ranges::next(initial) != ranges::end(initials))
        {
            return helpers::unexpected(ModelErrorKind::MultipleInitialStates, ranges::next(initial)->m_name);
        }

        std::vector<State> terminals;
        ranges::copy(
            states
                | views::filter(&parser::DiagramState::m_is_terminal)
                | views::transform(&parser::DiagramState::m_name),
            std::back_inserter(terminals)
        );

        Edges_t edges;
        for (const auto& arrow : arrows)
        {
            auto source = id_state_map.find(arrow.m_source);
            auto target = id_state_map.find(arrow.m_target);
            if (source == id_state_map.end() || target == id_state_map.end())
            {
                return helpers::unexpected(ModelErrorKind::DanglingArrow, arrow.m_id);
            }
            for (const char symbol : arrow.m_symbols)
            {
                edges.emplace_back(source->second, symbol, target->second);
            }
        }

        spdlog::debug("diagram gives {} states, {} edges, {} terminal states",
            states.size(), edges.size(), terminals.size());

        return Automaton::create(edges, initial->m_name, terminals)
            .map_error([](AutomatonError err) {
                auto state = err.m_state;
                return ModelError{ModelErrorKind::Construction, std::move(state), std::move(err)};
            });
    }

    auto to_string(const ModelError& err) -> std::string
    {
        switch (err.m_kind)
        {
        case ModelErrorKind::MissingInitialState:
            return "<MISSING INITIAL STATE> : mark exactly one state with $INITIAL";
        case ModelErrorKind::MultipleInitialStates:
            return fmt::format(
                "<MULTIPLE INITIAL STATES> : '{}' is marked $INITIAL but another state already is", err.m_detail);
        case ModelErrorKind::DanglingArrow:
            return fmt::format(
                "<DANGLING ARROW> : arrow '{}' does not connect two states", err.m_detail);
        case ModelErrorKind::DuplicateStateName:
            return fmt::format(
                "<DUPLICATE STATE NAME> : more than one state is called '{}'", err.m_detail);
        case ModelErrorKind::Construction:
            if (err.m_cause.has_value())
            {
                return to_string(err.m_cause.value());
            }
            return fmt::format("<CONSTRUCTION ERROR> : could not build the automaton at '{}'", err.m_detail);
        }
        return "Something unexpected went wrong ... try again.";
    }

    void HandleModelError(const ModelError& err)
    {
        throw std::runtime_error(to_string(err));
    }
}
