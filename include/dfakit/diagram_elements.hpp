#ifndef DFAKIT_DIAGRAM_ELEMENTS_H
#define DFAKIT_DIAGRAM_ELEMENTS_H

#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace dfakit::parser
{
    struct DiagramElement
    {
        DiagramElement() = default;
        DiagramElement(
            std::string_view id)
            : m_id{id} {}

        auto operator<=>(const DiagramElement &) const = default;

        std::string m_id;
    };

    struct DiagramState : public DiagramElement
    {
        DiagramState() = default;

        DiagramState(
            std::string_view id,
            std::string_view name,
            const bool is_initial,
            const bool is_terminal
        )
            : DiagramElement{id},
              m_name{name},
              m_is_initial{is_initial},
              m_is_terminal{is_terminal} {}

        auto operator<=>(const DiagramState &) const = default;

        std::string m_name;
        bool m_is_initial{false};
        bool m_is_terminal{false};
    };

    struct DiagramArrow : public DiagramElement
    {
        DiagramArrow() = default;
        DiagramArrow(
            std::string_view id,
            std::string_view source,
            std::string_view target,
            const std::vector<char> &symbols
        )
            : DiagramElement{id},
              m_source{source},
              m_target{target},
              m_symbols{symbols} {}

        auto operator<=>(const DiagramArrow &) const = default;

        // drawio ids of the connected states
        std::string m_source;
        std::string m_target;
        // one edge per symbol, in label order
        std::vector<char> m_symbols;
    };
}

namespace dfakit
{
    using States_t = std::vector<parser::DiagramState>;
    using Arrows_t = std::vector<parser::DiagramArrow>;

    using TokenTuple = std::tuple<States_t, Arrows_t>;
}

#endif
