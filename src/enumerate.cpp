#include "../include/dfakit/enumerate.hpp"

#include <spdlog/spdlog.h>

namespace dfakit::model
{
    namespace helpers
    {
        // the walker is taken by value so sibling branches never see each
        // other's cursor, the table itself is shared between the copies
        static auto enumerate_impl(
            Automaton walker,
            const std::size_t remaining,
            std::string& prefix,
            std::vector<std::string>& paths
        ) -> void
        {
            if (remaining == 0)
            {
                if (walker.is_terminal())
                {
                    paths.push_back(prefix);
                }
                return;
            }

            for (const auto& edge : walker.out_edges())
            {
                Automaton branch{walker};
                if (!branch.advance(edge.m_symbol))
                {
                    continue;
                }
                prefix.push_back(edge.m_symbol);
                enumerate_impl(std::move(branch), remaining - 1, prefix, paths);
                prefix.pop_back();
            }
        }
    }

    auto enumerate_paths(const Automaton& automaton, std::size_t length) -> std::vector<std::string>
    {
        std::vector<std::string> paths;
        std::string prefix;
        prefix.reserve(length);

        helpers::enumerate_impl(automaton, length, prefix, paths);

        spdlog::debug("found {} paths of length {} from state '{}'",
            paths.size(), length, automaton.current());
        return paths;
    }
}
