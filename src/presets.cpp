#include "../include/dfakit/presets.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace dfakit::presets
{
    using model::Automaton;
    using model::Edges_t;

    namespace helpers
    {
        static constexpr std::string_view digits = "0123456789";

        // the presets are fixed tables, failing to build one is a programming error
        static auto build(const Edges_t& edges, const model::State& initial, const std::vector<model::State>& terminals)
            -> Automaton
        {
            return Automaton::create(edges, initial, terminals)
                .or_else(model::HandleAutomatonError)
                .value();
        }
    }

    auto ab_then_a() -> Automaton
    {
        return helpers::build(
            {
                {"s1", 'a', "s2"},
                {"s2", 'b', "s3"},
                {"s3", 'a', "s3"},
            },
            "s1",
            {"s3"}
        );
    }

    auto email() -> Automaton
    {
        return helpers::build(
            {
                {"user",         'x', "user+"},
                {"user+",        'x', "user+"},
                {"user+",        '@', "at"},
                {"at",           'x', "domain+"},
                {"domain+",      'x', "domain+"},
                {"domain+",      '.', "dot"},
                {"dot",          'x', "tld+"},
                {"tld+",         'x', "tld+"},
            },
            "user",
            {"tld+"}
        );
    }

    auto phone_number() -> Automaton
    {
        // ten digit positions d0..d9 with a hyphen after the third and sixth digit
        Edges_t edges;
        unsigned position = 0;
        auto state_name = [](unsigned p){ return fmt::format("p{}", p); };
        auto add_digits = [&](unsigned count)
        {
            for (unsigned i = 0; i < count; ++i, ++position)
            {
                for (const char d : helpers::digits)
                {
                    edges.emplace_back(state_name(position), d, state_name(position + 1));
                }
            }
        };
        auto add_hyphen = [&]()
        {
            edges.emplace_back(state_name(position), '-', state_name(position + 1));
            ++position;
        };

        add_digits(3);
        add_hyphen();
        add_digits(3);
        add_hyphen();
        add_digits(4);

        return helpers::build(edges, state_name(0), {state_name(position)});
    }

    using Entry = std::pair<std::string_view, Automaton (*)()>;

    static const std::array<Entry, 3> catalogue{{
        {"ab_then_a", &ab_then_a},
        {"email",     &email},
        {"phone",     &phone_number},
    }};

    auto by_name(std::string_view name) -> std::optional<Automaton>
    {
        auto it = std::ranges::find(catalogue, name, &Entry::first);
        if (it == catalogue.end())
        {
            return std::nullopt;
        }
        return it->second();
    }

    auto names() -> std::vector<std::string_view>
    {
        std::vector<std::string_view> result;
        for (const auto& [name, _] : catalogue)
        {
            result.push_back(name);
        }
        return result;
    }
}
