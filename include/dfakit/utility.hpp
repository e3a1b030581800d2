#ifndef DFAKIT_UTILITY_H
#define DFAKIT_UTILITY_H

#include <string>
#include <string_view>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace dfakit::utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    auto join_non_empty_strings(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::filter([](std::string_view s){ return !s.empty(); }), //filter the length zero elements
                delim
            )
        );
    }

    // strips the html markup draw.io wraps around labels (font, size, line breaks)
    auto strip_markup(std::string_view s) -> std::string;

    auto trim(std::string_view s) -> std::string_view;
}

#endif
