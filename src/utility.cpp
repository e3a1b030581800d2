#include "../include/dfakit/utility.hpp"

#include <regex>

namespace dfakit::utility
{
    auto strip_markup(std::string_view s) -> std::string
    {
        static const std::regex tags("<[^>]*>");
        static const std::regex nbsp("&nbsp;");

        auto without_tags = std::regex_replace(std::string(s), tags, "");
        return std::regex_replace(without_tags, nbsp, " ");
    }

    auto trim(std::string_view s) -> std::string_view
    {
        constexpr std::string_view whitespace = " \t\r\n";

        const auto first = s.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
        {
            return {};
        }
        const auto last = s.find_last_not_of(whitespace);
        return s.substr(first, last - first + 1);
    }
}
