#include "../include/dfakit/app.hpp"
#include "../include/dfakit/cli.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

auto main(const int argc, char const * const * const argv) -> int
{
    auto command_line = dfakit::app::parse_command_line(std::vector<std::string>(argv, argv + argc));
    if (!command_line)
    {
        std::cerr << command_line.error();
        return 1;
    }

    // keep stdout for the results
    spdlog::set_default_logger(spdlog::stderr_color_mt("dfakit"));
    spdlog::set_level(command_line->verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        dfakit::app::run(command_line->options);
    }
    catch (const std::runtime_error& err) {
        spdlog::error("{}", err.what());
        return 1;
    }
    return 0;
}
