#ifndef DFAKIT_CLI_H
#define DFAKIT_CLI_H

#include "app.hpp"

#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace dfakit::app
{
    struct CommandLine
    {
        Options options;
        bool verbose{false};
    };

    // args includes the program name; on failure the error holds the argparse
    // message followed by the usage text
    [[nodiscard]]
    auto parse_command_line(const std::vector<std::string>& args) -> tl::expected<CommandLine, std::string>;
}

#endif
