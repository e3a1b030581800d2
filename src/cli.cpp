#include "../include/dfakit/cli.hpp"
#include "../include/dfakit/presets.hpp"

#include <exception>
#include <sstream>

#include <argparse/argparse.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace dfakit::app
{
    auto parse_command_line(const std::vector<std::string>& args) -> tl::expected<CommandLine, std::string>
    {
        // only --help, -v is taken by --verbose
        argparse::ArgumentParser program("dfakit", "0.1.0", argparse::default_arguments::help);

        program.add_argument("-d", "--diagram")
            .help("Specify the draw.io file holding the automaton.");
        program.add_argument("-p", "--preset")
            .help(fmt::format("Use a built in automaton instead of a diagram: {}.",
                fmt::join(presets::names(), ", ")));
        program.add_argument("-a", "--accept")
            .append()
            .help("Check whether the automaton accepts a word (can be repeated).");
        program.add_argument("-e", "--enumerate")
            .scan<'u', std::size_t>()
            .help("List every accepted word of exactly this length.");
        program.add_argument("-t", "--table")
            .default_value(false)
            .implicit_value(true)
            .help("Print the transition table.");
        program.add_argument("-v", "--verbose")
            .default_value(false)
            .implicit_value(true)
            .help("Log what the tool is doing.");

        // argparse reports unknown flags as runtime_error but bad numbers
        // from scan as invalid_argument
        try {
            program.parse_args(args);
        }
        catch (const std::exception& err) {
            std::ostringstream usage;
            usage << err.what() << '\n' << program;
            return tl::unexpected<std::string>(usage.str());
        }

        CommandLine command_line;
        auto& options = command_line.options;
        if (auto d = program.present("-d")) 
        {
            options.diagram = std::filesystem::path{*d};
        }
        options.preset = program.present("-p");
        if (auto words = program.present<std::vector<std::string>>("-a"))
        {
            options.accept_words = *words;
        }
        options.enumerate_length = program.present<std::size_t>("-e");
        options.print_table = program.get<bool>("--table");
        command_line.verbose = program.get<bool>("--verbose");

        return command_line;
    }
}
