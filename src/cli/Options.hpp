#ifndef HEADER_cli_Options_hpp_ALREADY_INCLUDED
#define HEADER_cli_Options_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cli {

    enum class Command
    {
        Scan,
        Dump,
    };

    class Options
    {
    public:
        std::string exe_name;

        bool print_help = false;
        std::optional<Command> command;
        std::optional<std::string> language;
        std::vector<std::string> extensions;
        std::optional<std::size_t> max_size;
        std::optional<std::size_t> count;
        int verbose_level = 0;
        std::vector<std::string> paths;

        ReturnCode parse(int argc, const char **argv);

        std::string help() const;
    };

} // namespace cli

#endif
