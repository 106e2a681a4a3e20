#ifndef HEADER_cli_Config_hpp_ALREADY_INCLUDED
#define HEADER_cli_Config_hpp_ALREADY_INCLUDED

#include <cli/Options.hpp>
#include <cli/Tree.hpp>
#include <lang/Preset.hpp>

#include <ReturnCode.hpp>

#include <optional>
#include <vector>

namespace cli {

    struct Config
    {
        std::vector<Tree> trees;
        // Forced language, the file extension decides when not set
        std::optional<lang::Preset> preset;

        ReturnCode init(const Options &options);
    };

} // namespace cli

#endif
