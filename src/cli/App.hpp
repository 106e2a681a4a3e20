#ifndef HEADER_cli_App_hpp_ALREADY_INCLUDED
#define HEADER_cli_App_hpp_ALREADY_INCLUDED

#include <cli/Config.hpp>
#include <cli/Options.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace cli {

    class App
    {
    public:
        App(const Options &options)
            : options_(options) {}

        ReturnCode run();

        struct Stats
        {
            std::size_t file_count = 0;
            std::size_t token_count = 0;
            // Files without a known language
            std::size_t skip_count = 0;
            // One "path:line:offset : message" per file that failed to scan
            std::vector<std::string> failures;
        };
        const Stats &stats() const { return stats_; }

    private:
        ReturnCode scan_trees_(bool do_dump);
        ReturnCode scan_file_(const std::filesystem::path &fp, lang::Preset preset, bool do_dump);

        const Options &options_;
        Config config_;
        Stats stats_;
    };

} // namespace cli

#endif
