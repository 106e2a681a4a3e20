#ifndef HEADER_cli_Tree_hpp_ALREADY_INCLUDED
#define HEADER_cli_Tree_hpp_ALREADY_INCLUDED

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cli {

    // A file or a folder to scan, with the filters that apply to it
    struct Tree
    {
        std::filesystem::path root;
        std::vector<std::string> extensions;
        std::optional<std::size_t> max_size;
        std::optional<std::size_t> count;
    };

} // namespace cli

#endif
