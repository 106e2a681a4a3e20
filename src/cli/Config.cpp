#include <cli/Config.hpp>

#include <util/log.hpp>

#include <rubr/fs/util.hpp>
#include <rubr/mss.hpp>

#include <algorithm>

namespace cli {

    ReturnCode Config::init(const Options &options)
    {
        MSS_BEGIN(ReturnCode);

        trees.resize(0);
        preset.reset();

        if (options.language)
        {
            preset = lang::parse_preset(*options.language);
            MSS(!!preset, util::log::error() << "Unknown language '" << *options.language << "'" << std::endl);
        }

        // Prepend a '.' for the extensions where necessary
        std::vector<std::string> exts;
        for (std::string ext : options.extensions)
        {
            if (ext.empty())
                continue;
            if (ext[0] != '.')
                ext = "." + ext;
            if (std::find(exts.begin(), exts.end(), ext) == exts.end())
                exts.push_back(ext);
        }

        for (const auto &path : options.paths)
        {
            Tree tree;
            tree.root = rubr::fs::expand_path(path);
            tree.extensions = exts;
            tree.max_size = options.max_size;
            tree.count = options.count;
            trees.push_back(tree);
        }

        MSS(!options.command || !trees.empty(), util::log::error() << "No file or folder to scan was given" << std::endl);

        MSS_END();
    }

} // namespace cli
