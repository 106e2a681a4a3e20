#include <cli/App.hpp>

#include <tkn/Buffer.hpp>
#include <tkn/Scanner.hpp>
#include <util/log.hpp>

#include <rubr/fs/Walker.hpp>
#include <rubr/fs/util.hpp>
#include <rubr/macro/capture.hpp>
#include <rubr/mss.hpp>
#include <rubr/profile/Stopwatch.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>

namespace cli {

    ReturnCode App::run()
    {
        MSS_BEGIN(ReturnCode);

        MSS(config_.init(options_));

        const rubr::profile::Stopwatch sw;

        if (options_.command)
        {
            switch (*options_.command)
            {
                case Command::Scan:
                    MSS(scan_trees_(false));
                    break;
                case Command::Dump:
                    MSS(scan_trees_(true));
                    break;
            }
        }

        util::log::os(2) << "Elapse: " << sw.elapse<std::chrono::milliseconds>() << std::endl;

        MSS_END();
    }

    ReturnCode App::scan_trees_(bool do_dump)
    {
        MSS_BEGIN(ReturnCode);

        stats_ = Stats{};

        for (const auto &tree : config_.trees)
        {
            std::size_t tree_file_count = 0;

            auto process = [&](const std::filesystem::path &fp) {
                MSS_BEGIN(bool);

                bool do_process = true;

                if (do_process && tree.max_size)
                    do_process = std::filesystem::file_size(fp) <= *tree.max_size;
                if (do_process && !tree.extensions.empty())
                    do_process = std::any_of(tree.extensions.begin(), tree.extensions.end(), [&](const auto &ext) { return fp.native().ends_with(ext); });

                std::optional<lang::Preset> preset;
                if (do_process)
                {
                    preset = config_.preset ? config_.preset : lang::preset(fp.extension().native());
                    if (!preset)
                    {
                        ++stats_.skip_count;
                        util::log::os(2) << "Skipping '" << fp.native() << "', unknown language" << std::endl;
                        do_process = false;
                    }
                }

                // Only files that will be scanned count against the limit
                if (do_process && tree.count)
                    do_process = tree_file_count < *tree.count;

                if (do_process)
                {
                    ++tree_file_count;
                    MSS(scan_file_(fp, *preset, do_dump));
                }

                MSS_END();
            };

            if (std::filesystem::is_regular_file(tree.root))
            {
                MSS(process(tree.root));
            }
            else
            {
                MSS(std::filesystem::is_directory(tree.root), util::log::error() << "Cannot find '" << tree.root.native() << "'" << std::endl);

                using Walker = rubr::fs::Walker;
                Walker walker{Walker::Config{.basedir = tree.root}};
                MSS(walker(process));
            }
        }

        std::cout << C(stats_.file_count) C(stats_.token_count) C(stats_.skip_count) C(stats_.failures.size()) << std::endl;

        MSS(stats_.failures.empty());

        MSS_END();
    }

    // A file that fails to scan is counted and reported, the walk continues
    ReturnCode App::scan_file_(const std::filesystem::path &fp, lang::Preset preset, bool do_dump)
    {
        MSS_BEGIN(ReturnCode);

        std::string content;
        MSS(rubr::fs::read(content, fp), util::log::error() << "Could not read '" << fp.native() << "'" << std::endl);

        ++stats_.file_count;
        util::log::os(2) << fp.native() << " (" << preset << ")" << std::endl;

        tkn::Scanner scanner;
        tkn::Buffer buffer;
        const auto rc = scanner.run(content, lang::language(preset), buffer);

        stats_.token_count += buffer.size();

        if (do_dump)
        {
            std::cout << fp.native() << std::endl;
            buffer.dump(std::cout);
        }
        else
        {
            std::cout << fp.native() << ' ' << buffer.size() << std::endl;
        }

        if (rc != ReturnCode::Ok)
        {
            std::ostringstream oss;
            if (const auto &error = scanner.error(); !!error)
                oss << fp.native() << ':' << *error;
            else
                oss << fp.native() << ": could not decode source";
            util::log::error() << oss.str() << std::endl;
            stats_.failures.push_back(oss.str());
        }

        MSS_END();
    }

} // namespace cli
