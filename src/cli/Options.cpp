#include <cli/Options.hpp>

#include <util/log.hpp>

#include <rubr/cli/Range.hpp>
#include <rubr/mss.hpp>

#include <charconv>
#include <sstream>

namespace cli {

    namespace {
        template<typename T>
        bool to_number(T &dst, const std::string &str)
        {
            const auto end = str.data() + str.size();
            const auto [ptr, ec] = std::from_chars(str.data(), end, dst);
            return ec == std::errc{} && ptr == end;
        }
    } // namespace

    ReturnCode Options::parse(int argc, const char **argv)
    {
        MSS_BEGIN(ReturnCode);

        rubr::cli::Range r{argc, argv};

        MSS(r.pop(exe_name));

        for (std::string arg; r.pop(arg);)
        {
            auto is = [&](const char *sh, const char *lh) {
                return arg == sh || arg == lh;
            };

            if (false) {}
            else if (is("-h", "--help"))
                print_help = true;
            else if (is("-l", "--language"))
                MSS(r.pop(language.emplace()), util::log::error() << "Option '" << arg << "' expects a language name" << std::endl);
            else if (is("-e", "--ext"))
                MSS(r.pop(extensions.emplace_back()), util::log::error() << "Option '" << arg << "' expects an extension" << std::endl);
            else if (is("-m", "--max-size"))
            {
                std::string str;
                MSS(r.pop(str), util::log::error() << "Option '" << arg << "' expects a size in bytes" << std::endl);
                MSS(to_number(max_size.emplace(), str), util::log::error() << "Invalid size '" << str << "'" << std::endl);
            }
            else if (is("-c", "--count"))
            {
                std::string str;
                MSS(r.pop(str), util::log::error() << "Option '" << arg << "' expects a file count" << std::endl);
                MSS(to_number(count.emplace(), str), util::log::error() << "Invalid count '" << str << "'" << std::endl);
            }
            else if (is("-V", "--verbose"))
            {
                std::string str;
                MSS(r.pop(str), util::log::error() << "Option '" << arg << "' expects a level" << std::endl);
                MSS(to_number(verbose_level, str), util::log::error() << "Invalid verbose level '" << str << "'" << std::endl);
            }
            else if (!command && arg == "scan")
                command = Command::Scan;
            else if (!command && arg == "dump")
                command = Command::Dump;
            else if (!arg.empty() && arg[0] == '-')
                MSS(false, util::log::error() << "Unknown CLI argument '" << arg << "'" << std::endl);
            else
                paths.push_back(arg);
        }

        MSS_END();
    }

    std::string Options::help() const
    {
        std::ostringstream oss;
        oss << "Help for '" << exe_name << "'" << std::endl;
        oss << exe_name << " Command Options Path*" << std::endl;
        oss << "Command" << std::endl;
        oss << "    scan  Scan files and report token counts and errors" << std::endl;
        oss << "    dump  Scan files and print every token" << std::endl;
        oss << "Options" << std::endl;
        oss << "    -h  --help            Print this help" << std::endl;
        oss << "    -l  --language NAME   Use language NAME for all files: lua, cstyle, rust or ruby" << std::endl;
        oss << "    -e  --ext EXT         Only process files with extension EXT" << std::endl;
        oss << "    -m  --max-size BYTES  Skip files larger than BYTES" << std::endl;
        oss << "    -c  --count NUMBER    Process at most NUMBER files" << std::endl;
        oss << "    -V  --verbose LEVEL   Verbosity level, 3 traces every token" << std::endl;
        oss << "Path is a file or a folder that is searched recursively" << std::endl;
        return oss.str();
    }

} // namespace cli
