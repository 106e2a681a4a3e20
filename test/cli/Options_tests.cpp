#include <cli/Config.hpp>
#include <cli/Options.hpp>

#include <catch2/catch_test_macros.hpp>

#include <iterator>

TEST_CASE("cli::Options::parse", "[ut][cli][Options]")
{
    cli::Options options;

    SECTION("command, options and paths")
    {
        const char *argv[] = {"scanr", "dump", "-l", "lua", "--ext", "lua", "-m", "1000", "-c", "5", "-V", "3", "a.lua", "src"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) == ReturnCode::Ok);
        REQUIRE(options.exe_name == "scanr");
        REQUIRE(options.command == cli::Command::Dump);
        REQUIRE(options.language == "lua");
        REQUIRE(options.extensions == std::vector<std::string>{"lua"});
        REQUIRE(options.max_size == 1000u);
        REQUIRE(options.count == 5u);
        REQUIRE(options.verbose_level == 3);
        REQUIRE(options.paths == std::vector<std::string>{"a.lua", "src"});
    }
    SECTION("help")
    {
        const char *argv[] = {"scanr", "-h"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) == ReturnCode::Ok);
        REQUIRE(options.print_help);
        REQUIRE(!options.command);
    }
    SECTION("a second command word is a path")
    {
        const char *argv[] = {"scanr", "scan", "dump"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) == ReturnCode::Ok);
        REQUIRE(options.command == cli::Command::Scan);
        REQUIRE(options.paths == std::vector<std::string>{"dump"});
    }
    SECTION("unknown option")
    {
        const char *argv[] = {"scanr", "scan", "--frobnicate"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) != ReturnCode::Ok);
    }
    SECTION("missing option value")
    {
        const char *argv[] = {"scanr", "scan", "-l"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) != ReturnCode::Ok);
    }
    SECTION("invalid number")
    {
        const char *argv[] = {"scanr", "scan", "-m", "12kb"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) != ReturnCode::Ok);
    }
}

TEST_CASE("cli::Config::init", "[ut][cli][Config]")
{
    cli::Options options;
    cli::Config config;

    SECTION("extensions get a leading dot and are unique")
    {
        const char *argv[] = {"scanr", "scan", "-e", "lua", "-e", ".lua", "-e", "rb", "-c", "2", "a", "b"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) == ReturnCode::Ok);
        REQUIRE(config.init(options) == ReturnCode::Ok);
        REQUIRE(!config.preset);
        REQUIRE(config.trees.size() == 2);
        REQUIRE(config.trees[0].extensions == std::vector<std::string>{".lua", ".rb"});
        REQUIRE(config.trees[1].count == 2u);
        REQUIRE(!config.trees[1].max_size);
    }
    SECTION("forced language")
    {
        const char *argv[] = {"scanr", "scan", "-l", "rust", "a"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) == ReturnCode::Ok);
        REQUIRE(config.init(options) == ReturnCode::Ok);
        REQUIRE(config.preset == lang::Preset::Rust);
    }
    SECTION("unknown language")
    {
        const char *argv[] = {"scanr", "scan", "-l", "cobol", "a"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) == ReturnCode::Ok);
        REQUIRE(config.init(options) != ReturnCode::Ok);
    }
    SECTION("a command needs a path")
    {
        const char *argv[] = {"scanr", "scan"};
        REQUIRE(options.parse(static_cast<int>(std::size(argv)), argv) == ReturnCode::Ok);
        REQUIRE(config.init(options) != ReturnCode::Ok);
    }
}
