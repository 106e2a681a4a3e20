#ifndef HEADER_lang_Preset_hpp_ALREADY_INCLUDED
#define HEADER_lang_Preset_hpp_ALREADY_INCLUDED

#include <tkn/Language.hpp>

#include <optional>
#include <ostream>
#include <string_view>

namespace lang {

    // Built-in language descriptions.
    // Only double-quoted strings are literals: in CStyle, Rust and Ruby a single quote is a Symbol,
    // so a character literal holding '"' opens a string that runs past it. These presets are
    // therefore never chosen from a file extension, only by name.
    enum class Preset
    {
        Lua,
        CStyle,
        Rust,
        Ruby,
    };

    std::ostream &operator<<(std::ostream &os, Preset preset);

    // From a file extension, including the leading '.'. Only Lua is recognized.
    std::optional<Preset> preset(const std::string_view &extension);

    // From its lowercase name, e.g. "lua" or "cstyle"
    std::optional<Preset> parse_preset(const std::string_view &name);

    // Immutable and shared, safe to use from concurrent scans
    const tkn::Language &language(Preset preset);

} // namespace lang

#endif
