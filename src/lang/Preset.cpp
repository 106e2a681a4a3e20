#include <lang/Preset.hpp>

namespace lang {

    namespace {

        tkn::Language make_lua()
        {
            tkn::Language language;
            language.keywords = {
                "and", "break", "do", "else", "elseif", "end", "false", "for", "function", "goto", "if", "in",
                "local", "nil", "not", "or", "repeat", "return", "then", "true", "until", "while",
            };
            language.symbols = {
                "...", "..", "==", "~=", "<=", ">=", "::", "//", "<<", ">>",
                "+", "-", "*", "/", "%", "^", "#", "&", "~", "|", "<", ">", "=",
                "(", ")", "{", "}", "[", "]", ";", ":", ",", ".",
            };
            language.single_line_comment = "--";
            language.multi_line_comment_begin = "--[[";
            language.multi_line_comment_end = "]]";
            return language;
        }

        tkn::Language make_cstyle()
        {
            tkn::Language language;
            language.keywords = {
                "auto", "bool", "break", "case", "catch", "char", "class", "const", "constexpr", "continue",
                "default", "delete", "do", "double", "else", "enum", "explicit", "extern", "false", "float",
                "for", "friend", "goto", "if", "inline", "int", "long", "namespace", "new", "noexcept",
                "nullptr", "operator", "private", "protected", "public", "return", "short", "signed", "sizeof", "static",
                "struct", "switch", "template", "this", "throw", "true", "try", "typedef", "typename", "union",
                "unsigned", "using", "virtual", "void", "volatile", "while",
            };
            language.symbols = {
                "<<=", ">>=", "...", "->*",
                "::", "->", "++", "--", "<<", ">>", "<=", ">=", "==", "!=", "&&", "||",
                "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", ".*",
                "+", "-", "*", "/", "%", "^", "&", "|", "~", "!", "=", "<", ">",
                "(", ")", "{", "}", "[", "]", ";", ":", ",", ".", "?", "#", "'", "\\",
            };
            language.single_line_comment = "//";
            language.multi_line_comment_begin = "/*";
            language.multi_line_comment_end = "*/";
            return language;
        }

        tkn::Language make_rust()
        {
            tkn::Language language;
            language.keywords = {
                "as", "async", "await", "break", "const", "continue", "crate", "dyn", "else", "enum",
                "extern", "false", "fn", "for", "if", "impl", "in", "let", "loop", "match",
                "mod", "move", "mut", "pub", "ref", "return", "self", "Self", "static", "struct",
                "super", "trait", "true", "type", "unsafe", "use", "where", "while",
            };
            language.symbols = {
                "<<=", ">>=", "...", "..=",
                "::", "->", "=>", "..", "<<", ">>", "<=", ">=", "==", "!=", "&&", "||",
                "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=",
                "+", "-", "*", "/", "%", "^", "&", "|", "!", "=", "<", ">", "@", "?",
                "(", ")", "{", "}", "[", "]", ";", ":", ",", ".", "#", "$", "'",
            };
            language.single_line_comment = "//";
            language.multi_line_comment_begin = "/*";
            language.multi_line_comment_end = "*/";
            return language;
        }

        tkn::Language make_ruby()
        {
            tkn::Language language;
            language.keywords = {
                "BEGIN", "END", "alias", "and", "begin", "break", "case", "class", "def", "defined",
                "do", "else", "elsif", "end", "ensure", "false", "for", "if", "in", "module",
                "next", "nil", "not", "or", "redo", "rescue", "retry", "return", "self", "super",
                "then", "true", "undef", "unless", "until", "when", "while", "yield",
            };
            language.symbols = {
                "**=", "<=>", "===", "...", "<<=", ">>=", "&&=", "||=",
                "**", "==", "!=", ">=", "<=", "&&", "||", "<<", ">>", "=~", "!~", "::", "..", "->", "=>",
                "+=", "-=", "*=", "/=", "%=", "|=", "&=", "^=",
                "+", "-", "*", "/", "%", "^", "&", "|", "!", "~", "=", "<", ">", "?",
                "(", ")", "{", "}", "[", "]", ";", ":", ",", ".", "@", "$", "'",
            };
            // =begin/=end blocks only count at the start of a line, which markers cannot express
            language.single_line_comment = "#";
            return language;
        }

    } // namespace

    std::ostream &operator<<(std::ostream &os, Preset preset)
    {
        switch (preset)
        {
            case Preset::Lua: os << "Lua"; break;
            case Preset::CStyle: os << "CStyle"; break;
            case Preset::Rust: os << "Rust"; break;
            case Preset::Ruby: os << "Ruby"; break;
        }
        return os;
    }

    std::optional<Preset> preset(const std::string_view &extension)
    {
        if (extension == ".lua") return Preset::Lua;
        return std::nullopt;
    }

    std::optional<Preset> parse_preset(const std::string_view &name)
    {
        if (name == "lua") return Preset::Lua;
        if (name == "cstyle" || name == "c" || name == "cpp") return Preset::CStyle;
        if (name == "rust") return Preset::Rust;
        if (name == "ruby") return Preset::Ruby;
        return std::nullopt;
    }

    const tkn::Language &language(Preset preset)
    {
        static const tkn::Language s_lua = make_lua();
        static const tkn::Language s_cstyle = make_cstyle();
        static const tkn::Language s_rust = make_rust();
        static const tkn::Language s_ruby = make_ruby();

        switch (preset)
        {
            case Preset::Lua: return s_lua;
            case Preset::CStyle: return s_cstyle;
            case Preset::Rust: return s_rust;
            case Preset::Ruby: return s_ruby;
        }
        return s_lua;
    }

} // namespace lang
