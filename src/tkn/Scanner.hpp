#ifndef HEADER_tkn_Scanner_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Scanner_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>
#include <tkn/Buffer.hpp>
#include <tkn/Error.hpp>
#include <tkn/Language.hpp>
#include <tkn/Token.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tkn {

    bool is_digit(char32_t ch);
    bool is_alpha(char32_t ch);
    bool is_alnum(char32_t ch);
    bool is_space(char32_t ch);

    // Holds the cursor of a single run; use one instance per thread.
    // language is only borrowed for the duration of run() and may be shared between scanners.
    class Scanner
    {
    public:
        // Decodes source into buffer and appends a token per recognized lexeme.
        // Stops at the first error, which is then available via error(); buffer keeps the tokens found before it.
        ReturnCode run(const std::string_view &source, const Language &language, Buffer &buffer);

        const std::optional<Error> &error() const { return error_; }

    private:
        enum class Step
        {
            Emit,
            Ignore,
            NewLine,
            Eof,
            Fail,
        };
        struct Scanned
        {
            Step step = Step::Fail;
            Kind kind;
            // Span size when it differs from current_-start_
            std::optional<std::uint32_t> size;
        };

        void scan_token_(Scanned &scanned);

        bool scan_comment_(Scanned &scanned);
        void scan_single_line_comment_(Scanned &scanned);
        void scan_multi_line_comment_(Scanned &scanned);
        bool scan_newline_(Scanned &scanned);
        bool scan_space_(Scanned &scanned);
        bool scan_symbol_(Scanned &scanned);
        bool scan_keyword_(Scanned &scanned);
        bool scan_string_(Scanned &scanned);
        bool scan_identifier_(Scanned &scanned);
        bool scan_number_(Scanned &scanned);
        void scan_based_number_(Scanned &scanned, unsigned int base, const char *prefix);

        // Size in scalar values of candidate when it occurs at current_, 0 otherwise
        std::uint32_t match_(const std::string &candidate) const;

        void emit_(Buffer &buffer, Scanned &scanned);
        void fail_(ErrorKind kind, std::uint32_t offset);

        const Language *language_{};
        std::u32string_view source_;

        std::uint32_t start_ = 0;
        std::uint32_t current_ = 0;
        std::uint32_t line_ = 1;
        // Line of start_
        std::uint32_t start_line_ = 1;

        std::optional<Error> error_;
    };

} // namespace tkn

#endif
