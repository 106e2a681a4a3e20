#include <tkn/Scanner.hpp>

#include <str/Utf8.hpp>
#include <util/log.hpp>

#include <rubr/mss.hpp>

#include <utility>

namespace tkn {

    bool is_digit(char32_t ch) { return ch >= U'0' && ch <= U'9'; }
    bool is_alpha(char32_t ch) { return (ch >= U'a' && ch <= U'z') || (ch >= U'A' && ch <= U'Z') || ch == U'_'; }
    bool is_alnum(char32_t ch) { return is_digit(ch) || is_alpha(ch); }
    bool is_space(char32_t ch) { return ch == U' ' || ch == U'\t' || ch == U'\r'; }

    namespace {
        std::optional<unsigned int> digit_value(char32_t ch, unsigned int base)
        {
            unsigned int value;
            if (ch >= U'0' && ch <= U'9')
                value = ch - U'0';
            else if (ch >= U'a' && ch <= U'f')
                value = ch - U'a' + 10;
            else if (ch >= U'A' && ch <= U'F')
                value = ch - U'A' + 10;
            else
                return std::nullopt;
            if (value >= base)
                return std::nullopt;
            return value;
        }
    } // namespace

    ReturnCode Scanner::run(const std::string_view &source, const Language &language, Buffer &buffer)
    {
        MSS_BEGIN(ReturnCode);

        buffer.clear();
        error_.reset();

        std::optional<std::size_t> bad_offset;
        MSS(str::decode(buffer.source_, source, &bad_offset), util::log::error() << "Source is not valid UTF-8, first bad byte at " << bad_offset.value_or(0) << std::endl);

        language_ = &language;
        source_ = buffer.source_;
        start_ = current_ = 0;
        line_ = start_line_ = 1;

        for (bool done = false; !done;)
        {
            start_line_ = line_;

            Scanned scanned;
            scan_token_(scanned);

            switch (scanned.step)
            {
                case Step::Eof:
                    done = true;
                    break;
                case Step::Ignore:
                case Step::NewLine:
                    start_ = current_;
                    break;
                case Step::Emit:
                    emit_(buffer, scanned);
                    break;
                case Step::Fail:
                    break;
            }

            if (error_)
            {
                util::log::os(1) << "[tkn::Scanner] " << *error_ << std::endl;
                MSS(false);
            }
        }

        MSS_END();
    }

    void Scanner::scan_token_(Scanned &scanned)
    {
        if (current_ >= source_.size())
        {
            scanned.step = Step::Eof;
            return;
        }

        if (scan_comment_(scanned))
            return;
        if (scan_newline_(scanned))
            return;
        if (scan_space_(scanned))
            return;
        if (scan_symbol_(scanned))
            return;
        if (scan_keyword_(scanned))
            return;
        if (scan_string_(scanned))
            return;
        if (scan_identifier_(scanned))
            return;
        if (scan_number_(scanned))
            return;

        scanned.step = Step::Fail;
        fail_(ErrorKind::UnknownToken, current_);
    }

    bool Scanner::scan_comment_(Scanned &scanned)
    {
        const auto &language = *language_;

        if (language.has_multi_line_comment() && match_(*language.multi_line_comment_begin) > 0)
        {
            scan_multi_line_comment_(scanned);
            return true;
        }
        if (language.single_line_comment && match_(*language.single_line_comment) > 0)
        {
            scan_single_line_comment_(scanned);
            return true;
        }
        return false;
    }

    // The terminating newline is left for scan_newline_()
    void Scanner::scan_single_line_comment_(Scanned &scanned)
    {
        while (current_ < source_.size() && source_[current_] != U'\n')
            ++current_;

        scanned.step = Step::Emit;
        scanned.kind = Comment{str::encode(source_.substr(start_, current_ - start_))};
    }

    // Nested markers are counted, markers inside a double-quoted string are skipped
    void Scanner::scan_multi_line_comment_(Scanned &scanned)
    {
        const auto &begin = *language_->multi_line_comment_begin;
        const auto &end = *language_->multi_line_comment_end;

        unsigned int depth = 0;
        bool in_string = false;
        bool escape = false;

        while (current_ < source_.size())
        {
            const auto ch = source_[current_];
            if (ch == U'\n')
            {
                ++line_;
                escape = false;
            }
            else if (ch == U'\\' && !escape)
            {
                escape = true;
            }
            else
            {
                const bool escaped = std::exchange(escape, false);
                if (ch == U'"' && !escaped)
                {
                    in_string = !in_string;
                }
                else if (!in_string)
                {
                    if (const auto size = match_(end); depth > 0 && size > 0)
                    {
                        current_ += size;
                        if (--depth == 0)
                        {
                            scanned.step = Step::Emit;
                            scanned.kind = Comment{str::encode(source_.substr(start_, current_ - start_))};
                            return;
                        }
                        continue;
                    }
                    if (const auto size = match_(begin); size > 0)
                    {
                        current_ += size;
                        ++depth;
                        continue;
                    }
                }
            }
            ++current_;
        }

        // Keep what was found, like for an unterminated string
        scanned.step = Step::Emit;
        scanned.kind = Comment{str::encode(source_.substr(start_))};
        fail_(ErrorKind::UnexpectedEof, start_);
    }

    bool Scanner::scan_newline_(Scanned &scanned)
    {
        if (source_[current_] != U'\n')
            return false;

        ++current_;
        ++line_;
        scanned.step = Step::NewLine;
        return true;
    }

    bool Scanner::scan_space_(Scanned &scanned)
    {
        const auto start = current_;
        while (current_ < source_.size() && is_space(source_[current_]))
            ++current_;

        if (current_ == start)
            return false;

        scanned.step = Step::Ignore;
        return true;
    }

    bool Scanner::scan_symbol_(Scanned &scanned)
    {
        for (const auto &symbol : language_->symbols)
        {
            if (const auto size = match_(symbol); size > 0)
            {
                current_ += size;
                scanned.step = Step::Emit;
                scanned.kind = Symbol{symbol};
                return true;
            }
        }
        return false;
    }

    bool Scanner::scan_keyword_(Scanned &scanned)
    {
        for (const auto &keyword : language_->keywords)
        {
            const auto size = match_(keyword);
            if (size == 0)
                continue;

            // A longer identifier starting with this keyword is not a keyword
            const auto next = current_ + size;
            if (next < source_.size() && is_alnum(source_[next]))
                continue;

            current_ = next;
            scanned.step = Step::Emit;
            scanned.kind = Keyword{keyword};
            return true;
        }
        return false;
    }

    bool Scanner::scan_string_(Scanned &scanned)
    {
        if (source_[current_] != U'"')
            return false;
        ++current_;

        std::u32string content;
        bool escape = false;
        while (current_ < source_.size())
        {
            const auto ch = source_[current_];
            if (ch == U'\\' && !escape)
            {
                escape = true;
            }
            else
            {
                if (ch == U'"' && !escape)
                {
                    ++current_;
                    scanned.step = Step::Emit;
                    scanned.kind = StringLiteral{str::encode(content)};
                    return true;
                }

                if (escape && ch == U'n')
                    content.push_back(U'\n');
                else if (escape && ch == U't')
                    content.push_back(U'\t');
                else
                {
                    content.push_back(ch);
                    if (ch == U'\n')
                        ++line_;
                }
                escape = false;
            }
            ++current_;
        }

        // The span accounts for the missing closing quote
        scanned.step = Step::Emit;
        scanned.kind = StringLiteral{str::encode(content)};
        scanned.size = static_cast<std::uint32_t>(source_.size()) - start_ + 1;
        fail_(ErrorKind::UnexpectedEof, start_);
        return true;
    }

    bool Scanner::scan_identifier_(Scanned &scanned)
    {
        if (!is_alpha(source_[current_]))
            return false;

        while (current_ < source_.size() && is_alnum(source_[current_]))
            ++current_;

        scanned.step = Step::Emit;
        scanned.kind = Identifier{str::encode(source_.substr(start_, current_ - start_))};
        return true;
    }

    bool Scanner::scan_number_(Scanned &scanned)
    {
        if (!is_digit(source_[current_]))
            return false;

        // Prefixed literals need a leading '0' and at least one digit after the prefix
        if (source_[current_] == U'0' && current_ + 2 < source_.size())
        {
            const auto marker = source_[current_ + 1];
            const auto first = source_[current_ + 2];
            if ((marker == U'x' || marker == U'X') && digit_value(first, 16))
            {
                current_ += 2;
                scan_based_number_(scanned, 16, "0x");
                return true;
            }
            if ((marker == U'b' || marker == U'B') && digit_value(first, 2))
            {
                current_ += 2;
                scan_based_number_(scanned, 2, "0b");
                return true;
            }
        }

        Number number = 0.0;
        while (current_ < source_.size() && is_digit(source_[current_]))
        {
            number = number * 10.0 + (source_[current_] - U'0');
            ++current_;
        }

        if (current_ + 1 < source_.size() && source_[current_] == U'.' && is_digit(source_[current_ + 1]))
        {
            ++current_;
            Number div = 1.0;
            while (current_ < source_.size() && is_digit(source_[current_]))
            {
                number = number * 10.0 + (source_[current_] - U'0');
                div *= 10.0;
                ++current_;
            }
            number /= div;
        }

        scanned.step = Step::Emit;
        scanned.kind = NumberLiteral{str::encode(source_.substr(start_, current_ - start_)), number};
        return true;
    }

    void Scanner::scan_based_number_(Scanned &scanned, unsigned int base, const char *prefix)
    {
        const auto digits_start = current_;

        Number number = 0.0;
        for (; current_ < source_.size(); ++current_)
        {
            const auto value = digit_value(source_[current_], base);
            if (!value)
                break;
            number = number * base + *value;
        }

        scanned.step = Step::Emit;
        scanned.kind = NumberLiteral{prefix + str::encode(source_.substr(digits_start, current_ - digits_start)), number};
    }

    std::uint32_t Scanner::match_(const std::string &candidate) const
    {
        std::uint32_t size = 0;
        for (std::size_t ix = 0; ix < candidate.size(); ++size)
        {
            char32_t ch;
            if (!str::decode_next(candidate, ix, ch))
                return 0;
            const auto pos = current_ + size;
            if (pos >= source_.size() || source_[pos] != ch)
                return 0;
        }
        return size;
    }

    void Scanner::emit_(Buffer &buffer, Scanned &scanned)
    {
        const auto size = scanned.size.value_or(current_ - start_);
        auto &token = buffer.tokens_.emplace_back(Token{.kind = std::move(scanned.kind), .range = str::Range{.ix = start_, .size = size}, .line = start_line_});
        util::log::os(3) << "[tkn::Scanner] " << token << std::endl;
        start_ = current_;
    }

    void Scanner::fail_(ErrorKind kind, std::uint32_t offset)
    {
        error_ = Error{.kind = kind, .line = start_line_, .offset = offset};
    }

} // namespace tkn
