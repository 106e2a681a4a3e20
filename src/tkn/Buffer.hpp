#ifndef HEADER_tkn_Buffer_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Buffer_hpp_ALREADY_INCLUDED

#include <tkn/Token.hpp>

#include <ostream>
#include <string>

namespace tkn {

    // Output of a single scan run: the decoded source and the tokens found in it.
    // Tokens are appended as they are recognized, a failed run keeps what was found before the failure.
    class Buffer
    {
    public:
        void clear();

        const std::u32string &source() const { return source_; }
        const Tokens &tokens() const { return tokens_; }

        std::size_t size() const { return tokens_.size(); }
        bool empty() const { return tokens_.empty(); }
        const Token &operator[](std::size_t ix) const { return tokens_[ix]; }

        // Source text spanned by token ix, in UTF-8
        std::string lexeme(std::size_t ix) const;

        // One line per token: index, line and kind. Debugging aid only.
        void dump(std::ostream &os) const;

    private:
        friend class Scanner;

        std::u32string source_;
        Tokens tokens_;
    };

} // namespace tkn

#endif
