#ifndef HEADER_tkn_Language_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Language_hpp_ALREADY_INCLUDED

#include <optional>
#include <string>
#include <vector>

namespace tkn {

    // Declarative description of the token vocabulary, all strings in UTF-8.
    // Keywords and symbols are tried in list order and the first match wins:
    // when candidates overlap, the longest one must come first.
    struct Language
    {
        std::vector<std::string> keywords;
        std::vector<std::string> symbols;

        std::optional<std::string> single_line_comment;
        // Multi-line comments are only recognized when both markers are set
        std::optional<std::string> multi_line_comment_begin;
        std::optional<std::string> multi_line_comment_end;

        bool has_multi_line_comment() const;

        // Stable reorder of keywords and symbols by descending scalar length
        void sort_longest_first();
    };

} // namespace tkn

#endif
