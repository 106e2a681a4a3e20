#include <tkn/Language.hpp>

#include <str/Utf8.hpp>

#include <algorithm>

namespace tkn {

    bool Language::has_multi_line_comment() const
    {
        return multi_line_comment_begin && !multi_line_comment_begin->empty() && multi_line_comment_end && !multi_line_comment_end->empty();
    }

    void Language::sort_longest_first()
    {
        auto longer = [](const std::string &a, const std::string &b) { return str::length(a) > str::length(b); };
        std::stable_sort(keywords.begin(), keywords.end(), longer);
        std::stable_sort(symbols.begin(), symbols.end(), longer);
    }

} // namespace tkn
