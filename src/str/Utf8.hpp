#ifndef HEADER_str_Utf8_hpp_ALREADY_INCLUDED
#define HEADER_str_Utf8_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace str {

    // Decodes the scalar value starting at ix and moves ix past it.
    // Returns false for a malformed, overlong or surrogate sequence, leaving ix untouched.
    bool decode_next(const std::string_view &sv, std::size_t &ix, char32_t &ch);

    // Strict decoding of a complete buffer. On failure, bad_offset receives the byte offset of the first malformed sequence.
    ReturnCode decode(std::u32string &dst, const std::string_view &src, std::optional<std::size_t> *bad_offset = nullptr);

    void append(std::string &dst, char32_t ch);
    std::string encode(const std::u32string_view &sv);

    // Number of scalar values in a valid UTF-8 string
    std::size_t length(const std::string_view &sv);

} // namespace str

#endif
