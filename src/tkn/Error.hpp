#ifndef HEADER_tkn_Error_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Error_hpp_ALREADY_INCLUDED

#include <cstdint>
#include <ostream>

namespace tkn {

    enum class ErrorKind
    {
        // No classifier matched at the current position
        UnknownToken,
        // Input ended inside a string literal or multi-line comment
        UnexpectedEof,
    };
    std::ostream &operator<<(std::ostream &os, ErrorKind kind);

    struct Error
    {
        ErrorKind kind{};
        std::uint32_t line{};
        // Start position of the offending token, in scalar values
        std::uint32_t offset{};

        bool operator==(const Error &) const = default;
    };
    std::ostream &operator<<(std::ostream &os, const Error &error);

} // namespace tkn

#endif
