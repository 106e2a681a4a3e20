#ifndef HEADER_str_Range_hpp_ALREADY_INCLUDED
#define HEADER_str_Range_hpp_ALREADY_INCLUDED

#include <cstdint>
#include <string_view>

namespace str {

    // Position and size in scalar values
    struct Range
    {
        std::uint32_t ix{};
        std::uint32_t size{};

        std::uint32_t end() const { return ix + size; }

        // Clamped to the end of sv
        std::u32string_view sv(const std::u32string_view &sv) const { return ix < sv.size() ? sv.substr(ix, size) : std::u32string_view{}; }

        bool operator==(const Range &) const = default;
    };

} // namespace str

#endif
