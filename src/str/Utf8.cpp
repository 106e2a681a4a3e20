#include <str/Utf8.hpp>

#include <rubr/mss.hpp>

namespace str {

    namespace {
        bool is_cont(unsigned char b) { return (b & 0xC0) == 0x80; }
    } // namespace

    bool decode_next(const std::string_view &sv, std::size_t &ix, char32_t &ch)
    {
        if (ix >= sv.size())
            return false;

        const auto b0 = static_cast<unsigned char>(sv[ix]);
        const auto remaining = sv.size() - ix;
        auto byte = [&](std::size_t offset) { return static_cast<unsigned char>(sv[ix + offset]); };

        if (b0 < 0x80)
        {
            ch = b0;
            ix += 1;
            return true;
        }

        if (b0 >= 0xC2 && b0 <= 0xDF)
        {
            if (remaining < 2 || !is_cont(byte(1)))
                return false;
            ch = ((b0 & 0x1F) << 6) | (byte(1) & 0x3F);
            ix += 2;
            return true;
        }

        if (b0 >= 0xE0 && b0 <= 0xEF)
        {
            if (remaining < 3 || !is_cont(byte(1)) || !is_cont(byte(2)))
                return false;
            if (b0 == 0xE0 && byte(1) < 0xA0)
                return false;
            if (b0 == 0xED && byte(1) >= 0xA0)
                return false;
            ch = ((b0 & 0x0F) << 12) | ((byte(1) & 0x3F) << 6) | (byte(2) & 0x3F);
            ix += 3;
            return true;
        }

        if (b0 >= 0xF0 && b0 <= 0xF4)
        {
            if (remaining < 4 || !is_cont(byte(1)) || !is_cont(byte(2)) || !is_cont(byte(3)))
                return false;
            if (b0 == 0xF0 && byte(1) < 0x90)
                return false;
            if (b0 == 0xF4 && byte(1) > 0x8F)
                return false;
            ch = ((b0 & 0x07) << 18) | ((byte(1) & 0x3F) << 12) | ((byte(2) & 0x3F) << 6) | (byte(3) & 0x3F);
            ix += 4;
            return true;
        }

        // Lone continuation byte, 0xC0, 0xC1 or 0xF5 and above
        return false;
    }

    ReturnCode decode(std::u32string &dst, const std::string_view &src, std::optional<std::size_t> *bad_offset)
    {
        MSS_BEGIN(ReturnCode);

        dst.resize(0);
        dst.reserve(src.size());

        for (std::size_t ix = 0; ix < src.size();)
        {
            char32_t ch;
            const auto start = ix;
            if (!decode_next(src, ix, ch))
            {
                if (bad_offset)
                    *bad_offset = start;
                MSS(false);
            }
            dst.push_back(ch);
        }

        MSS_END();
    }

    void append(std::string &dst, char32_t ch)
    {
        if (ch < 0x80)
        {
            dst.push_back(static_cast<char>(ch));
        }
        else if (ch < 0x800)
        {
            dst.push_back(static_cast<char>(0xC0 | (ch >> 6)));
            dst.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        }
        else if (ch < 0x10000)
        {
            dst.push_back(static_cast<char>(0xE0 | (ch >> 12)));
            dst.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
            dst.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        }
        else
        {
            dst.push_back(static_cast<char>(0xF0 | (ch >> 18)));
            dst.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
            dst.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
            dst.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        }
    }

    std::string encode(const std::u32string_view &sv)
    {
        std::string res;
        res.reserve(sv.size());
        for (const auto ch : sv)
            append(res, ch);
        return res;
    }

    std::size_t length(const std::string_view &sv)
    {
        std::size_t count = 0;
        for (const auto ch : sv)
        {
            if (!is_cont(static_cast<unsigned char>(ch)))
                ++count;
        }
        return count;
    }

} // namespace str
