#include <tkn/Buffer.hpp>

#include <str/Utf8.hpp>

#include <iomanip>

namespace tkn {

    void Buffer::clear()
    {
        source_.resize(0);
        tokens_.resize(0);
    }

    std::string Buffer::lexeme(std::size_t ix) const
    {
        return str::encode(tokens_[ix].range.sv(source_));
    }

    void Buffer::dump(std::ostream &os) const
    {
        for (auto ix = 0u; ix < tokens_.size(); ++ix)
        {
            const auto &token = tokens_[ix];
            os << "[#" << std::setw(3) << std::setfill('0') << ix << std::setfill(' ') << " line " << token.line << "] " << token.kind << std::endl;
        }
    }

} // namespace tkn
