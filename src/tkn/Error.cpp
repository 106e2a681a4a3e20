#include <tkn/Error.hpp>

namespace tkn {

    std::ostream &operator<<(std::ostream &os, ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::UnknownToken: os << "unknown token"; break;
            case ErrorKind::UnexpectedEof: os << "unexpected end of file"; break;
        }
        return os;
    }

    std::ostream &operator<<(std::ostream &os, const Error &error)
    {
        os << error.line << ':' << error.offset << " : " << error.kind;
        return os;
    }

} // namespace tkn
