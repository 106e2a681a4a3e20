#ifndef HEADER_ReturnCode_hpp_ALREADY_INCLUDED
#define HEADER_ReturnCode_hpp_ALREADY_INCLUDED

enum class ReturnCode
{
    Ok,
    Error,
};

#endif
