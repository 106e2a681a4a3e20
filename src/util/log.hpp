#ifndef HEADER_util_log_hpp_ALREADY_INCLUDED
#define HEADER_util_log_hpp_ALREADY_INCLUDED

#include <ostream>

namespace util { namespace log {

    // 0: errors and warnings only, 1: scan failures, 2: per-file progress, 3: per-token trace
    void set_level(int level);

    std::ostream &os(int level);
    std::ostream &error();
    std::ostream &warning();

}} // namespace util::log

#endif
