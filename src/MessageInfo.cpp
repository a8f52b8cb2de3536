// <MessageInfo> -*- C++ -*-


/*!
 * \file MessageInfo.cpp
 * \brief Prints Log message information
 */

#include "mdb2sqlite/log/MessageInfo.hpp"

#include <iomanip>
#include <ostream>

namespace mdb2sqlite {
    namespace log {

std::ostream& operator<<(std::ostream& o, const MessageInfo& info) {
    std::ios::fmtflags f = o.flags();
    const char fill = o.fill();
    const std::streamsize precision = o.precision();

    double t = double(info.wall_time);

    o << '{';

    // wall time
    o << std::setfill('0') << std::setw(10) << std::right << std::fixed
      << std::setprecision(4) << t << INFO_DELIMITER;
    o.flags(f); // drop precision and fixed specifiers

    o << std::setfill('0') << std::right << std::hex;

    // thread id
    o << "0x" << std::setw(2) << info.thread_id << INFO_DELIMITER;

    // sequence id
    o << "0x" << std::setw(8) << info.seq_num << INFO_DELIMITER;

    // origin
    o << info.origin << INFO_DELIMITER;

    // category
    o << info.category << "} ";

    // restore ostream state
    o.flags(f);
    o.fill(fill);
    o.precision(precision);

    return o;
}

    } // namespace log
} // namespace mdb2sqlite
