// <Destination.cpp> -*- C++ -*-


/*!
 * \file Destination.cpp
 * \brief Contains implementation of destination writer functions
 */

#include "mdb2sqlite/log/Destination.hpp"

#include <fstream>
#include <iomanip>
#include <ostream>

namespace mdb2sqlite {
    namespace log {

DestinationManager::DestinationVector DestinationManager::dests_;

const Formatter::Info FMTLIST[] = {
    /*! Writes source, category, content */
    { ".log.basic",
      "basic formatter. Contains message origin, category, and content",
      [](std::ostream& s) -> Formatter* { return new BasicFormatter(s); } },

    /*! Writes all message info */
    { ".log.verbose",
      "verbose formatter. Contains all message meta-data",
      [](std::ostream& s) -> Formatter* { return new VerboseFormatter(s); } },

    /*! Raw data */
    { ".log.raw",
      "raw formatter. Contains no message meta-data",
      [](std::ostream& s) -> Formatter* { return new RawFormatter(s); } },

    /*! Default because it is last in the list */
    { nullptr,
      "Moderate information formatting. Contains most message meta-data excluding thread and "
      "message sequence.",
      [](std::ostream& s) -> Formatter* { return new DefaultFormatter(s); } }
};

const Formatter::Info* Formatter::FORMATTERS = FMTLIST;

void DefaultFormatter::write(const Message& msg)
{
    std::ios::fmtflags f = stream_.flags();
    const char fill = stream_.fill();
    const std::streamsize precision = stream_.precision();

    if(msg.print_info)
    {
        stream_ << '{';

        // wall time
        stream_ << std::setfill('0') << std::setw(10) << std::right << std::fixed
                << std::setprecision(4) << msg.info.wall_time << INFO_DELIMITER;
        stream_.flags(f);
        stream_.fill(fill);
        stream_.precision(precision);

        // origin
        stream_ << msg.info.origin << INFO_DELIMITER;

        // category
        stream_ << msg.info.category << "} ";
    }

    stream_ << utils::copyWithReplace(msg.content, '\n', "") << std::endl;

    // restore ostream state
    stream_.flags(f);
    stream_.fill(fill);
    stream_.precision(precision);

    stream_.flush();
}

    } // namespace log
} // namespace mdb2sqlite
