// <MessageInfo> -*- C++ -*-

#ifndef __MDB2SQLITE_MESSAGE_INFO_H__
#define __MDB2SQLITE_MESSAGE_INFO_H__

#include <cstdint>
#include <ostream>
#include <string>

namespace mdb2sqlite
{
    namespace log
    {
        typedef uint32_t thread_id_type; //!< Identifies the thread that logged a message
        typedef int64_t seq_num_type;    //!< Sequence number of a message within a thread ID. Signed so that initial state can be -1.

        /*!
         * \brief Logging Message information excluding actual message content
         */
        struct MessageInfo
        {
            //! \brief Timing type for wall-clock time
            typedef double wall_time_type;

            const std::string & origin;   //!< Dotted location of the component which logged the message
            wall_time_type wall_time;     //!< Seconds since the export started (not guaranteed to be monotonically increasing)
            const std::string & category; //!< Category with which this message was created
            thread_id_type thread_id;     //!< Thread ID of source
            seq_num_type seq_num;         //!< Sequence number of message within thread
        };


        static constexpr const char* INFO_DELIMITER = " ";

        /*!
         * \brief ostream insertion operator for serializing MessageInfo.
         *
         * The result of this operation ends up directly in log files or on the screen
         */
        std::ostream& operator<<(std::ostream& o, const MessageInfo& info);

    } // namespace log
} // namespace mdb2sqlite

// __MDB2SQLITE_MESSAGE_INFO_H__
#endif
