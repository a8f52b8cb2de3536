// <Message> -*- C++ -*-

#pragma once

#include "mdb2sqlite/log/MessageInfo.hpp"

#include <string>


namespace mdb2sqlite
{
    namespace log
    {
        /*!
         * \brief Contains a logging message header and content
         */
        struct Message
        {
            MessageInfo info;
            bool print_info; // Print the header?
            const std::string& content;
        };

    } // namespace log
} // namespace mdb2sqlite
