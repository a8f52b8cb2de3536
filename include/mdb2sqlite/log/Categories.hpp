// <Categories> -*- C++ -*-

#pragma once

namespace mdb2sqlite
{
    namespace log
    {
        class categories
        {
        public:

            // Builtin Categories
            static constexpr char INFO_STR[] = "info";       //!< Progress of the export
            static constexpr char WARN_STR[] = "warning";    //!< Indicates a WARNING
            static constexpr char DEBUG_STR[] = "debug";     //!< Indicates a DEBUG (statement traces)
            static constexpr char NONE_STR[] = "";           //!< For observing, ANY category

        }; // class categories
    } // namespace log
} // namespace mdb2sqlite
