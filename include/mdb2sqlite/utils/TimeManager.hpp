// <TimeManager> -*- C++ -*-

#pragma once

#include <sys/time.h>

namespace mdb2sqlite
{
    /*!
     * \brief Singleton which tracks wall-clock time since the process
     * started exporting. Used to timestamp log messages.
     */
    class TimeManager
    {
    public:

        //! Retrieves the singleton instance
        static TimeManager& getTimeManager() {
            static TimeManager tm;
            return tm;
        }

        /*!
         * \brief Gets the number of seconds elapsed since the
         * TimeManager was first used
         */
        double getSecondsElapsed() const {
            struct timeval t;
            gettimeofday(&t, NULL);
            return ((t.tv_sec - tv_start_.tv_sec)) + ((t.tv_usec - tv_start_.tv_usec) / 1000000.0);
        }

    private:

        TimeManager() {
            gettimeofday(&tv_start_, NULL);
        }

        struct timeval tv_start_;
    };

} // namespace mdb2sqlite
