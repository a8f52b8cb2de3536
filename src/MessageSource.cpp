// <MessageSource> -*- C++ -*-


/*!
 * \file MessageSource.cpp
 * \brief MessageSource implementation.
 */

#include "mdb2sqlite/log/MessageSource.hpp"

#include "mdb2sqlite/utils/TimeManager.hpp"

namespace mdb2sqlite {
    namespace log {

seq_num_type MessageSource::seq_num_ = 0;

void MessageSource::emit_(const std::string& content) const {
    Message msg =
        {
            {
                origin_,                                           // Origin location
                TimeManager::getTimeManager().getSecondsElapsed(), // Wall clock time
                category_,                                         // Category
                0,                                                 // Thread ID - single-threaded exporter
                seq_num_
            },
            true,
            content
        };
    ++seq_num_;
    ++num_emitted_;

    // Iterate a copy, taps may detach while writing
    const std::vector<Tap*> taps = Tap::getAttachedTaps();
    for(Tap* t : taps){
        if(t->observes(origin_, category_)){
            t->send(msg);
        }
    }
}

MessageSource& MessageSource::getGlobalWarn()
{
    static MessageSource warn("global", categories::WARN_STR);
    return warn;
}


    } // namespace log
} // namespace mdb2sqlite
