// <MessageSource> -*- C++ -*-

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <sstream>
#include <utility>

#include "mdb2sqlite/log/Message.hpp"
#include "mdb2sqlite/log/MessageInfo.hpp"
#include "mdb2sqlite/log/Tap.hpp"
#include "mdb2sqlite/log/Categories.hpp"

namespace mdb2sqlite
{
    /*!
     * \brief Diagnostic logging framework.
     */
    namespace log
    {
        /*!
         * \brief Generates logging messages of a specific category from a
         * dotted origin location (e.g. "export.populate").
         *
         * Messages are only built when some Tap observes this source, so
         * callers should guard expensive messages with operator bool:
         * \code
         * if(info_) {
         *     info_ << "copied " << n << " rows";
         * }
         * \endcode
         */
        class MessageSource
        {
        public:

            MessageSource(const MessageSource&) = delete;
            MessageSource& operator=(const MessageSource&) = delete;

            MessageSource(const std::string& origin,
                          const std::string& category) :
                origin_(origin),
                category_(category)
            { }

            uint64_t getNumEmitted() const {
                return num_emitted_;
            }

            const std::string& getOrigin() const {
                return origin_;
            }

            const std::string& getCategoryName() const {
                return category_;
            }

            /*!
             * \brief Is any tap currently observing this source?
             */
            bool observed() const noexcept {
                for(const Tap* t : Tap::getAttachedTaps()){
                    if(t->observes(origin_, category_)){
                        return true;
                    }
                }
                return false;
            }

            operator bool() const noexcept {
                return observed();
            }

            /*!
             * \brief Gets the global warning logger. Origin is "global".
             */
            static MessageSource& getGlobalWarn();

            //! \name Message Generation
            //! @{
            ////////////////////////////////////////////////////////////////////////

            /*!
             * \brief Temporary object for constructing a log message with a
             * ostream-like interface. Emits a message to the message source
             * upon destruction.
             */
            class LogObject
            {
                const MessageSource* src_;

                std::ostringstream s_;

            public:

                LogObject() = delete;

                LogObject(LogObject&& rhp) :
                    src_(rhp.src_),
                    s_(rhp.s_.str())
                {
                    s_.seekp(0, std::ios_base::end);
                    rhp.src_ = nullptr;
                }

                LogObject(const LogObject& rhp) = delete;

                LogObject(const MessageSource& src) :
                    src_(&src)
                { }

                template <class T>
                LogObject(const MessageSource& src, const T& init) :
                    src_(&src)
                {
                    s_ << init;
                }

                /*!
                 * \brief Sends the message constructed within this object
                 * through MessageSource::emit_
                 */
                ~LogObject() {
                    if(src_){
                        src_->emit_(s_.str());
                    }
                }

                template <class T>
                LogObject& operator<<(const T& t) {
                    s_ << t;
                    return *this;
                }

                LogObject& operator<<(std::ostream& (*f)(std::ostream&)) {
                    f(s_);
                    return *this;
                }
            };

            template <class T>
            LogObject operator<<(const T& t) const {
                return LogObject(*this, t);
            }

            ////////////////////////////////////////////////////////////////////////
            //! @}

            std::string stringize() const {
                std::stringstream ss;
                ss << '<' << origin_ << ":log_msg_src cat:\""
                   << category_ << "\" observed:" << std::boolalpha << observed()
                   << " msgs:" << getNumEmitted() << '>';
                return ss.str();
            }

        private:

            /*!
             * \brief Sends a message to every observing tap immediately.
             * \post Increments seq_num_
             */
            void emit_(const std::string& content) const;

            const std::string origin_;
            const std::string category_;
            mutable uint64_t num_emitted_ = 0;

            static seq_num_type seq_num_;
        };

    } // namespace log
} // namespace mdb2sqlite
