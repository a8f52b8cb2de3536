// <Tap> -*- C++ -*-

#pragma once

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "mdb2sqlite/log/Destination.hpp"
#include "mdb2sqlite/utils/StringUtils.hpp"

namespace mdb2sqlite
{
    namespace log
    {
        /*!
         * \brief Logging Tap. Intercepts logging messages from any
         * MessageSource whose origin is at or below a dotted location
         * pattern and forwards them to a Destination.
         *
         * Taps register themselves in a process-wide list on construction
         * and remove themselves on destruction.
         *
         * \note The creation and destruction of Taps is not thread-safe.
         * \note noncopyable
         */
        class Tap
        {
        public:

            Tap(const Tap&) = delete;
            Tap& operator=(const Tap&) = delete;

            /*!
             * \brief Constructor
             * \tparam DestT Destination type
             * \param location Dotted origin pattern observed by this tap
             * ("" observes everything)
             * \param category Category on which this tap filters ("" for any)
             * \param dest Destination identifier (std::string filename or
             * ostream&)
             *
             * Example:
             * \code
             * Tap t("export", "", "out.log");             // everything the exporter says
             * Tap t("export.schema", "warning", std::cerr);
             * \endcode
             */
            template <typename DestT>
            Tap(const std::string& location, const std::string& category, DestT& dest) :
                location_(location),
                category_(category),
                dest_(DestinationManager::getDestination(dest))
            {
                getAttachedTaps_().push_back(this);
            }

            /*!
             * \brief Destructor
             * \note Does not affect destination
             */
            virtual ~Tap() {
                detach();
            }

            /*!
             * \brief Stop observing without destroying the tap
             */
            void detach() {
                auto& taps = getAttachedTaps_();
                for(auto itr = taps.begin(); itr != taps.end(); ++itr){
                    if(*itr == this){
                        taps.erase(itr);
                        break;
                    }
                }
            }

            /*!
             * \brief Does this tap want messages from the given origin
             * and category?
             */
            bool observes(const std::string& origin, const std::string& category) const {
                if(!category_.empty() && category_ != category){
                    return false;
                }
                return utils::locationMatches(location_, origin);
            }

            const std::string& getLocation() const {
                return location_;
            }

            const std::string& getCategoryName() const {
                return category_;
            }

            const Destination* getDestination() const {
                return dest_;
            }

            /*!
             * \brief Gets the number of messages forwarded to a destination by
             * this tap.
             */
            uint64_t getNumMessages() const {
                return num_msgs_;
            }

            /*!
             * \brief Forward a message to this tap's destination
             */
            void send(const Message& msg) {
                dest_->write(msg);
                ++num_msgs_;
            }

            /*!
             * \brief All taps currently observing, in construction order
             */
            static const std::vector<Tap*>& getAttachedTaps() {
                return getAttachedTaps_();
            }

        private:

            static std::vector<Tap*>& getAttachedTaps_() {
                static std::vector<Tap*> taps;
                return taps;
            }

            const std::string location_;
            const std::string category_;
            Destination* dest_; //!< Owned by DestinationManager
            uint64_t num_msgs_ = 0;
        };

        /*!
         * \brief Describes a tap requested on the command line or in a
         * configuration file
         */
        class TapDescriptor
        {
        public:

            TapDescriptor(const std::string& _loc_pattern,
                          const std::string& _category,
                          const std::string& _destination) :
                loc_pattern_(_loc_pattern),
                category_(_category),
                dest_(_destination)
            { }

            TapDescriptor(const TapDescriptor&) = default;
            TapDescriptor& operator=(const TapDescriptor&) = default;

            std::string stringize() const {
                std::stringstream ss;
                ss << "Tap location_pattern=\"" << loc_pattern_ << "\" (category=\"" << category_
                   << "\") -> file: \"" << dest_ << "\"";
                return ss.str();
            }

            const std::string& getLocation() const { return loc_pattern_; }
            const std::string& getCategoryName() const { return category_; }
            const std::string& getDestination() const { return dest_; }

            /*!
             * \brief Construct the tap this descriptor describes. A
             * destination of "1" means stdout and "2" means stderr,
             * anything else is a filename.
             */
            std::unique_ptr<Tap> createTap() const {
                if(dest_ == "1"){
                    return std::unique_ptr<Tap>(new Tap(loc_pattern_, category_, std::cout));
                }
                if(dest_ == "2"){
                    return std::unique_ptr<Tap>(new Tap(loc_pattern_, category_, std::cerr));
                }
                return std::unique_ptr<Tap>(new Tap(loc_pattern_, category_, dest_));
            }

        private:

            std::string loc_pattern_;
            std::string category_;
            std::string dest_;
        };

        typedef std::vector<TapDescriptor> TapDescVec;

    } // namespace log
} // namespace mdb2sqlite
