// <Destination> -*- C++ -*-

#ifndef __MDB2SQLITE_DESTINATION_H__
#define __MDB2SQLITE_DESTINATION_H__

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <ostream>
#include <fstream>
#include <sstream>
#include <map>
#include <mutex>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "mdb2sqlite/log/Message.hpp"
#include "mdb2sqlite/log/MessageInfo.hpp"
#include "mdb2sqlite/utils/StringUtils.hpp"
#include "mdb2sqlite/Errors.hpp"

namespace mdb2sqlite
{
    namespace log
    {
        /*!
         * \brief Generic Logging destination stream interface which writes
         * mdb2sqlite::log::Message structures to some output [file]stream.
         * Subclasses implement stream I/O based on construction arguments.
         *
         * Destinations are uniquely identified by their construction argument
         * (i.e. string or ostream reference) and are managed by
         * DestinationManager so that there are no duplicates.
         *
         * Noncopyable and non-assignable
         */
        class Destination
        {
        public:

            Destination(const Destination&) = delete;
            Destination& operator=(const Destination&) = delete;

            //! Default constructor
            Destination() :
                num_msgs_received_(0),
                num_msgs_written_(0),
                num_msg_duplicates_(0)
            { }

            virtual ~Destination()
            { }

            /*!
             * \brief Comparison of destination for const char[].
             * Uses std::string comparison
             */
            template <std::size_t N>
            bool compare(const char (& arg)[N]) const {
                return compareStrings(std::string(arg));
            }

            /*!
             * \brief Comparison of destination for std::string
             */
            bool compare(const std::string& arg) const {
                return compareStrings(arg);
            }

            /*!
             * \brief Handle Destination::operator== on ostreams
             */
            bool compare(const std::ostream& arg) const {
                return compareOstreams(arg);
            }

            /*!
             * \brief Returns true if the destination behind this interface was
             * constructed with the string s.
             */
            virtual bool compareStrings(const std::string&) const {
                return false;
            }

            /*!
             * \brief Returns true if the destination behind this interface was
             * constructed with the ostream o.
             */
            virtual bool compareOstreams(const std::ostream&) const {
                return false;
            }

            /*!
             * \brief Create a string representation of this Destination
             */
            virtual std::string stringize() const = 0;

            //! \note This method IS thread-safe
            void write(const Message& msg) {
                std::lock_guard<std::mutex> lock(write_mutex_);

                ++num_msgs_received_;

                // Filter by sequence. Get last sequence ID on this message's thread
                seq_num_type last_seq = getLastSequenceNum_(msg.info.thread_id);
                if(msg.info.seq_num <= last_seq){
                    // Duplicate (same msg from a different tap), do not write
                    ++num_msg_duplicates_;
                    return;
                }

                ++num_msgs_written_;
                write_(msg);

                last_seq_map_[msg.info.thread_id] = msg.info.seq_num;
            }

            /*!
             * \brief Get the total number of messages logged through this
             * destination.
             */
            uint64_t getNumMessagesReceived() const { return num_msgs_received_; }

            /*!
             * \brief Gets the total number of messages received by this
             * destination and then written to the actual output stream.
             */
            uint64_t getNumMessagesWritten() const { return num_msgs_written_; }

            /*!
             * \brief Gets the total number of times that a message has arrived
             * at this destination after already having been written to the
             * output stream. This happens when several taps observing the
             * same origin share a destination.
             */
            uint64_t getNumMessageDuplicates() const { return num_msg_duplicates_; }

        private:

            //! Gets the last sequence number for this destination for the given thread ID
            seq_num_type getLastSequenceNum_(thread_id_type tid) const {
                auto itr = last_seq_map_.find(tid);
                if(itr != last_seq_map_.end()){
                    return itr->second;
                }
                return -1;
            }

            //! Write handler. Must be overridden by subclasses to serialize the log Message
            //! \pre Write mutex will be held on this destination
            virtual void write_(const Message& msg) = 0;

            uint64_t num_msgs_received_;  //!< Total messages received
            uint64_t num_msgs_written_;   //!< Total messages written to the destination (received - duplicates)
            uint64_t num_msg_duplicates_; //!< Total number of messages which were already written

            std::map<thread_id_type, seq_num_type> last_seq_map_; //!< Mapping of thread IDs to latest sequence IDs

            std::mutex write_mutex_;
        };

        /*!
         * \brief File writer formatting interface. Subclasses format
         * for different file types
         */
        class Formatter {
        protected:
            std::ostream& stream_;

        public:

            /*!
             * \brief Formatter type description. Used in a table to describe
             * various formatter subclasses
             */
            struct Info {
                const char* const extension;
                const std::string extname;
                std::function<Formatter* (std::ostream&)> factory;
            };

            Formatter(std::ostream& stream) :
                stream_(stream)
            { }

            virtual ~Formatter() { }

            /*!
             * \brief Write a log message
             */
            virtual void write(const Message& msg) = 0;

            /*!
             * \brief Write a header to a newly-opened log file
             */
            virtual void writeHeader(const std::string & title) {
                stream_ << "# " << title << "\n";
                stream_.flush();
            }

            /*!
             * \brief Formatter list terminated with an Info having a null
             * extension, which is the default formatter.
             *
             * DestinationInstance<std::string> compares the input filename
             * against the extensions in this table.
             */
            static const Info* FORMATTERS;
        };

        //! \brief Formatter that writes all message information
        class VerboseFormatter : public Formatter {
        public:
            VerboseFormatter(std::ostream& stream) :
                Formatter(stream)
            { }

            void write(const Message& msg) override {
                stream_ << msg.info << utils::copyWithReplace(msg.content, '\n', "") << std::endl;
                stream_.flush();
            }
        };

        /*!
         * \brief Formatter that writes most message information, but excludes
         * thread/sequence
         */
        class DefaultFormatter : public Formatter {
        public:
            DefaultFormatter(std::ostream& stream) :
                Formatter(stream)
            { }

            void write(const Message& msg) override;
        };

        /*!
         * \brief Formatter including only origin and category
         */
        class BasicFormatter : public Formatter {
        public:
            BasicFormatter(std::ostream& stream) :
                Formatter(stream)
            { }

            void write(const Message& msg) override {
                stream_ << msg.info.origin << ": "
                        << msg.info.category << ": "
                        << utils::copyWithReplace(msg.content, '\n', "") << std::endl;
                stream_.flush();
            }
        };

        /*!
         * \brief Formatter including no meta-data from the message
         */
        class RawFormatter : public Formatter {
        public:
            RawFormatter(std::ostream& stream) :
                Formatter(stream)
            { }

            void write(const Message& msg) override {
                stream_ << utils::copyWithReplace(msg.content, '\n', "") << std::endl;
                stream_.flush();
            }
        };

        template <typename DestType>
        class DestinationInstance : public Destination
        {
        };

        /*!
         * \brief Logging Destination for an already-open ostream
         *
         * This is used for logging to cout and cerr
         */
        template <>
        class DestinationInstance<std::ostream> : public Destination
        {
            std::ostream& stream_;
            DefaultFormatter fmt_;

        public:

            DestinationInstance(std::ostream& stream) :
                stream_(stream),
                fmt_(stream_)
            {
                if(stream.good() == false){
                    throw ExportException("stream must be a good() ostream");
                }
            }

            bool compareOstreams(const std::ostream& o) const override {
                return &o == &stream_;
            }

            std::string stringize() const override {
                std::stringstream ss;
                ss << "<" << "destination ostream=";
                if(&stream_ == &std::cout){
                    ss << "cout";
                }else if(&stream_ == &std::cerr){
                    ss << "cerr";
                }else{
                    ss << &stream_;
                }
                ss << " rcv="
                   << getNumMessagesReceived() << " wrote=" << getNumMessagesWritten()
                   << " dups=" << getNumMessageDuplicates() << ">";
                return ss.str();
            }

        private:

            void write_(const Message& msg) override {
                fmt_.write(msg);
            }
        };

        /*!
         * \brief Destination that opens and writes to a file with a format
         * based on the file extension of the filename given during
         * construction.
         */
        template <>
        class DestinationInstance<std::string> : public Destination
        {
            std::ofstream stream_;
            const std::string filename_;
            std::unique_ptr<Formatter> formatter_;
            const Formatter::Info* fmtinfo_;

        public:

            DestinationInstance(const std::string& filename) :
                stream_(filename, std::ofstream::out),
                filename_(filename)
            {
                if(stream_.good() == false){
                    throw ConfigError("Failed to open logging destination file \"")
                        << filename << "\"";
                }

                fmtinfo_ = Formatter::FORMATTERS;
                while(true){
                    if(nullptr == fmtinfo_->extension){
                        break; // End of the list. Use this formatter
                    }
                    std::string ext = fmtinfo_->extension;
                    size_t pos = filename.find(ext);
                    if(pos != std::string::npos && pos == filename.size() - ext.size()){
                        break;
                    }
                    ++fmtinfo_;
                }
                formatter_.reset(fmtinfo_->factory(stream_));
                formatter_->writeHeader("mdb2sqlite log: " + filename_);
            }

            bool compareStrings(const std::string& filename) const override {
                return filename == filename_;
            }

            std::string stringize() const override {
                std::stringstream ss;
                ss << "<" << "destination file=\"" << filename_ << "\" format=\""
                   << fmtinfo_->extname << "\" ext=\"";
                if(nullptr == fmtinfo_->extension){
                    ss << "(default)";
                }else{
                    ss << fmtinfo_->extension;
                }
                ss << "\" rcv=" << getNumMessagesReceived()
                   << " wrote=" << getNumMessagesWritten()
                   << " dups=" << getNumMessageDuplicates() << ">";
                return ss.str();
            }

        private:

            void write_(const Message& msg) override {
                formatter_->write(msg);
            }
        };


        /*!
         * \brief Manages a set of destinations representing files or streams.
         */
        class DestinationManager
        {
        public:

            typedef std::vector<std::unique_ptr<Destination>> DestinationVector;

            /*!
             * \brief Requests an existing Destination* from the manager and
             * allocates a new one if it does not yet have a destination
             * matching the input argument.
             * \param arg Destination identifier. std::string and const char[]
             * are interpreted to be filenames, std::ostream as an open stream.
             * \throw ConfigError if a file cannot be opened.
             *
             * Destinations can never be removed once constructed.
             */
            template <class DestT>
            static Destination* getDestination(DestT& arg) {
                for(std::unique_ptr<Destination>& d : dests_){
                    if(d->compare(arg)){
                        return d.get();
                    }
                }

                dests_.emplace_back(createDestination(arg));
                return dests_.back().get();
            }

            template <std::size_t N>
            static Destination* createDestination(const char (&arg)[N]) {
                return new DestinationInstance<std::string>(arg);
            }

            static Destination* createDestination(const std::string& arg) {
                return new DestinationInstance<std::string>(arg);
            }

            static Destination* createDestination(std::ostream& arg) {
                return new DestinationInstance<std::ostream>(arg);
            }

            static const DestinationVector& getDestinations() {
                return dests_;
            }

            /*!
             * \brief Dumps the destinations known by the destination manager to
             * an ostream with each destination on a separate line
             */
            static std::ostream& dumpDestinations(std::ostream& o) {
                for(auto& d : dests_){
                    o << "  " << d->stringize() << std::endl;
                }
                return o;
            }

            /*!
             * \brief Dumps the supported file extensions and the format used
             * for each
             */
            static std::ostream& dumpFileExtensions(std::ostream& o) {
                const Formatter::Info* finf = Formatter::FORMATTERS;
                while(true){
                    if(nullptr == finf->extension){
                        o << "  " << "(default) -> " << finf->extname << std::endl;
                        break;
                    }
                    o << "  \"" << finf->extension << "\" -> " << finf->extname << std::endl;
                    ++finf;
                }
                return o;
            }

        private:

            static DestinationVector dests_;
        };

    } // namespace log
} // namespace mdb2sqlite

// __MDB2SQLITE_DESTINATION_H__
#endif
