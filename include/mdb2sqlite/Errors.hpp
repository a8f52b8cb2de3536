// <Errors> -*- C++ -*-

#ifndef __MDB2SQLITE_ERRORS_H__
#define __MDB2SQLITE_ERRORS_H__

#include <exception>
#include <string>
#include <sstream>

namespace mdb2sqlite {

//! Base class of every exception thrown during an export.
//! Messages are built up with operator<< so that callers
//! can tack on table / column context as the exception
//! propagates.
class ExportException : public std::exception
{
public:
    ExportException() = default;

    //! Construct an ExportException object
    explicit ExportException(const std::string & reason) {
        reason_ << reason;
    }

    //! Copy construct an ExportException object
    ExportException(const ExportException & rhs) :
        std::exception(rhs)
    {
        reason_ << rhs.reason_.str();
    }

    /// Destroy!
    virtual ~ExportException() noexcept override {}

    /**
     * \brief Overload from std::exception
     * \return Const char * of the exception reason
     */
    virtual const char * what() const noexcept override {
        reason_str_ = reason_.str();
        return reason_str_.c_str();
    }

    /**
     * \brief Append additional information to the message.
     */
    template<class T>
    ExportException & operator<<(const T & msg) {
        reason_ << msg;
        return *this;
    }

private:
    // The reason/explanation for the exception
    std::stringstream reason_;

    // Need to keep a local copy of the string formed in the
    // string stream for the 'what' call
    mutable std::string reason_str_;
};

//! The subclasses below only exist so that callers (and tests)
//! can tell the failure categories apart. Each one forwards
//! operator<< so that chained messages keep the derived type.
#define MDB2SQLITE_DERIVED_EXCEPTION(ExType)                        \
class ExType : public ExportException                               \
{                                                                   \
public:                                                             \
    ExType() = default;                                             \
    explicit ExType(const std::string & reason) :                   \
        ExportException(reason)                                     \
    {}                                                              \
    template<class T>                                               \
    ExType & operator<<(const T & msg) {                            \
        ExportException::operator<<(msg);                           \
        return *this;                                               \
    }                                                               \
};

//! Source file unreadable / unrecognized, or destination
//! not empty / not writable. Raised before any work begins.
MDB2SQLITE_DERIVED_EXCEPTION(OpenError)

//! A column's source type tag has no storage category.
MDB2SQLITE_DERIVED_EXCEPTION(UnsupportedTypeError)

//! The source reported metadata that cannot be turned into
//! a destination schema (index on an unknown column, ...)
MDB2SQLITE_DERIVED_EXCEPTION(SchemaError)

//! A DDL statement or INSERT was rejected by the destination.
MDB2SQLITE_DERIVED_EXCEPTION(DestinationError)

//! A row value cannot be represented for its column.
MDB2SQLITE_DERIVED_EXCEPTION(ConversionError)

//! Bad configuration file contents or option values.
MDB2SQLITE_DERIVED_EXCEPTION(ConfigError)

#undef MDB2SQLITE_DERIVED_EXCEPTION

} // namespace mdb2sqlite

#define MDB2SQLITE_ADD_FILE_INFORMATION(ex, file, line)             \
  ex << ": in file: '" << file << "', on line: "                    \
     << std::dec << line;

#define mdb2sqlite_throw(message)                                   \
  {                                                                 \
      std::stringstream msg;                                        \
      msg << message;                                               \
      mdb2sqlite::ExportException ex(std::string("abort: ") + msg.str()); \
      MDB2SQLITE_ADD_FILE_INFORMATION(ex, __FILE__, __LINE__);      \
      throw ex;                                                     \
  }

#endif
