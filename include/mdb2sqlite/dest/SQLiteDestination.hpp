// <SQLiteDestination> -*- C++ -*-

#ifndef __MDB2SQLITE_SQLITE_DESTINATION_H__
#define __MDB2SQLITE_SQLITE_DESTINATION_H__

#include "mdb2sqlite/dest/DestinationStore.hpp"

#include <memory>
#include <string>

namespace mdb2sqlite {

/*!
 * \brief DestinationStore writing to a SQLite database file.
 *
 * The file must be new or empty: a file that does not exist,
 * a zero-byte file, or a SQLite database with no schema
 * objects. Anything else is refused without being touched.
 */
class SQLiteDestination : public DestinationStore
{
public:
    //! Open (creating if needed) an empty destination database.
    //! \throw OpenError if the file is not empty or cannot be
    //! opened for writing.
    explicit SQLiteDestination(const std::string & db_file);

    //! Finalizes cached statements and closes the connection
    ~SQLiteDestination() override;

    //! Get the database filename being used
    const std::string & getDatabaseFilename() const;

    //! PRAGMA auto_vacuum = FULL / NONE
    void setSpaceReclaiming(const bool enabled) override;

    void beginTransaction() override;

    void commitTransaction() override;

    void rollbackTransaction() override;

    bool inTransaction() const override;

    //! Execute the statement. Throws DestinationError with the
    //! SQLite message and the statement text if it fails.
    void executeDDL(const std::string & statement) override;

    //! INSERT INTO '<table>' VALUES (?, ?, ...). The prepared
    //! statement is cached per table for the lifetime of this
    //! object.
    void insert(const std::string & table_name,
                const Row & values) override;

    //! Execute a SELECT statement. The provided callback will be
    //! invoked once for each record found. Example:
    //!
    //!    struct CallbackHandler {
    //!        int handle(int argc, char ** argv, char ** col_names) {
    //!            ...
    //!            return 0;
    //!        }
    //!    };
    //!
    //!    CallbackHandler handler;
    //!
    //!    dest.evalSelect(
    //!        "SELECT First,Last FROM Customers",
    //!        +[](void * handler, int argc, char ** argv, char ** col_names) {
    //!            return static_cast<CallbackHandler*>(handler)->handle(argc, argv, col_names);
    //!        },
    //!        &handler);
    void evalSelect(const std::string & command,
                    int (*callback)(void *, int, char **, char **),
                    void * callback_obj) const;

private:
    //! Rest of the implementation is hidden from view.
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace mdb2sqlite

#endif
