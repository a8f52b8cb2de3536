// <DestinationStore> -*- C++ -*-

#ifndef __MDB2SQLITE_DESTINATION_STORE_H__
#define __MDB2SQLITE_DESTINATION_STORE_H__

#include "mdb2sqlite/values/Row.hpp"

#include <string>

namespace mdb2sqlite {

/*!
 * \brief Proxy object which forwards schema and row writes to
 * the physical destination database. The exporter never holds
 * the database handle directly.
 */
class DestinationStore
{
public:
    virtual ~DestinationStore() = default;

    //! Turn space-reclaiming storage on or off. Only has an
    //! effect before the first table is created.
    virtual void setSpaceReclaiming(const bool enabled) = 0;

    //! Issue BEGIN TRANSACTION
    virtual void beginTransaction() = 0;

    //! Issue COMMIT TRANSACTION
    virtual void commitTransaction() = 0;

    //! Issue ROLLBACK TRANSACTION. Does nothing if there is no
    //! open transaction.
    virtual void rollbackTransaction() = 0;

    //! Is there an open transaction?
    virtual bool inTransaction() const = 0;

    //! Execute one CREATE TABLE / CREATE INDEX statement
    virtual void executeDDL(const std::string & statement) = 0;

    //! Insert one row into a table. Values are bound by position
    //! in the table's declared column order; an invalid value
    //! is written as NULL.
    virtual void insert(const std::string & table_name,
                        const Row & values) = 0;
};

} // namespace mdb2sqlite

#endif
