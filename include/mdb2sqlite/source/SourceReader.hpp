// <SourceReader> -*- C++ -*-

#pragma once

#include "mdb2sqlite/schema/Schema.hpp"
#include "mdb2sqlite/values/Row.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mdb2sqlite {

//! Options which control what a source reader reports
struct SourceOptions {
    //! Report the database's own system tables (MSys*) too
    bool include_system_tables = false;

    //! strftime() format used to render date/time values
    std::string date_format = "%Y-%m-%d %H:%M:%S";
};

/*!
 * \brief Forward-only iterator over the rows of one source
 * table. Rows are read lazily, one at a time, so the whole
 * table is never held in memory.
 */
class RowCursor
{
public:
    virtual ~RowCursor() = default;

    //! Read the next row into 'row', with one value per column
    //! in declared order. Returns false once the table has no
    //! more rows.
    virtual bool next(Row & row) = 0;
};

/*!
 * \brief Read-only view of a source database: its tables, their
 * columns and indexes, and their rows.
 */
class SourceReader
{
public:
    virtual ~SourceReader() = default;

    //! Names of the user tables. The order is stable for the
    //! lifetime of the reader and is the order tables are exported.
    virtual std::vector<std::string> getTableNames() const = 0;

    //! Column and index metadata for one table.
    //! Throws SchemaError if there is no such table.
    virtual Table getTable(const std::string & table_name) const = 0;

    //! Start reading the rows of a table from the beginning.
    virtual std::unique_ptr<RowCursor> openRows(const Table & table) const = 0;
};

} // namespace mdb2sqlite
