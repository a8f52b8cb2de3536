// <DataMigrator> -*- C++ -*-

#pragma once

#include "mdb2sqlite/source/SourceReader.hpp"
#include "mdb2sqlite/dest/DestinationStore.hpp"
#include "mdb2sqlite/log/MessageSource.hpp"

#include <cstdint>

namespace mdb2sqlite {

/*!
 * \brief Copies the rows of source tables into destination tables
 * that have already been created.
 */
class DataMigrator
{
public:
    //! \param progress_interval Log an "info" message every this many
    //! rows of a table. Zero turns progress messages off.
    DataMigrator(const SourceReader & source,
                 DestinationStore & dest,
                 const uint64_t progress_interval);

    /*!
     * \brief Copy every row of one table, in one transaction.
     *
     * Rows are streamed from the source one at a time, converted
     * and inserted by position. If anything fails, the table's
     * transaction is rolled back and the exception propagates, so
     * the destination table is left empty.
     *
     * \return Number of rows copied
     */
    uint64_t migrateTable(const Table & table);

private:
    const SourceReader & source_;
    DestinationStore & dest_;
    const uint64_t progress_interval_;

    log::MessageSource info_;
    log::MessageSource debug_;
};

} // namespace mdb2sqlite
