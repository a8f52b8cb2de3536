// <DataMigrator> -*- C++ -*-

#include "mdb2sqlite/migrate/DataMigrator.hpp"
#include "mdb2sqlite/values/ValueConverter.hpp"
#include "mdb2sqlite/dest/TransactionUtils.hpp"

namespace mdb2sqlite {

DataMigrator::DataMigrator(const SourceReader & source,
                           DestinationStore & dest,
                           const uint64_t progress_interval) :
    source_(source),
    dest_(dest),
    progress_interval_(progress_interval),
    info_("export.populate", log::categories::INFO_STR),
    debug_("export.populate", log::categories::DEBUG_STR)
{
}

uint64_t DataMigrator::migrateTable(const Table & table)
{
    ScopedTransaction transaction(dest_);

    std::unique_ptr<RowCursor> cursor = source_.openRows(table);

    Row row;
    uint64_t num_rows = 0;

    while (cursor->next(row)) {
        const Row params = convertRow(table, row);
        dest_.insert(table.name, params);
        ++num_rows;

        if (progress_interval_ && num_rows % progress_interval_ == 0 && info_) {
            info_ << "Table '" << table.name << "': " << num_rows << " rows copied";
        }
    }

    transaction.commit();

    if (debug_) {
        debug_ << "Committed " << num_rows << " rows into '" << table.name << "'";
    }
    return num_rows;
}

} // namespace mdb2sqlite
