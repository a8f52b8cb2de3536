// <Exporter> -*- C++ -*-

#include "mdb2sqlite/migrate/Exporter.hpp"
#include "mdb2sqlite/migrate/DataMigrator.hpp"
#include "mdb2sqlite/schema/SchemaTranslator.hpp"
#include "mdb2sqlite/source/MdbSourceReader.hpp"
#include "mdb2sqlite/dest/SQLiteDestination.hpp"
#include "mdb2sqlite/dest/TransactionUtils.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <boost/timer/timer.hpp>

#include <iomanip>

namespace mdb2sqlite {

std::ostream & operator<<(std::ostream & os, const ExportSummary & summary)
{
    std::ios::fmtflags f = os.flags();
    const char fill = os.fill();
    const std::streamsize precision = os.precision();

    os << (summary.completed ? "Export complete" : "Export incomplete") << ": "
       << summary.tables_created.size() << " tables created, "
       << summary.tables_populated.size() << " tables populated, "
       << summary.getTotalRows() << " rows in "
       << std::fixed << std::setprecision(2) << summary.elapsed_seconds << "s\n";
    os.flags(f);
    os.precision(precision);

    for (const auto & table : summary.tables_populated) {
        os << "  " << std::left << std::setfill(' ') << std::setw(32) << table.first
           << std::right << table.second << " rows\n";
    }

    os.flags(f);
    os.fill(fill);
    return os;
}

Exporter::Exporter(const ExportConfig & config) :
    Exporter(config, &MdbSourceReader::open)
{
}

Exporter::Exporter(const ExportConfig & config, SourceFactory source_factory) :
    config_(config),
    source_factory_(source_factory),
    info_("export", log::categories::INFO_STR)
{
}

void Exporter::run(const std::string & source_path, const std::string & dest_path)
{
    summary_ = ExportSummary();

    boost::timer::cpu_timer timer;

    //Record the elapsed time however we leave
    struct OnRunExit {
        OnRunExit(ExportSummary & summary, const boost::timer::cpu_timer & timer) :
            summary_(summary),
            timer_(timer)
        {}
        ~OnRunExit() {
            summary_.elapsed_seconds = timer_.elapsed().wall / 1e9;
        }
    private:
        ExportSummary & summary_;
        const boost::timer::cpu_timer & timer_;
    };

    OnRunExit scoped_exit(summary_, timer);
    (void) scoped_exit;

    run_(source_path, dest_path);
}

void Exporter::run_(const std::string & source_path, const std::string & dest_path)
{
    std::unique_ptr<SourceReader> source = source_factory_(source_path, config_.source);
    if (!source) {
        throw OpenError("Unable to open source database '") << source_path << "'";
    }

    SQLiteDestination dest(dest_path);
    dest.setSpaceReclaiming(true);

    if (info_) {
        info_ << "Exporting '" << source_path << "' to '" << dest_path << "'";
    }

    //Every table is translated before any DDL runs, so a type
    //we cannot map leaves the destination without any tables
    std::vector<Table> tables;
    for (const auto & table_name : source->getTableNames()) {
        tables.emplace_back(source->getTable(table_name));
    }
    const std::vector<TableDDL> schema_ddl = translateSchema(tables);

    for (const auto & table_ddl : schema_ddl) {
        ScopedTransaction transaction(dest);
        dest.executeDDL(table_ddl.create_table);
        for (const auto & create_index : table_ddl.create_indexes) {
            dest.executeDDL(create_index);
        }
        transaction.commit();

        summary_.tables_created.emplace_back(table_ddl.table_name);
        if (info_) {
            info_ << "Created table '" << table_ddl.table_name << "' with "
                  << table_ddl.create_indexes.size() << " indexes";
        }
    }

    DataMigrator migrator(*source, dest, config_.progress_interval);
    for (const auto & table : tables) {
        const uint64_t num_rows = migrator.migrateTable(table);
        summary_.tables_populated.emplace_back(table.name, num_rows);
        if (info_) {
            info_ << "Populated table '" << table.name << "' with " << num_rows << " rows";
        }
    }

    summary_.completed = true;
}

} // namespace mdb2sqlite
