// <Exporter> -*- C++ -*-

#ifndef __MDB2SQLITE_EXPORTER_H__
#define __MDB2SQLITE_EXPORTER_H__

#include "mdb2sqlite/app/ExportConfig.hpp"
#include "mdb2sqlite/source/SourceReader.hpp"
#include "mdb2sqlite/log/MessageSource.hpp"

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mdb2sqlite {

//! What an export got done. After a failure this tells which
//! tables were completed before the error.
struct ExportSummary {
    //! Tables whose CREATE TABLE / CREATE INDEX statements were
    //! committed, in export order
    std::vector<std::string> tables_created;

    //! Tables whose rows were all committed, with their row counts
    std::vector<std::pair<std::string, uint64_t>> tables_populated;

    //! Wall-clock seconds spent in the export
    double elapsed_seconds = 0;

    //! True once every table was created and populated
    bool completed = false;

    uint64_t getTotalRows() const {
        uint64_t total = 0;
        for (const auto & table : tables_populated) {
            total += table.second;
        }
        return total;
    }
};

std::ostream & operator<<(std::ostream & os, const ExportSummary & summary);

/*!
 * \brief Runs a complete export of a source database into a new
 * SQLite file:
 *
 *   1. open the source (read only)
 *   2. open the destination, which must be empty
 *   3. turn on space reclaiming (auto_vacuum)
 *   4. create every table and its indexes, one transaction per table
 *   5. copy every table's rows, one transaction per table
 *
 * Nothing is retried. The first error stops the export and is
 * rethrown to the caller. Tables finished before the error stay
 * in the destination.
 */
class Exporter
{
public:
    //! Opens a source database
    typedef std::function<std::unique_ptr<SourceReader>(
        const std::string &, const SourceOptions &)> SourceFactory;

    //! Export from Access files using libmdb
    explicit Exporter(const ExportConfig & config);

    //! Export from whatever 'source_factory' opens
    Exporter(const ExportConfig & config, SourceFactory source_factory);

    //! Export the source database at 'source_path' into a new
    //! SQLite database at 'dest_path'.
    //! \throw OpenError, UnsupportedTypeError, SchemaError,
    //! DestinationError or ConversionError
    void run(const std::string & source_path, const std::string & dest_path);

    //! Summary of the last run(), complete or not
    const ExportSummary & getSummary() const {
        return summary_;
    }

private:
    void run_(const std::string & source_path, const std::string & dest_path);

    const ExportConfig config_;
    SourceFactory source_factory_;
    ExportSummary summary_;

    log::MessageSource info_;
};

} // namespace mdb2sqlite

#endif
