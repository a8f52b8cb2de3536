// <MdbSourceReader> -*- C++ -*-

#ifndef __MDB2SQLITE_MDB_SOURCE_READER_H__
#define __MDB2SQLITE_MDB_SOURCE_READER_H__

#include "mdb2sqlite/source/SourceReader.hpp"

#include <memory>

namespace mdb2sqlite {

class MdbRowCursor;

/*!
 * \brief SourceReader for Access .mdb / .accdb files, backed
 * by libmdb (mdbtools).
 *
 * Values come back from libmdb as text and are parsed into
 * typed FieldValues (see MdbTranslation.hpp):
 *
 *   BOOL                       -> BOOLEAN
 *   BYTE, INT, LONGINT         -> INTEGER
 *   FLOAT, DOUBLE              -> REAL
 *   MONEY, NUMERIC             -> DECIMAL (exact digits)
 *   TEXT, MEMO, REPID, DATETIME -> TEXT
 *   BINARY, OLE                -> BLOB
 *
 * NULL is taken from each row's null mask, so a zero-length
 * TEXT or MEMO value reads back as an empty string.
 */
class MdbSourceReader : public SourceReader
{
public:
    //! Open a source database read-only.
    //! \throw OpenError if the file cannot be read or is not an
    //! Access database.
    MdbSourceReader(const std::string & mdb_file,
                    const SourceOptions & options = SourceOptions());

    ~MdbSourceReader() override;

    std::vector<std::string> getTableNames() const override;

    Table getTable(const std::string & table_name) const override;

    std::unique_ptr<RowCursor> openRows(const Table & table) const override;

    //! Factory with the signature the Exporter expects
    static std::unique_ptr<SourceReader> open(const std::string & mdb_file,
                                              const SourceOptions & options);

private:
    //! Cursors share ownership of the open database
    friend class MdbRowCursor;

    //! Rest of the implementation is hidden from view.
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace mdb2sqlite

#endif
