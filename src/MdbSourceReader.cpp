// <MdbSourceReader> -*- C++ -*-

#include "mdb2sqlite/source/MdbSourceReader.hpp"
#include "mdb2sqlite/source/MdbTranslation.hpp"
#include "mdb2sqlite/log/MessageSource.hpp"
#include "mdb2sqlite/Errors.hpp"

//libmdb-specific headers
#include <mdbtools.h>

//Standard headers
#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace mdb2sqlite {

namespace {

//! Size of the buffer libmdb copies each bound column value into.
//! MEMO values longer than this are truncated by libmdb.
static constexpr size_t MDB_BIND_BUFFER_SIZE = 256 * 1024;

//! Type codes which libmdb does not name
static constexpr int MDB_UNKNOWN_0D_CODE = 0x0d;
static constexpr int MDB_UNKNOWN_11_CODE = 0x11;
static constexpr int MDB_BIG_INT_CODE = 0x13;
static constexpr int MDB_EXT_DATETIME_CODE = 0x14;

//! Translate a libmdb column type code into our tag
SourceType getSourceType(const MdbColumn * col)
{
    switch (col->col_type) {
        case MDB_BOOL:     return SourceType::BOOLEAN;
        case MDB_BYTE:     return SourceType::BYTE;
        case MDB_INT:      return SourceType::INT;
        case MDB_LONGINT:  return SourceType::LONG;
        case MDB_MONEY:    return SourceType::MONEY;
        case MDB_FLOAT:    return SourceType::FLOAT;
        case MDB_DOUBLE:   return SourceType::DOUBLE;
        case MDB_DATETIME: return SourceType::SHORT_DATE_TIME;
        case MDB_BINARY:   return SourceType::BINARY;
        case MDB_TEXT:     return SourceType::TEXT;
        case MDB_OLE:      return SourceType::OLE;
        case MDB_MEMO:     return SourceType::MEMO;
        case MDB_REPID:    return SourceType::GUID;
        case MDB_NUMERIC:  return SourceType::NUMERIC;
        case MDB_COMPLEX:  return SourceType::COMPLEX_TYPE;
        case MDB_UNKNOWN_0D_CODE:   return SourceType::UNKNOWN_0D;
        case MDB_UNKNOWN_11_CODE:   return SourceType::UNKNOWN_11;
        case MDB_BIG_INT_CODE:      return SourceType::BIG_INT;
        case MDB_EXT_DATETIME_CODE: return SourceType::EXT_DATE_TIME;
        default:
            break;
    }

    return col->is_fixed ? SourceType::UNSUPPORTED_FIXEDLEN
                         : SourceType::UNSUPPORTED_VARLEN;
}

//! Scoped object which frees a libmdb table definition
struct TableDefDeleter {
    void operator()(MdbTableDef * table) const {
        if (table) {
            mdb_free_tabledef(table);
        }
    }
};

using TableDefPtr = std::unique_ptr<MdbTableDef, TableDefDeleter>;

} // namespace

//! Implementation class for the Access database connection.
class MdbSourceReader::Impl
{
public:
    Impl(const std::string & mdb_file, const SourceOptions & options) :
        mdb_file_(mdb_file),
        options_(options)
    {
        //libmdb prints to stderr and returns null for a file it
        //cannot make sense of. Check readability first so the
        //error says which of the two went wrong.
        std::ifstream fin(mdb_file);
        if (!fin) {
            throw OpenError("Unable to read source database file: ") << mdb_file;
        }
        fin.close();

        mdb_ = mdb_open(mdb_file.c_str(), MDB_NOFLAGS);
        if (mdb_ == nullptr) {
            throw OpenError("Not an Access database file: ") << mdb_file;
        }

        mdb_set_bind_size(mdb_, MDB_BIND_BUFFER_SIZE);
        mdb_set_date_fmt(mdb_, options_.date_format.c_str());

        if (!mdb_read_catalog(mdb_, MDB_TABLE)) {
            mdb_close(mdb_);
            mdb_ = nullptr;
            throw OpenError("Unable to read the table catalog of: ") << mdb_file;
        }

        if (debug_) {
            debug_ << "Opened '" << mdb_file << "' with "
                   << mdb_->num_catalog << " catalog entries";
        }
    }

    ~Impl()
    {
        if (mdb_) {
            mdb_close(mdb_);
        }
    }

    std::vector<std::string> getTableNames() const
    {
        std::vector<mdb::CatalogEntry> catalog;
        for (unsigned int idx = 0; idx < mdb_->num_catalog; ++idx) {
            MdbCatalogEntry * entry = static_cast<MdbCatalogEntry*>(
                g_ptr_array_index(mdb_->catalog, idx));

            mdb::CatalogEntry catalog_entry;
            catalog_entry.name = entry->object_name;
            catalog_entry.is_table = entry->object_type == MDB_TABLE;
            catalog_entry.is_system = mdb_is_system_table(entry);
            catalog.emplace_back(std::move(catalog_entry));
        }

        return mdb::selectTableNames(catalog, options_);
    }

    //! Find a table by name and read its columns and indexes
    TableDefPtr readTableDef(const std::string & table_name) const
    {
        TableDefPtr table(mdb_read_table_by_name(
            mdb_, const_cast<gchar*>(table_name.c_str()), MDB_TABLE));

        if (!table) {
            throw SchemaError("Source database '") << mdb_file_
                << "' has no table named '" << table_name << "'";
        }

        if (!mdb_read_columns(table.get())) {
            throw SchemaError("Unable to read the columns of table '")
                << table_name << "'";
        }
        mdb_read_indices(table.get());
        return table;
    }

    Table getTable(const std::string & table_name) const
    {
        TableDefPtr table_def = readTableDef(table_name);

        Table table;
        table.name = table_name;

        for (unsigned int idx = 0; idx < table_def->num_cols; ++idx) {
            const MdbColumn * col = static_cast<const MdbColumn*>(
                g_ptr_array_index(table_def->columns, idx));
            table.columns.emplace_back(Column{col->name, getSourceType(col)});
        }

        for (unsigned int idx = 0; idx < table_def->num_idxs; ++idx) {
            const MdbIndex * mdb_idx = static_cast<const MdbIndex*>(
                g_ptr_array_index(table_def->indices, idx));

            mdb::IndexDef def;
            def.name = mdb_idx->name;
            def.index_type = mdb_idx->index_type;
            def.unique_flag = (mdb_idx->flags & MDB_IDX_UNIQUE) != 0;
            def.key_col_nums.assign(mdb_idx->key_col_num,
                                    mdb_idx->key_col_num + mdb_idx->num_keys);

            utils::ValidValue<Index> index = mdb::translateIndex(table, def);
            if (!index.isValid()) {
                if (debug_) {
                    debug_ << "Skipping relationship index '" << def.name
                           << "' on table '" << table_name << "'";
                }
                continue;
            }
            table.indexes.emplace_back(std::move(index.getValue()));
        }

        return table;
    }

    MdbHandle * getHandle() const
    {
        return mdb_;
    }

private:
    const std::string mdb_file_;
    const SourceOptions options_;
    MdbHandle * mdb_ = nullptr;

    log::MessageSource debug_{"source.mdb", log::categories::DEBUG_STR};
};

//! Row cursor over a libmdb table. Every column is bound to a
//! text buffer and libmdb fills the buffers on each fetch.
//!
//! The bound length is 0 for both NULL and zero-length values,
//! so nullness is read from the row's null mask instead.
class MdbRowCursor : public RowCursor
{
public:
    MdbRowCursor(std::shared_ptr<MdbSourceReader::Impl> reader,
                 TableDefPtr table_def,
                 const Table & table) :
        reader_(reader),
        table_def_(std::move(table_def)),
        table_(table),
        bound_values_(table_def_->num_cols),
        bound_lens_(table_def_->num_cols, 0),
        fields_(table_def_->num_cols),
        is_null_(table_def_->num_cols, true)
    {
        for (unsigned int idx = 0; idx < table_def_->num_cols; ++idx) {
            bound_values_[idx].resize(MDB_BIND_BUFFER_SIZE + 1, '\0');
            //Column numbers are 1-based
            mdb_bind_column(table_def_.get(), idx + 1,
                            &bound_values_[idx][0], &bound_lens_[idx]);
        }
        mdb_rewind_table(table_def_.get());
    }

    bool next(Row & row) override
    {
        if (!mdb_fetch_row(table_def_.get())) {
            return false;
        }

        readNullMask_();

        row.clear();
        row.reserve(table_.columns.size());

        for (unsigned int idx = 0; idx < table_def_->num_cols; ++idx) {
            MdbColumn * col = static_cast<MdbColumn*>(
                g_ptr_array_index(table_def_->columns, idx));
            row.emplace_back(readValue_(col, idx));
        }

        ++rows_read_;
        return true;
    }

private:
    //! Columns a row does not store (added to the table after the
    //! row was written) are NULL
    void readNullMask_()
    {
        MdbHandle * mdb = reader_->getHandle();

        //The fetch has already moved past the row it read
        int row_start = 0;
        size_t row_size = 0;
        if (mdb_find_row(mdb, table_def_->cur_row - 1, &row_start, &row_size) != 0) {
            throw ConversionError("Unable to locate row ") << rows_read_ + 1
                << " of table '" << table_.name << "'";
        }

        std::fill(is_null_.begin(), is_null_.end(), true);
        const int num_fields = mdb_crack_row(table_def_.get(), row_start, row_size, fields_.data());
        for (int idx = 0; idx < num_fields; ++idx) {
            const int col_idx = fields_[idx].colnum;
            if (col_idx >= 0 && col_idx < static_cast<int>(is_null_.size())) {
                is_null_[col_idx] = fields_[idx].is_null != 0;
            }
        }
    }

    OptionalValue readValue_(MdbColumn * col, const unsigned int idx) const
    {
        const Column & column = table_.columns[idx];

        switch (column.type) {
            case SourceType::OLE:
                if (is_null_[idx]) {
                    return OptionalValue();
                }
                return readOle_(col);

            case SourceType::BINARY:
                if (is_null_[idx]) {
                    return OptionalValue();
                }
                return readBinary_(col);

            default:
                break;
        }

        return mdb::parseFieldText(table_.name, column, is_null_[idx],
                                   std::string(&bound_values_[idx][0], bound_lens_[idx]),
                                   rows_read_ + 1);
    }

    FieldValue readOle_(MdbColumn * col) const
    {
        size_t size = 0;
        void * data = mdb_ole_read_full(reader_->getHandle(), col, &size);
        if (data == nullptr) {
            throw ConversionError("Unable to read OLE value (table '")
                << table_.name << "', column '" << col->name
                << "', row " << rows_read_ + 1 << ")";
        }

        const uint8_t * bytes = static_cast<const uint8_t*>(data);
        std::vector<uint8_t> blob(bytes, bytes + size);
        free(data);
        return FieldValue::fromBlob(std::move(blob));
    }

    //! Fixed binary values are taken from the current row page,
    //! where libmdb left them during the fetch
    FieldValue readBinary_(MdbColumn * col) const
    {
        const MdbHandle * mdb = reader_->getHandle();
        const uint8_t * start = reinterpret_cast<const uint8_t*>(mdb->pg_buf) + col->cur_value_start;
        return FieldValue::fromBlob(std::vector<uint8_t>(start, start + col->cur_value_len));
    }

    std::shared_ptr<MdbSourceReader::Impl> reader_;
    TableDefPtr table_def_;
    const Table table_;
    std::vector<std::vector<char>> bound_values_;
    std::vector<int> bound_lens_;
    std::vector<MdbField> fields_;
    std::vector<bool> is_null_;
    uint64_t rows_read_ = 0;
};

MdbSourceReader::MdbSourceReader(const std::string & mdb_file,
                                 const SourceOptions & options) :
    impl_(new MdbSourceReader::Impl(mdb_file, options))
{
}

MdbSourceReader::~MdbSourceReader()
{
}

std::vector<std::string> MdbSourceReader::getTableNames() const
{
    return impl_->getTableNames();
}

Table MdbSourceReader::getTable(const std::string & table_name) const
{
    return impl_->getTable(table_name);
}

std::unique_ptr<RowCursor> MdbSourceReader::openRows(const Table & table) const
{
    TableDefPtr table_def = impl_->readTableDef(table.name);
    if (table_def->num_cols != table.columns.size()) {
        throw SchemaError("Table '") << table.name << "' has "
            << table_def->num_cols << " columns in the source, expected "
            << table.columns.size();
    }
    return std::unique_ptr<RowCursor>(
        new MdbRowCursor(impl_, std::move(table_def), table));
}

std::unique_ptr<SourceReader> MdbSourceReader::open(const std::string & mdb_file,
                                                    const SourceOptions & options)
{
    return std::unique_ptr<SourceReader>(new MdbSourceReader(mdb_file, options));
}

} // namespace mdb2sqlite
