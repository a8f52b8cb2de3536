// <MdbTranslation> -*- C++ -*-

#pragma once

#include "mdb2sqlite/source/SourceReader.hpp"
#include "mdb2sqlite/utils/ValidValue.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mdb2sqlite {
namespace mdb {

/*!
 * \brief Translation of what libmdb reports (catalog entries,
 * index definitions, bound field text) into the reader's
 * Table / Index / FieldValue model. Nothing in here calls
 * libmdb, so MdbSourceReader hands over plain copies of the
 * libmdb structures.
 */

//! Index types as Access stores them. A FOREIGN_KEY index is the
//! "reference" side of a relationship and is not a real index on
//! the table.
enum class IndexType : unsigned char {
    NORMAL = 0,
    PRIMARY_KEY = 1,
    FOREIGN_KEY = 2
};

//! One entry of the database catalog
struct CatalogEntry {
    std::string name;
    bool is_table = false;
    bool is_system = false;
};

//! One index definition. Key column numbers are 1-based, in the
//! index's declared order.
struct IndexDef {
    std::string name;
    unsigned char index_type = 0;
    bool unique_flag = false;
    std::vector<int> key_col_nums;
};

//! Names of the tables to export, in catalog order. System tables
//! are left out unless the options ask for them.
std::vector<std::string> selectTableNames(const std::vector<CatalogEntry> & catalog,
                                          const SourceOptions & options);

//! Translate an index of 'table'. Returns an invalid value for a
//! foreign key index. Primary keys are unique.
//! \throw SchemaError if a key column number is out of range
utils::ValidValue<Index> translateIndex(const Table & table, const IndexDef & def);

//! Parse the text libmdb binds for one field of a non-binary
//! column. 'is_null' comes from the row's null mask and is
//! ignored for BOOLEAN columns, whose value lives in that mask
//! and is rendered as "0" or "1".
//! \throw ConversionError if the text does not parse as the
//! column's type, or for BINARY / OLE columns
OptionalValue parseFieldText(const std::string & table_name,
                             const Column & col,
                             const bool is_null,
                             const std::string & text,
                             const uint64_t row_num);

} // namespace mdb
} // namespace mdb2sqlite
