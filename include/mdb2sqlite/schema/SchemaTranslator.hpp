// <SchemaTranslator> -*- C++ -*-

#pragma once

#include "mdb2sqlite/schema/Schema.hpp"

#include <string>
#include <vector>

namespace mdb2sqlite {

/*!
 * \brief Quote an identifier for use in a SQL statement.
 * The name is wrapped in single quotes and any embedded
 * single quote is doubled:
 *
 *   plain  ->  'plain'
 *   a'b    ->  'a''b'
 */
std::string escapeIdentifier(const std::string & identifier);

//! Name given to a source index in the destination. This is
//! "<table>_<index>" and must be unique across the whole
//! destination schema.
std::string getDerivedIndexName(const Table & table, const Index & index);

//! Statements which recreate one source table in the destination
struct TableDDL {
    std::string table_name;
    std::string create_table;
    std::vector<std::string> create_indexes;
};

/*!
 * \brief Build the CREATE TABLE statement and one CREATE INDEX
 * statement per index:
 *
 *   CREATE TABLE 'T' ('c1' INTEGER, 'c2' TEXT)
 *   CREATE UNIQUE INDEX 'T_idx' ON 'T'('c1')
 *
 * \throw UnsupportedTypeError if a column type has no storage
 * category, SchemaError if an index refers to a column the
 * table does not have.
 */
TableDDL translateTable(const Table & table);

/*!
 * \brief Translate every table, in order. Nothing is returned
 * unless every table translates, so a caller never executes
 * DDL for part of a schema that cannot be exported.
 */
std::vector<TableDDL> translateSchema(const std::vector<Table> & tables);

} // namespace mdb2sqlite
