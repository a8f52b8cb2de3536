// <SchemaTranslator> -*- C++ -*-

#include "mdb2sqlite/schema/SchemaTranslator.hpp"
#include "mdb2sqlite/schema/TypeMapper.hpp"
#include "mdb2sqlite/utils/StringUtils.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <sstream>

namespace mdb2sqlite {

std::string escapeIdentifier(const std::string & identifier)
{
    return "'" + utils::copyWithReplace(identifier, '\'', "''") + "'";
}

std::string getDerivedIndexName(const Table & table, const Index & index)
{
    return table.name + "_" + index.name;
}

namespace {

//Build the column list of a CREATE TABLE statement, for example:
//    'First' TEXT, 'Last' TEXT, 'Age' INTEGER
std::string getColumnsSqlCommand(const Table & table)
{
    std::vector<std::string> col_defs;
    col_defs.reserve(table.columns.size());

    for (const auto & column : table.columns) {
        const auto category = tryMapSourceType(column.type);
        if (!category.isValid()) {
            throw UnsupportedTypeError("Unsupported column type: ")
                << column.type << " (table '" << table.name
                << "', column '" << column.name << "')";
        }

        std::ostringstream oss;
        oss << escapeIdentifier(column.name) << " " << category.getValue();
        col_defs.emplace_back(oss.str());
    }

    return utils::joinCommaSeparated(col_defs);
}

//Build one CREATE INDEX statement, for example:
//    CREATE UNIQUE INDEX 'Customers_ByName' ON 'Customers'('Last', 'First')
std::string getCreateIndexSqlCommand(const Table & table, const Index & index)
{
    std::vector<std::string> col_names;
    col_names.reserve(index.column_names.size());

    for (const auto & col_name : index.column_names) {
        if (table.findColumn(col_name) == nullptr) {
            throw SchemaError("Index '") << index.name << "' on table '"
                << table.name << "' refers to unknown column '"
                << col_name << "'";
        }
        col_names.emplace_back(escapeIdentifier(col_name));
    }

    std::ostringstream oss;
    oss << "CREATE " << (index.unique ? "UNIQUE " : "") << "INDEX "
        << escapeIdentifier(getDerivedIndexName(table, index))
        << " ON " << escapeIdentifier(table.name)
        << "(" << utils::joinCommaSeparated(col_names) << ")";
    return oss.str();
}

} // namespace

TableDDL translateTable(const Table & table)
{
    TableDDL ddl;
    ddl.table_name = table.name;

    std::ostringstream oss;
    oss << "CREATE TABLE " << escapeIdentifier(table.name)
        << " (" << getColumnsSqlCommand(table) << ")";
    ddl.create_table = oss.str();

    for (const auto & index : table.indexes) {
        ddl.create_indexes.emplace_back(getCreateIndexSqlCommand(table, index));
    }

    return ddl;
}

std::vector<TableDDL> translateSchema(const std::vector<Table> & tables)
{
    std::vector<TableDDL> schema_ddl;
    schema_ddl.reserve(tables.size());

    for (const auto & table : tables) {
        schema_ddl.emplace_back(translateTable(table));
    }

    return schema_ddl;
}

} // namespace mdb2sqlite
