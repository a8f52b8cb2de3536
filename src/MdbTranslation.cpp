// <MdbTranslation> -*- C++ -*-

#include "mdb2sqlite/source/MdbTranslation.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <boost/lexical_cast.hpp>

namespace mdb2sqlite {
namespace mdb {

std::vector<std::string> selectTableNames(const std::vector<CatalogEntry> & catalog,
                                          const SourceOptions & options)
{
    std::vector<std::string> table_names;
    for (const auto & entry : catalog) {
        if (!entry.is_table) {
            continue;
        }
        if (entry.is_system && !options.include_system_tables) {
            continue;
        }
        table_names.emplace_back(entry.name);
    }
    return table_names;
}

utils::ValidValue<Index> translateIndex(const Table & table, const IndexDef & def)
{
    if (def.index_type == static_cast<unsigned char>(IndexType::FOREIGN_KEY)) {
        return utils::ValidValue<Index>();
    }

    Index index;
    index.name = def.name;
    index.unique = def.unique_flag ||
        def.index_type == static_cast<unsigned char>(IndexType::PRIMARY_KEY);

    for (const int col_num : def.key_col_nums) {
        if (col_num < 1 || col_num > static_cast<int>(table.columns.size())) {
            throw SchemaError("Index '") << def.name << "' on table '"
                << table.name << "' refers to column number " << col_num
                << ", but the table has " << table.columns.size() << " columns";
        }
        index.column_names.emplace_back(table.columns[col_num - 1].name);
    }

    return index;
}

OptionalValue parseFieldText(const std::string & table_name,
                             const Column & col,
                             const bool is_null,
                             const std::string & text,
                             const uint64_t row_num)
{
    if (col.type == SourceType::BOOLEAN) {
        if (text == "1") {
            return FieldValue::fromBoolean(true);
        }
        if (text == "0") {
            return FieldValue::fromBoolean(false);
        }
        throw ConversionError("Unable to parse '") << text
            << "' as a value of type " << col.type << " (table '"
            << table_name << "', column '" << col.name
            << "', row " << row_num << ")";
    }

    if (is_null) {
        return OptionalValue();
    }

    try {
        switch (col.type) {
            case SourceType::BYTE:
            case SourceType::INT:
            case SourceType::LONG:
                return FieldValue::fromInteger(boost::lexical_cast<int64_t>(text));

            case SourceType::FLOAT:
            case SourceType::DOUBLE:
                return FieldValue::fromReal(boost::lexical_cast<double>(text));

            case SourceType::MONEY:
            case SourceType::NUMERIC:
                return FieldValue::fromDecimal(text);

            case SourceType::TEXT:
            case SourceType::MEMO:
            case SourceType::GUID:
            case SourceType::SHORT_DATE_TIME:
                return FieldValue::fromText(text);

            default:
                break;
        }
    } catch (const boost::bad_lexical_cast &) {
        throw ConversionError("Unable to parse '") << text
            << "' as a value of type " << col.type << " (table '"
            << table_name << "', column '" << col.name
            << "', row " << row_num << ")";
    }

    throw ConversionError("Cannot read values of type ") << col.type
        << " as text (table '" << table_name << "', column '" << col.name << "')";
}

} // namespace mdb
} // namespace mdb2sqlite
