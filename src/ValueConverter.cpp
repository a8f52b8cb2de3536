// <ValueConverter> -*- C++ -*-

#include "mdb2sqlite/values/ValueConverter.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <boost/algorithm/string/case_conv.hpp>

namespace mdb2sqlite {

namespace {

//! Throw a ConversionError carrying the table / column / type context
[[noreturn]] void throwConversionError(const std::string & table_name,
                                       const Column & column,
                                       const FieldValue & value,
                                       const std::string & reason)
{
    throw ConversionError("Cannot convert value ") << value
        << " (" << value.getKind() << ") for table '" << table_name
        << "', column '" << column.name << "' of type " << column.type
        << ": " << reason;
}

//! Currency goes to the destination as text, never as a number
FieldValue convertMoney(const std::string & table_name,
                        const Column & column,
                        const FieldValue & value)
{
    switch (value.getKind()) {
        case FieldKind::DECIMAL:
            return FieldValue::fromText(value.getDecimal());
        case FieldKind::INTEGER:
        case FieldKind::REAL:
        case FieldKind::TEXT:
            return FieldValue::fromText(value.toString());
        case FieldKind::BOOLEAN:
        case FieldKind::BLOB:
            break;
    }
    throwConversionError(table_name, column, value, "not a currency amount");
}

//! SQLite has no boolean type. Store 1 / 0.
FieldValue convertBoolean(const std::string & table_name,
                          const Column & column,
                          const FieldValue & value)
{
    switch (value.getKind()) {
        case FieldKind::BOOLEAN:
            return FieldValue::fromInteger(value.getBoolean() ? 1 : 0);
        case FieldKind::INTEGER:
            return FieldValue::fromInteger(value.getInteger() != 0 ? 1 : 0);
        case FieldKind::TEXT: {
            const std::string text = boost::algorithm::to_lower_copy(value.getText());
            if (text == "1" || text == "true") {
                return FieldValue::fromInteger(1);
            }
            if (text == "0" || text == "false") {
                return FieldValue::fromInteger(0);
            }
            break;
        }
        case FieldKind::REAL:
        case FieldKind::DECIMAL:
        case FieldKind::BLOB:
            break;
    }
    throwConversionError(table_name, column, value, "not a boolean");
}

} // namespace

OptionalValue convertValue(const std::string & table_name,
                           const Column & column,
                           const OptionalValue & value)
{
    //NULL bypasses every type-specific rule
    if (!value.isValid()) {
        return OptionalValue();
    }

    switch (column.type) {
        case SourceType::MONEY:
            return convertMoney(table_name, column, value.getValue());
        case SourceType::BOOLEAN:
            return convertBoolean(table_name, column, value.getValue());
        default:
            break;
    }

    return value;
}

Row convertRow(const Table & table, const Row & row)
{
    if (row.size() != table.columns.size()) {
        throw ConversionError("Row of table '") << table.name << "' has "
            << row.size() << " values, but the table has "
            << table.columns.size() << " columns";
    }

    Row params;
    params.reserve(row.size());

    for (size_t idx = 0; idx < row.size(); ++idx) {
        params.emplace_back(convertValue(table.name, table.columns[idx], row[idx]));
    }

    return params;
}

} // namespace mdb2sqlite
