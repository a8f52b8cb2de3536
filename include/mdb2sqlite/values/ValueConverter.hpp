// <ValueConverter> -*- C++ -*-

#pragma once

#include "mdb2sqlite/schema/Schema.hpp"
#include "mdb2sqlite/values/Row.hpp"

#include <string>

namespace mdb2sqlite {

/*!
 * \brief Turn a source value into the value bound to the
 * destination INSERT statement for the given column.
 *
 *   - NULL stays NULL, whatever the column type
 *   - MONEY columns become TEXT ("12.50")
 *   - BOOLEAN columns become INTEGER 1 / 0
 *   - anything else passes through unchanged
 *
 * \throw ConversionError naming the table, column and type
 * when the value cannot be represented.
 */
OptionalValue convertValue(const std::string & table_name,
                           const Column & column,
                           const OptionalValue & value);

/*!
 * \brief Convert every value of a row, in column order. The
 * result is the ordered INSERT parameter list.
 *
 * \throw ConversionError if the row does not have one value
 * per column, or if any value fails to convert.
 */
Row convertRow(const Table & table, const Row & row);

} // namespace mdb2sqlite
