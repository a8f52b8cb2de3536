// <TypeMapper> -*- C++ -*-

#pragma once

#include "mdb2sqlite/schema/SourceTypes.hpp"
#include "mdb2sqlite/schema/StorageCategory.hpp"
#include "mdb2sqlite/utils/ValidValue.hpp"

namespace mdb2sqlite {

/*!
 * \brief Resolve the storage category a source column is
 * declared with in the destination schema.
 *
 *   BINARY, OLE                                 -> BLOB
 *   BOOLEAN, BYTE, INT, LONG                    -> INTEGER
 *   DOUBLE, FLOAT, NUMERIC                      -> REAL
 *   TEXT, GUID, MEMO, MONEY, SHORT_DATE_TIME    -> TEXT
 *
 * \throw UnsupportedTypeError for any other tag. The message
 * names the tag.
 */
StorageCategory mapSourceType(const SourceType type);

/*!
 * \brief Same mapping as mapSourceType(), but returns an
 * invalid value instead of throwing for unmapped tags.
 */
utils::ValidValue<StorageCategory> tryMapSourceType(const SourceType type);

} // namespace mdb2sqlite
