// <TypeMapper> -*- C++ -*-

#include "mdb2sqlite/schema/TypeMapper.hpp"
#include "mdb2sqlite/Errors.hpp"

namespace mdb2sqlite {

utils::ValidValue<StorageCategory> tryMapSourceType(const SourceType type)
{
    using st = SourceType;
    using sc = StorageCategory;

    switch (type) {
        case st::BINARY:
        case st::OLE:
            return sc::BLOB;

        case st::BOOLEAN:
        case st::BYTE:
        case st::INT:
        case st::LONG:
            return sc::INTEGER;

        case st::DOUBLE:
        case st::FLOAT:
        case st::NUMERIC:
            return sc::REAL;

        case st::TEXT:
        case st::GUID:
        case st::MEMO:
        case st::MONEY:
        case st::SHORT_DATE_TIME:
            return sc::TEXT;

        case st::UNKNOWN_0D:
        case st::UNKNOWN_11:
        case st::COMPLEX_TYPE:
        case st::BIG_INT:
        case st::EXT_DATE_TIME:
        case st::UNSUPPORTED_FIXEDLEN:
        case st::UNSUPPORTED_VARLEN:
            break;
    }

    return utils::ValidValue<StorageCategory>();
}

StorageCategory mapSourceType(const SourceType type)
{
    const auto category = tryMapSourceType(type);
    if (!category.isValid()) {
        throw UnsupportedTypeError("Unsupported column type: ") << type;
    }
    return category.getValue();
}

} // namespace mdb2sqlite
