// <SourceTypes> -*- C++ -*-

#pragma once

#include <cstdint>
#include <ostream>

namespace mdb2sqlite {

//! Column data types reported by an Access / Jet database.
//! The last group of tags can show up in a source file but
//! have no storage category in the destination.
enum class SourceType : int8_t {
    BOOLEAN,
    BYTE,
    INT,
    LONG,
    MONEY,
    FLOAT,
    DOUBLE,
    SHORT_DATE_TIME,
    BINARY,
    TEXT,
    OLE,
    MEMO,
    GUID,
    NUMERIC,

    UNKNOWN_0D,
    UNKNOWN_11,
    COMPLEX_TYPE,
    BIG_INT,
    EXT_DATE_TIME,
    UNSUPPORTED_FIXEDLEN,
    UNSUPPORTED_VARLEN
};

//! Every tag, in declaration order
static constexpr SourceType ALL_SOURCE_TYPES[] = {
    SourceType::BOOLEAN,
    SourceType::BYTE,
    SourceType::INT,
    SourceType::LONG,
    SourceType::MONEY,
    SourceType::FLOAT,
    SourceType::DOUBLE,
    SourceType::SHORT_DATE_TIME,
    SourceType::BINARY,
    SourceType::TEXT,
    SourceType::OLE,
    SourceType::MEMO,
    SourceType::GUID,
    SourceType::NUMERIC,
    SourceType::UNKNOWN_0D,
    SourceType::UNKNOWN_11,
    SourceType::COMPLEX_TYPE,
    SourceType::BIG_INT,
    SourceType::EXT_DATE_TIME,
    SourceType::UNSUPPORTED_FIXEDLEN,
    SourceType::UNSUPPORTED_VARLEN
};

inline std::ostream & operator<<(std::ostream & os, const SourceType type)
{
    using st = SourceType;

    switch (type) {
        case st::BOOLEAN:              os << "BOOLEAN"; break;
        case st::BYTE:                 os << "BYTE"; break;
        case st::INT:                  os << "INT"; break;
        case st::LONG:                 os << "LONG"; break;
        case st::MONEY:                os << "MONEY"; break;
        case st::FLOAT:                os << "FLOAT"; break;
        case st::DOUBLE:               os << "DOUBLE"; break;
        case st::SHORT_DATE_TIME:      os << "SHORT_DATE_TIME"; break;
        case st::BINARY:               os << "BINARY"; break;
        case st::TEXT:                 os << "TEXT"; break;
        case st::OLE:                  os << "OLE"; break;
        case st::MEMO:                 os << "MEMO"; break;
        case st::GUID:                 os << "GUID"; break;
        case st::NUMERIC:              os << "NUMERIC"; break;
        case st::UNKNOWN_0D:           os << "UNKNOWN_0D"; break;
        case st::UNKNOWN_11:           os << "UNKNOWN_11"; break;
        case st::COMPLEX_TYPE:         os << "COMPLEX_TYPE"; break;
        case st::BIG_INT:              os << "BIG_INT"; break;
        case st::EXT_DATE_TIME:        os << "EXT_DATE_TIME"; break;
        case st::UNSUPPORTED_FIXEDLEN: os << "UNSUPPORTED_FIXEDLEN"; break;
        case st::UNSUPPORTED_VARLEN:   os << "UNSUPPORTED_VARLEN"; break;
    }

    return os;
}

} // namespace mdb2sqlite
