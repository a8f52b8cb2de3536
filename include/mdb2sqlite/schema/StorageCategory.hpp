// <StorageCategory> -*- C++ -*-

#pragma once

#include <cstdint>
#include <ostream>

namespace mdb2sqlite {

//! The column types SQLite understands in a CREATE TABLE
//! statement. Streaming a category writes its SQL keyword.
enum class StorageCategory : int8_t {
    BLOB,
    INTEGER,
    REAL,
    TEXT
};

inline std::ostream & operator<<(std::ostream & os, const StorageCategory category)
{
    switch (category) {
        case StorageCategory::BLOB:    os << "BLOB"; break;
        case StorageCategory::INTEGER: os << "INTEGER"; break;
        case StorageCategory::REAL:    os << "REAL"; break;
        case StorageCategory::TEXT:    os << "TEXT"; break;
    }
    return os;
}

} // namespace mdb2sqlite
