// <Schema> -*- C++ -*-

#pragma once

#include "mdb2sqlite/schema/SourceTypes.hpp"

#include <string>
#include <vector>

namespace mdb2sqlite {

//! One column of a source table
struct Column {
    std::string name;
    SourceType type;
};

//! A plain (non foreign key) index on a source table. The
//! column names are in the index's declared order.
struct Index {
    std::string name;
    std::vector<std::string> column_names;
    bool unique = false;
};

//! Table metadata as the source reader reports it. Column
//! order is the declared order, and row values coming from
//! the reader are aligned with it.
struct Table {
    std::string name;
    std::vector<Column> columns;
    std::vector<Index> indexes;

    //! Find a column by name, or nullptr
    const Column * findColumn(const std::string & col_name) const {
        for (const auto & col : columns) {
            if (col.name == col_name) {
                return &col;
            }
        }
        return nullptr;
    }
};

} // namespace mdb2sqlite
