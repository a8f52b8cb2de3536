// <Row> -*- C++ -*-

#pragma once

#include "mdb2sqlite/values/FieldValue.hpp"
#include "mdb2sqlite/utils/ValidValue.hpp"

#include <vector>

namespace mdb2sqlite {

//! Value of one field in a row. Invalid means NULL.
using OptionalValue = utils::ValidValue<FieldValue>;

//! One source record. Values are aligned by position with the
//! declared column order of the table they came from.
using Row = std::vector<OptionalValue>;

} // namespace mdb2sqlite
