// <StringUtils> -*- C++ -*-

/*!
 * \file StringUtils.hpp
 * \brief String utilities used throughout mdb2sqlite
 */

#ifndef __MDB2SQLITE_STRING_UTILS_H__
#define __MDB2SQLITE_STRING_UTILS_H__

#include <boost/algorithm/string/join.hpp>

#include <string>
#include <vector>

namespace mdb2sqlite {
namespace utils {

/*!
 * \brief Copy a string, replacing every occurrence of the char
 * \a from with the string \a to
 */
inline std::string copyWithReplace(const std::string & s, char from, const std::string & to)
{
    std::string result;
    result.reserve(s.size()*2); // Take an initial guess so we don't have to reallocate

    for (const char ch : s) {
        if (ch == from) {
            result += to;
        } else {
            result += ch;
        }
    }

    return result;
}

/*!
 * \brief Join the strings with ", " in between. Used to build the
 * column lists of CREATE TABLE / CREATE INDEX / INSERT statements.
 */
inline std::string joinCommaSeparated(const std::vector<std::string> & parts)
{
    return boost::algorithm::join(parts, ", ");
}

/*!
 * \brief Returns true if \a location is \a pattern itself or a dotted
 * descendant of it ("export.schema" is under "export"). The empty
 * pattern matches every location.
 */
inline bool locationMatches(const std::string & pattern, const std::string & location)
{
    if (pattern.empty() || pattern == location) {
        return true;
    }
    return location.size() > pattern.size() &&
           location.compare(0, pattern.size(), pattern) == 0 &&
           location[pattern.size()] == '.';
}

} // namespace utils
} // namespace mdb2sqlite

#endif
