// <NamedValue> -*- C++ -*-


/*!
 * \file NamedValue.hpp
 * \brief boost program_options value type with a display name
 * and a fixed range of token counts
 */

#ifndef __MDB2SQLITE_NAMED_VALUE_H__
#define __MDB2SQLITE_NAMED_VALUE_H__

#include <boost/program_options.hpp>

#include <string>

namespace po = boost::program_options;

namespace mdb2sqlite {
    namespace app {

/*!
 * \brief Helper class for populating boost program options. Shows
 * 'name' in usage text instead of "arg" and stops consuming tokens
 * after 'max' of them, so that a multi-token option followed by the
 * positional arguments does not swallow them.
 */
template <typename ArgT>
class named_value_type : public po::typed_value<ArgT>
{
    unsigned min_;
    unsigned max_;
    std::string my_name_;

public:

    typedef po::typed_value<ArgT> base_t;

    named_value_type(std::string const& name, ArgT* val) :
        po::typed_value<ArgT>(val),
        min_(0),
        max_(1),
        my_name_(name)
    { }

    named_value_type(std::string const& name, ArgT* val, unsigned min, unsigned max) :
        po::typed_value<ArgT>(val),
        min_(min),
        max_(max),
        my_name_(name)
    { }

    virtual ~named_value_type() {}

    /*!
     * \brief boost semantic for getting name of this option
     */
    virtual std::string name() const override { return my_name_; }

    named_value_type* multitoken()
    {
        base_t::multitoken();
        return this;
    }

    virtual unsigned min_tokens() const override { return min_; }

    virtual unsigned max_tokens() const override { return max_; }
};

/*!
 * \brief Helper function for generating new named_value_type structs in the
 * boost style
 */
template <typename ArgT>
inline named_value_type<ArgT>* named_value(std::string const& name, ArgT* val=nullptr) {
    return new named_value_type<ArgT>(name, val);
}

template <typename ArgT>
inline named_value_type<ArgT>* named_value(std::string const& name, unsigned min, unsigned max, ArgT* val=nullptr) {
    return new named_value_type<ArgT>(name, val, min, max);
}

    } // namespace app
} // namespace mdb2sqlite

// __MDB2SQLITE_NAMED_VALUE_H__
#endif
