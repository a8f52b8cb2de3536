// <ValidValue> -*- C++ -*-


/**
 * \file   ValidValue.hpp
 *
 * \brief  File that defines a ValidValue
 */

#pragma once

#include <iostream>
#include <utility>

#include "mdb2sqlite/Errors.hpp"

namespace mdb2sqlite
{
namespace utils
{

    /**
     * \class ValidValue
     * \brief Provides a wrapper around a value which may or may not
     *        have been assigned. An invalid ValidValue is how a NULL
     *        row value travels through the exporter.
     */
    template <typename T>
    class ValidValue
    {
    public:
        //! Convenient typedef for the value type
        typedef T value_type;

        //! Construct with no validity (not valid, uninitialized)
        ValidValue() :
            valid_(false),
            value_()
        {}

        /**
         * \brief Construct with a valid starting value
         * \param args The value to start with
         *
         * This constructor will _not_ be used when constructing with
         * another ValidValue.  The const/non-const copy constructors
         * below should/will be used instead
         */
        template<typename ...ArgsT>
        ValidValue(ArgsT&& ...args) :
            valid_(true),
            value_(std::forward<ArgsT>(args)...)
        {}

        //! Allow copies of direct ValidValue -- non-const.  This is
        //! to prevent the variatic template constructor from being
        //! used when the rvalue is another ValidValue
        ValidValue(ValidValue &) = default;

        //! Allow moves
        ValidValue(ValidValue && v) :
            valid_(v.valid_),
            value_(std::move(v.value_))
        {
            v.valid_ = false;
        }

        //! Allow copies
        ValidValue(const ValidValue &) = default;

        //! Allow assignments
        ValidValue & operator=(const ValidValue&) = default;
        ValidValue & operator=(ValidValue&&) = default;

        /**
         * \brief Assignment
         * \param val The value to assign, becomes immediately valid
         * \return The value after assignment
         */
        value_type operator=(const value_type & val) {
            valid_ = true;
            return (value_ = val);
        }

        /**
         * \brief Assignment
         * \param val The value to assign, becomes immediately valid
         * \return The value after assignment
         */
        value_type operator=(value_type && val) {
            valid_ = true;
            return (value_ = std::move(val));
        }

        /**
         * \brief Compare equal. Two invalid values compare equal,
         *        an invalid value never equals a valid one.
         */
        bool operator==(const ValidValue<T> & val) const {
            if (valid_ != val.valid_) {
                return false;
            }
            return !valid_ || (value_ == val.value_);
        }

        bool operator!=(const ValidValue<T> & val) const {
            return !operator==(val);
        }

        /**
         * \brief Is this value valid
         * \return true if valid
         */
        bool isValid() const {
            return valid_;
        }

        /**
         * \brief Get the value - const version
         * \return The internal value, throws if this ValidValue is NOT valid
         */
        const value_type & getValue() const {
            if (!valid_) {
                mdb2sqlite_throw("ValidValue is not valid for getting!");
            }
            return value_;
        }

        /**
         * \brief Get the value
         * \return The internal value by reference, throws if this
         *         ValidValue is NOT valid
         */
        value_type & getValue() {
            if (!valid_) {
                mdb2sqlite_throw("ValidValue is not valid for getting!");
            }
            return value_;
        }

    private:
        bool valid_ = false;  //!< Validity
        value_type value_;    //!< The value
    };

template<class ValidValT>
std::ostream & operator<<(std::ostream & os, const ValidValue<ValidValT> & vv)
{
    if(vv.isValid()) {
        os << vv.getValue();
    }
    else {
        os << "NULL";
    }
    return os;
}

} // namespace utils
} // namespace mdb2sqlite
