// <FieldValue> -*- C++ -*-

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace mdb2sqlite {

//! Kind of payload a FieldValue carries
enum class FieldKind : int8_t {
    BOOLEAN,
    INTEGER,
    REAL,
    DECIMAL,  // Exact decimal digits held as text (currency, fixed-point numerics)
    TEXT,
    BLOB
};

std::ostream & operator<<(std::ostream & os, const FieldKind kind);

//! One typed, non-null value read from a source row. NULL
//! values are represented by an invalid utils::ValidValue
//! around a FieldValue (see Row.hpp).
//!
//! The getters check the kind and throw if the value holds
//! some other kind of payload.
class FieldValue
{
public:
    //! Default-constructed values are INTEGER 0
    FieldValue() = default;

    static FieldValue fromBoolean(const bool val);
    static FieldValue fromInteger(const int64_t val);
    static FieldValue fromReal(const double val);
    static FieldValue fromDecimal(const std::string & digits);
    static FieldValue fromText(const std::string & val);
    static FieldValue fromBlob(const std::vector<uint8_t> & bytes);
    static FieldValue fromBlob(std::vector<uint8_t> && bytes);

    FieldKind getKind() const {
        return kind_;
    }

    bool getBoolean() const;
    int64_t getInteger() const;
    double getReal() const;
    const std::string & getDecimal() const;
    const std::string & getText() const;
    const std::vector<uint8_t> & getBlob() const;

    //! Textual rendering of a BOOLEAN, INTEGER, REAL, DECIMAL or
    //! TEXT payload. Throws for BLOB.
    std::string toString() const;

    bool operator==(const FieldValue & rhs) const;

    bool operator!=(const FieldValue & rhs) const {
        return !(*this == rhs);
    }

private:
    void assertKind_(const FieldKind kind) const;

    FieldKind kind_ = FieldKind::INTEGER;
    int64_t int_val_ = 0;
    double real_val_ = 0;

    //Used by DECIMAL and TEXT
    std::string str_val_;

    std::vector<uint8_t> blob_val_;
};

std::ostream & operator<<(std::ostream & os, const FieldValue & value);

} // namespace mdb2sqlite
