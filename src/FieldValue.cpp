// <FieldValue> -*- C++ -*-

#include "mdb2sqlite/values/FieldValue.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <iomanip>
#include <sstream>

namespace mdb2sqlite {

std::ostream & operator<<(std::ostream & os, const FieldKind kind)
{
    switch (kind) {
        case FieldKind::BOOLEAN: os << "BOOLEAN"; break;
        case FieldKind::INTEGER: os << "INTEGER"; break;
        case FieldKind::REAL:    os << "REAL"; break;
        case FieldKind::DECIMAL: os << "DECIMAL"; break;
        case FieldKind::TEXT:    os << "TEXT"; break;
        case FieldKind::BLOB:    os << "BLOB"; break;
    }
    return os;
}

FieldValue FieldValue::fromBoolean(const bool val)
{
    FieldValue fv;
    fv.kind_ = FieldKind::BOOLEAN;
    fv.int_val_ = val ? 1 : 0;
    return fv;
}

FieldValue FieldValue::fromInteger(const int64_t val)
{
    FieldValue fv;
    fv.kind_ = FieldKind::INTEGER;
    fv.int_val_ = val;
    return fv;
}

FieldValue FieldValue::fromReal(const double val)
{
    FieldValue fv;
    fv.kind_ = FieldKind::REAL;
    fv.real_val_ = val;
    return fv;
}

FieldValue FieldValue::fromDecimal(const std::string & digits)
{
    FieldValue fv;
    fv.kind_ = FieldKind::DECIMAL;
    fv.str_val_ = digits;
    return fv;
}

FieldValue FieldValue::fromText(const std::string & val)
{
    FieldValue fv;
    fv.kind_ = FieldKind::TEXT;
    fv.str_val_ = val;
    return fv;
}

FieldValue FieldValue::fromBlob(const std::vector<uint8_t> & bytes)
{
    FieldValue fv;
    fv.kind_ = FieldKind::BLOB;
    fv.blob_val_ = bytes;
    return fv;
}

FieldValue FieldValue::fromBlob(std::vector<uint8_t> && bytes)
{
    FieldValue fv;
    fv.kind_ = FieldKind::BLOB;
    fv.blob_val_ = std::move(bytes);
    return fv;
}

void FieldValue::assertKind_(const FieldKind kind) const
{
    if (kind != kind_) {
        throw ExportException("Invalid access to a FieldValue - ")
            << "attempt to read a " << kind << " payload from a "
            << kind_ << " value";
    }
}

bool FieldValue::getBoolean() const
{
    assertKind_(FieldKind::BOOLEAN);
    return int_val_ != 0;
}

int64_t FieldValue::getInteger() const
{
    assertKind_(FieldKind::INTEGER);
    return int_val_;
}

double FieldValue::getReal() const
{
    assertKind_(FieldKind::REAL);
    return real_val_;
}

const std::string & FieldValue::getDecimal() const
{
    assertKind_(FieldKind::DECIMAL);
    return str_val_;
}

const std::string & FieldValue::getText() const
{
    assertKind_(FieldKind::TEXT);
    return str_val_;
}

const std::vector<uint8_t> & FieldValue::getBlob() const
{
    assertKind_(FieldKind::BLOB);
    return blob_val_;
}

std::string FieldValue::toString() const
{
    switch (kind_) {
        case FieldKind::BOOLEAN:
            return int_val_ ? "true" : "false";
        case FieldKind::INTEGER:
            return std::to_string(int_val_);
        case FieldKind::REAL: {
            std::ostringstream oss;
            oss << std::setprecision(15) << real_val_;
            return oss.str();
        }
        case FieldKind::DECIMAL:
        case FieldKind::TEXT:
            return str_val_;
        case FieldKind::BLOB:
            break;
    }

    throw ExportException("A BLOB value has no textual representation");
}

bool FieldValue::operator==(const FieldValue & rhs) const
{
    if (kind_ != rhs.kind_) {
        return false;
    }

    switch (kind_) {
        case FieldKind::BOOLEAN:
        case FieldKind::INTEGER:
            return int_val_ == rhs.int_val_;
        case FieldKind::REAL:
            return real_val_ == rhs.real_val_;
        case FieldKind::DECIMAL:
        case FieldKind::TEXT:
            return str_val_ == rhs.str_val_;
        case FieldKind::BLOB:
            return blob_val_ == rhs.blob_val_;
    }

    return false;
}

std::ostream & operator<<(std::ostream & os, const FieldValue & value)
{
    if (value.getKind() == FieldKind::BLOB) {
        os << "<blob " << value.getBlob().size() << " bytes>";
    } else if (value.getKind() == FieldKind::TEXT) {
        os << "\"" << value.getText() << "\"";
    } else {
        os << value.toString();
    }
    return os;
}

} // namespace mdb2sqlite
