/**
 * @file errors.h
 * @brief Error taxonomy for the normalization layer.
 *
 * Design-time errors (unknown venue values, unsupported translations,
 * configuration contradictions) are fatal to the caller. Filter and
 * instrument errors are recoverable per symbol and are caught by the
 * instrument provider.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace quantgate {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Venue sent a value with no registered mapping.
class UnrecognizedEnumError : public Error {
public:
    UnrecognizedEnumError(const std::string& enum_name, const std::string& raw_value)
        : Error("unrecognized " + enum_name + " value '" + raw_value + "'"),
          enum_name_(enum_name), raw_value_(raw_value) {}

    const std::string& enum_name() const { return enum_name_; }
    const std::string& raw_value() const { return raw_value_; }

private:
    std::string enum_name_;
    std::string raw_value_;
};

// Internal value with no venue equivalent for the active product type.
class UnsupportedInternalValueError : public Error {
public:
    UnsupportedInternalValueError(const std::string& enum_name,
                                  const std::string& value,
                                  const std::string& product_type)
        : Error("unsupported " + enum_name + " '" + value + "' for " + product_type) {}
};

class NotImplementedError : public Error {
public:
    explicit NotImplementedError(const std::string& what) : Error("not implemented: " + what) {}
};

class MissingRequiredFilterError : public Error {
public:
    explicit MissingRequiredFilterError(const std::string& what) : Error(what) {}
};

class OutOfRangeError : public Error {
public:
    explicit OutOfRangeError(const std::string& what) : Error(what) {}
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& what) : Error(what) {}
};

class ValueError : public Error {
public:
    explicit ValueError(const std::string& what) : Error(what) {}
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// Malformed venue payload (JSON shape or field type).
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& what) : Error(what) {}
};

} // namespace quantgate
