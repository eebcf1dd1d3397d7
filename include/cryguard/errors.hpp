#pragma once

#include <stdexcept>
#include <string>

namespace cryguard {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed ScoreSet or parameter value out of range.
class ValidationError : public Error {
public:
    using Error::Error;
};

// Inconsistent or unknown configuration (CONFIRM_N > CONFIRM_M, unknown parameter name, ...).
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Calibration set for a parameter the active phase does not own.
class OutOfScopeParameterError : public Error {
public:
    using Error::Error;
};

// Snapshot file could not be written or read.
class StateChannelUnavailable : public Error {
public:
    using Error::Error;
};

}  // namespace cryguard
