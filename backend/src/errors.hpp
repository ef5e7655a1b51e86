#pragma once
#include <stdexcept>
#include <string>

// Raised by encode() for an event whose own invariants are already broken
// (negative quantity, non-finite number, unknown metric). Never raised for
// well-formed input.
class EncodingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The receive side could not acquire its address. Fatal at startup.
class BindError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid configuration value (unparsable number, malformed address).
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
