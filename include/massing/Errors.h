#pragma once

#include <stdexcept>
#include <string>

namespace massing {

/**
 * Base of every error the massing library throws.
 * Geometric rejection of a single floor is not an error (see FootprintResult).
 */
class MassingError : public std::runtime_error {
public:
    explicit MassingError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed lot boundary or face set
class InvalidLotError : public MassingError {
public:
    explicit InvalidLotError(const std::string& what) : MassingError(what) {}
};

// Resolved parameter out of range or unparseable
class ParameterError : public MassingError {
public:
    explicit ParameterError(const std::string& what) : MassingError(what) {}
};

// Unreadable or malformed configuration / job file
class ConfigError : public MassingError {
public:
    explicit ConfigError(const std::string& what) : MassingError(what) {}
};

} // namespace massing
