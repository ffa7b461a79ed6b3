#pragma once

#include <stdexcept>
#include <string>

namespace wknn {

// Rejected configuration: bad option value, unknown search strategy, leftover options.
class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
};

// Malformed data, e.g. a neighbor without a class value. Not retryable.
class DataIntegrityError : public std::logic_error {
    public:
        explicit DataIntegrityError(const std::string &what) : std::logic_error(what) {}
};

}
