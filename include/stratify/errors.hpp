#pragma once

#include <stdexcept>
#include <string>

namespace stratify {

// Raised by the file system layer when a read or write cannot complete
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised when a configuration file exists but cannot be used
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace stratify
