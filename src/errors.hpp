#pragma once

#include <stdexcept>
#include <string>

namespace pnav {

// Raised when the base directory cannot be scanned
class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& message) : std::runtime_error(message) {}
};

// Raised for unreadable config files and failed startup validation
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace pnav
