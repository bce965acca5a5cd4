#pragma once

#include <stdexcept>
#include <string>

namespace fits_inspect {

class FitsInspectError : public std::runtime_error {
public:
    explicit FitsInspectError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public FitsInspectError {
public:
    explicit ConfigError(const std::string& message)
        : FitsInspectError("Config error: " + message) {}
};

class ValidationError : public FitsInspectError {
public:
    explicit ValidationError(const std::string& message)
        : FitsInspectError("Validation error: " + message) {}
};

class IOError : public FitsInspectError {
public:
    explicit IOError(const std::string& message)
        : FitsInspectError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class RenderError : public FitsInspectError {
public:
    explicit RenderError(const std::string& message)
        : FitsInspectError("Render error: " + message) {}
};

} // namespace fits_inspect
