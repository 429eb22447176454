#pragma once

#include <stdexcept>
#include <string>

namespace tile_link {

class TileLinkError : public std::runtime_error {
public:
    explicit TileLinkError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TileLinkError {
public:
    explicit ConfigError(const std::string& message)
        : TileLinkError("Config error: " + message) {}
};

class ValidationError : public TileLinkError {
public:
    explicit ValidationError(const std::string& message)
        : TileLinkError("Validation error: " + message) {}
};

class IOError : public TileLinkError {
public:
    explicit IOError(const std::string& message)
        : TileLinkError("I/O error: " + message) {}
};

class TemplateError : public IOError {
public:
    explicit TemplateError(const std::string& message)
        : IOError("Template error: " + message) {}
};

class CaptureError : public IOError {
public:
    explicit CaptureError(const std::string& message)
        : IOError("Capture error: " + message) {}
};

class ActuationError : public TileLinkError {
public:
    explicit ActuationError(const std::string& message)
        : TileLinkError("Actuation error: " + message) {}
};

// Command-line reporting of an error that ends a command
inline std::string cli_error_line(const std::exception& e) {
    return std::string("Error: ") + e.what();
}

// 2 for configuration, template and validation errors, 1 otherwise
inline int cli_exit_code(const std::exception& e) {
    if (dynamic_cast<const ConfigError*>(&e) || dynamic_cast<const ValidationError*>(&e) ||
        dynamic_cast<const TemplateError*>(&e)) {
        return 2;
    }
    return 1;
}

} // namespace tile_link
