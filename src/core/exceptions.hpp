#pragma once

#include <stdexcept>
#include <string>

namespace sentinel {

class SentinelException : public std::runtime_error {
public:
    explicit SentinelException(const std::string& message) : std::runtime_error(message) {}
    explicit SentinelException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public SentinelException {
public:
    explicit ConfigurationError(const std::string& message)
        : SentinelException("Configuration Error: " + message) {}
};

class ValidationError : public SentinelException {
public:
    explicit ValidationError(const std::string& message)
        : SentinelException("Validation Error: " + message) {}
};

// Raised by external collaborators (snapshot source, action builder, venue)
class CollaboratorError : public SentinelException {
public:
    explicit CollaboratorError(const std::string& message)
        : SentinelException("Collaborator Error: " + message) {}
};

} // namespace sentinel
