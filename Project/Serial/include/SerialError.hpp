#pragma once

#include <stdexcept>
#include <string>

namespace Serial {

    // Base for every hard failure raised at a public call boundary.
    class SerialError : public std::runtime_error {
    public:
        explicit SerialError(const std::string& message) : std::runtime_error(message) {}
    };

    // Input that cannot be processed at all: invalid handles, records without Type/Id,
    // unparsable JSON, corrupt packed payloads.
    class MalformedInputError : public SerialError {
    public:
        explicit MalformedInputError(const std::string& message) : SerialError(message) {}
    };

    // The schema registry was used before BuildSchema ran.
    class SchemaNotBuiltError : public SerialError {
    public:
        explicit SchemaNotBuiltError(const std::string& message) : SerialError(message) {}
    };

    // The host object model refused an operation.
    class HostError : public SerialError {
    public:
        explicit HostError(const std::string& message) : SerialError(message) {}
    };

} // namespace Serial
