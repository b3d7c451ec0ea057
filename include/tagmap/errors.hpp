#pragma once

/**
 * @file errors.hpp
 * @brief Exception taxonomy for tag tree / config map conversion
 *
 * Every failure aborts the enclosing decode or encode call. Factory errors
 * raised while rehydrating objects are wrapped in RehydrationError, so
 * callers only ever see the types declared here.
 */

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace tagmap {

/// Base of every error thrown by tagmap
class TagMapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed or unsupported tag shape (mixed-kind list, bad marker value)
class StructuralError : public TagMapError {
public:
    using TagMapError::TagMapError;
};

/// A config value that has no tag representation
class EncodingError : public TagMapError {
public:
    using TagMapError::TagMapError;
};

/// Object rehydration failed
class DeserializationError : public TagMapError {
public:
    using TagMapError::TagMapError;
};

/// Marker key names an alias with no registered factory
class UnknownTypeError : public DeserializationError {
public:
    explicit UnknownTypeError(std::string alias)
        : DeserializationError("Unknown serialized type alias: " + alias)
        , alias_(std::move(alias)) {}

    [[nodiscard]] const std::string& alias() const { return alias_; }

private:
    std::string alias_;
};

/// A registered factory threw or returned nothing
class RehydrationError : public DeserializationError {
public:
    RehydrationError(std::string alias, std::string causeMessage, std::exception_ptr cause = nullptr)
        : DeserializationError("Failed to deserialize object of type " + alias + ", " + causeMessage)
        , alias_(std::move(alias))
        , causeMessage_(std::move(causeMessage))
        , cause_(std::move(cause)) {}

    [[nodiscard]] const std::string& alias() const { return alias_; }
    [[nodiscard]] const std::string& causeMessage() const { return causeMessage_; }

    /// Original exception thrown by the factory (null if it returned nothing)
    [[nodiscard]] std::exception_ptr cause() const { return cause_; }

private:
    std::string alias_;
    std::string causeMessage_;
    std::exception_ptr cause_;
};

/// Reserved key overwritten by custom data, or duplicate alias registration
class CollisionError : public TagMapError {
public:
    explicit CollisionError(const std::string& message, std::string key = {})
        : TagMapError(message)
        , key_(std::move(key)) {}

    [[nodiscard]] const std::string& key() const { return key_; }

private:
    std::string key_;
};

/// Nesting exceeded the configured depth cap
class StructureTooDeepError : public TagMapError {
public:
    explicit StructureTooDeepError(size_t limit)
        : TagMapError("Structure nesting exceeds depth limit of " + std::to_string(limit))
        , limit_(limit) {}

    [[nodiscard]] size_t limit() const { return limit_; }

private:
    size_t limit_;
};

}  // namespace tagmap
