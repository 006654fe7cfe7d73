/**
 * @file errors.hpp
 * @brief Exception taxonomy for sandbox lifecycle operations
 *
 * Every failure surfaced by the manager derives from SandboxError so callers
 * (the control server, the HTTP collaborator) can map errors to responses by
 * kind without string matching.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sandpool {
namespace core {

/**
 * @class SandboxError
 * @brief Base class of all manager errors
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * @brief Short machine-readable error kind
     * @return Kind string used in protocol responses
     */
    virtual const char* Kind() const noexcept { return "sandbox_error"; }
};

/// Requested sandbox type is not registered. Caller error, never retried.
class UnknownTypeError : public SandboxError {
public:
    explicit UnknownTypeError(const std::string& type)
        : SandboxError("Unknown sandbox type: " + type), type_(type) {}

    const char* Kind() const noexcept override { return "unknown_type"; }
    const std::string& Type() const { return type_; }

private:
    std::string type_;
};

/// Backend failed to create or start an instance.
class ProvisioningError : public SandboxError {
public:
    explicit ProvisioningError(const std::string& message)
        : SandboxError(message) {}

    const char* Kind() const noexcept override { return "provisioning"; }
};

/// Every port in the configured range is reserved.
class ExhaustionError : public SandboxError {
public:
    explicit ExhaustionError(const std::string& message)
        : SandboxError(message) {}

    const char* Kind() const noexcept override { return "exhausted"; }
};

/// Sandbox id is unknown locally and in the shared state store.
class NotFoundError : public SandboxError {
public:
    explicit NotFoundError(const std::string& id)
        : SandboxError("No sandbox found with id: " + id), id_(id) {}

    const char* Kind() const noexcept override { return "not_found"; }
    const std::string& Id() const { return id_; }

private:
    std::string id_;
};

/// Selected substrate (docker daemon, cluster API) cannot be reached.
class BackendUnavailableError : public SandboxError {
public:
    explicit BackendUnavailableError(const std::string& message)
        : SandboxError(message) {}

    const char* Kind() const noexcept override { return "backend_unavailable"; }
};

/// Shared state store read or write failed.
class StateStoreError : public SandboxError {
public:
    explicit StateStoreError(const std::string& message)
        : SandboxError(message) {}

    const char* Kind() const noexcept override { return "state_store"; }
};

/// Invalid or inconsistent configuration.
class ConfigError : public SandboxError {
public:
    explicit ConfigError(const std::string& message)
        : SandboxError(message) {}

    const char* Kind() const noexcept override { return "config"; }
};

} // namespace core
} // namespace sandpool
