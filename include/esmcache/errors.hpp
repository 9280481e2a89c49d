#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace esmcache {

/// Base of every error raised by esm-cache components.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Malformed operation payload or configuration value.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error("validation: " + what) {}
};

/// No registered handler accepts the payload.
class NoHandlerFound : public Error {
public:
    explicit NoHandlerFound(const std::string& payload_kind)
        : Error("no handler found for operation type: " + payload_kind) {}
};

/// Cache still over budget after an eviction pass.
class ResourceLimitExceeded : public Error {
public:
    ResourceLimitExceeded(uint64_t limit, uint64_t attempted)
        : Error("cache limit exceeded: limit " + std::to_string(limit) +
                " bytes, attempted " + std::to_string(attempted) + " bytes")
        , limit_(limit)
        , attempted_(attempted) {}

    uint64_t limit() const { return limit_; }
    uint64_t attempted() const { return attempted_; }

private:
    uint64_t limit_;
    uint64_t attempted_;
};

class OperationNotAllowed : public Error {
public:
    explicit OperationNotAllowed(const std::string& what) : Error(what) {}
};

/// Cooperative cancellation observed by a handler or a staging wait.
class OperationCancelled : public Error {
public:
    explicit OperationCancelled(const std::string& what) : Error("cancelled: " + what) {}
};

/// Tape-resident file did not come online before the deadline.
class StagingTimeoutError : public Error {
public:
    explicit StagingTimeoutError(const std::string& path)
        : Error("timeout while waiting for file " + path + " to be staged")
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Zero or several HSM mount points claim a path.
class AmbiguousFilesystemError : public Error {
public:
    AmbiguousFilesystemError(const std::string& path, size_t matches)
        : Error("expected exactly one matching filesystem for path '" + path +
                "', found " + std::to_string(matches))
        , matches_(matches) {}

    size_t matches() const { return matches_; }

private:
    size_t matches_;
};

class AuthenticationError : public Error {
public:
    explicit AuthenticationError(const std::string& what) : Error("authentication: " + what) {}
};

/// Non-success reply or transport failure from the HSM API.
class RemoteServiceError : public Error {
public:
    RemoteServiceError(const std::string& what, int status_code)
        : Error(what)
        , status_code_(status_code) {}

    /// HTTP status, or 0 for transport-level failures.
    int status_code() const { return status_code_; }

private:
    int status_code_;
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& what) : Error("storage: " + what) {}
};

}  // namespace esmcache
