#pragma once

#include <stdexcept>
#include <string>

// Base for every error nexcli raises itself.
class NexcliError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad flag, config or manifest value. Reported before any network call.
class ConfigurationError : public NexcliError {
public:
    using NexcliError::NexcliError;
};

// Non-2xx response, transport failure or malformed response body.
class ProtocolError : public NexcliError {
public:
    ProtocolError(const std::string& msg, long status = 0)
        : NexcliError(msg), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

// Checksum mismatch or missing digest.
class IntegrityError : public NexcliError {
public:
    using NexcliError::NexcliError;
};

// Archive entry resolving outside the extraction root. Always fatal.
class PathTraversalError : public IntegrityError {
public:
    using IntegrityError::IntegrityError;
};

// Local path cannot be opened, read or written.
class FilesystemError : public NexcliError {
public:
    using NexcliError::NexcliError;
};

// Write on a pipe whose read side is already closed.
class PipeClosedError : public NexcliError {
public:
    PipeClosedError() : NexcliError("write on closed pipe") {}
};
