#pragma once

#include <stdexcept>
#include <string>

namespace blossom {

// Base for every failure raised by the media pipeline. Process diagnostics
// (stderr text) are carried verbatim inside what().
class MediaError : public std::runtime_error {
public:
    explicit MediaError(const std::string& msg) : std::runtime_error(msg) {}
};

// Unsupported platform, download, decompression or extraction failure.
class ProvisioningError : public MediaError {
public:
    explicit ProvisioningError(const std::string& msg) : MediaError(msg) {}
};

// Resolver binary exited non-zero, timed out or printed nothing.
class ResolutionError : public MediaError {
public:
    explicit ResolutionError(const std::string& msg) : MediaError(msg) {}
};

// Transcoder failed to produce a frame.
class ExtractionError : public MediaError {
public:
    explicit ExtractionError(const std::string& msg) : MediaError(msg) {}
};

// Extraction failure whose diagnostics show the stream URL is no longer
// authorized.
class AuthorizationExpiredError : public ExtractionError {
public:
    explicit AuthorizationExpiredError(const std::string& msg) : ExtractionError(msg) {}
};

// Image could not be decoded or encoded.
class CompressionError : public MediaError {
public:
    explicit CompressionError(const std::string& msg) : MediaError(msg) {}
};

// fork/pipe/exec failure before a child process could run.
class ProcessError : public MediaError {
public:
    explicit ProcessError(const std::string& msg) : MediaError(msg) {}
};

} // namespace blossom
