#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace archivedir {

enum class ErrorKind {
    Stage,
    PartIO,
    SinkTransient,
    SinkPermanent,
    PartDiscovery,
    DecryptionFailed,
    MetadataMissing,
    Cancelled,
    Config
};

const char* ErrorKindName(ErrorKind kind);

// Base of every failure the pipeline can surface. `component` names the stage,
// sink or store that gave up ("compress", "local-sink", "part-reader", ...).
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string component, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& component() const noexcept { return component_; }

private:
    ErrorKind kind_;
    std::string component_;
};

class StageError : public Error {
public:
    // `malformed_input` marks errors caused by the bytes a stage was fed
    // (bad gzip header, broken tar block) rather than by local resources.
    StageError(std::string stage, const std::string& message, bool malformed_input = false);

    bool malformed_input() const noexcept { return malformed_input_; }

private:
    bool malformed_input_;
};

class PartIOError : public Error {
public:
    PartIOError(std::string component, const std::string& message);
};

class SinkTransientError : public Error {
public:
    SinkTransientError(std::string component, const std::string& message);
};

class SinkPermanentError : public Error {
public:
    SinkPermanentError(std::string component, const std::string& message);
};

class PartDiscoveryError : public Error {
public:
    explicit PartDiscoveryError(const std::string& message);
};

class DecryptionFailed : public Error {
public:
    explicit DecryptionFailed(const std::string& message);
};

class MetadataMissing : public Error {
public:
    explicit MetadataMissing(const std::string& message);
};

class Cancelled : public Error {
public:
    explicit Cancelled(std::string component = "pipeline");
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message);
};

// Formats "<kind> in <component>: <what>" for any exception, falling back to
// what() for foreign exception types.
std::string Describe(const std::exception_ptr& error);

}  // namespace archivedir
