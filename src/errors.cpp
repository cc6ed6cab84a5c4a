#include "archivedir/errors.hpp"

#include <utility>

namespace archivedir {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Stage: return "stage failure";
        case ErrorKind::PartIO: return "part I/O failure";
        case ErrorKind::SinkTransient: return "sink transient failure";
        case ErrorKind::SinkPermanent: return "sink permanent failure";
        case ErrorKind::PartDiscovery: return "part discovery failure";
        case ErrorKind::DecryptionFailed: return "decryption failed";
        case ErrorKind::MetadataMissing: return "metadata missing";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Config: return "configuration error";
    }
    return "error";
}

Error::Error(ErrorKind kind, std::string component, const std::string& message)
    : std::runtime_error(message), kind_(kind), component_(std::move(component)) {}

StageError::StageError(std::string stage, const std::string& message, bool malformed_input)
    : Error(ErrorKind::Stage, std::move(stage), message), malformed_input_(malformed_input) {}

PartIOError::PartIOError(std::string component, const std::string& message)
    : Error(ErrorKind::PartIO, std::move(component), message) {}

SinkTransientError::SinkTransientError(std::string component, const std::string& message)
    : Error(ErrorKind::SinkTransient, std::move(component), message) {}

SinkPermanentError::SinkPermanentError(std::string component, const std::string& message)
    : Error(ErrorKind::SinkPermanent, std::move(component), message) {}

PartDiscoveryError::PartDiscoveryError(const std::string& message)
    : Error(ErrorKind::PartDiscovery, "part-reader", message) {}

DecryptionFailed::DecryptionFailed(const std::string& message)
    : Error(ErrorKind::DecryptionFailed, "decrypt", message) {}

MetadataMissing::MetadataMissing(const std::string& message)
    : Error(ErrorKind::MetadataMissing, "metadata-store", message) {}

Cancelled::Cancelled(std::string component)
    : Error(ErrorKind::Cancelled, std::move(component), "operation cancelled") {}

ConfigError::ConfigError(const std::string& message)
    : Error(ErrorKind::Config, "config", message) {}

std::string Describe(const std::exception_ptr& error) {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const Error& exc) {
        return std::string(ErrorKindName(exc.kind())) + " in " + exc.component() + ": " + exc.what();
    } catch (const std::exception& exc) {
        return exc.what();
    }
    return "unknown error";
}

}  // namespace archivedir
