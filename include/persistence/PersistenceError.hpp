#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// Error taxonomy shared by every persistence component.
enum class PersistenceErrorCode {
    SerializationFailed,
    DeserializationFailed,
    StorageAccessFailed,
    SurfaceCommunicationFailed,
    SessionExpired,
    TerminalNotFound,
    InvalidDataFormat,
    CompressionFailed,
    StorageFull
};

inline const char* toString(PersistenceErrorCode code) {
    switch (code) {
        case PersistenceErrorCode::SerializationFailed:        return "SERIALIZATION_FAILED";
        case PersistenceErrorCode::DeserializationFailed:      return "DESERIALIZATION_FAILED";
        case PersistenceErrorCode::StorageAccessFailed:        return "STORAGE_ACCESS_FAILED";
        case PersistenceErrorCode::SurfaceCommunicationFailed: return "SURFACE_COMMUNICATION_FAILED";
        case PersistenceErrorCode::SessionExpired:             return "SESSION_EXPIRED";
        case PersistenceErrorCode::TerminalNotFound:           return "TERMINAL_NOT_FOUND";
        case PersistenceErrorCode::InvalidDataFormat:          return "INVALID_DATA_FORMAT";
        case PersistenceErrorCode::CompressionFailed:          return "COMPRESSION_FAILED";
        case PersistenceErrorCode::StorageFull:                return "STORAGE_FULL";
    }
    return "UNKNOWN";
}

class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& message,
                     PersistenceErrorCode code,
                     std::optional<std::string> terminalId = std::nullopt,
                     std::optional<std::string> cause = std::nullopt)
        : std::runtime_error(message)
        , code_(code)
        , terminalId_(std::move(terminalId))
        , cause_(std::move(cause)) {}

    PersistenceErrorCode code() const { return code_; }
    const std::optional<std::string>& terminalId() const { return terminalId_; }

    // Message of the underlying fault, when this error wraps another one
    const std::optional<std::string>& cause() const { return cause_; }

    std::string describe() const {
        std::string s = std::string(toString(code_)) + ": " + what();
        if (terminalId_) s += " [terminal " + *terminalId_ + "]";
        if (cause_)      s += " (caused by: " + *cause_ + ")";
        return s;
    }

private:
    PersistenceErrorCode       code_;
    std::optional<std::string> terminalId_;
    std::optional<std::string> cause_;
};

// Result shapes returned to callers of the orchestrator.
struct PersistenceResult {
    bool success       = false;
    int  terminalCount = 0;
    std::optional<PersistenceError> error;

    static PersistenceResult ok(int count) { return {true, count, std::nullopt}; }
    static PersistenceResult failed(PersistenceError e) { return {false, 0, std::move(e)}; }
};

struct RestoreResult {
    bool success       = false;
    int  restoredCount = 0;
    int  skippedCount  = 0;
    std::optional<PersistenceError> error;

    static RestoreResult ok(int restored, int skipped) {
        return {true, restored, skipped, std::nullopt};
    }
    static RestoreResult failed(PersistenceError e) {
        return {false, 0, 0, std::move(e)};
    }
};
