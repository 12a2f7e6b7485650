#pragma once
// Error taxonomy shared by the stack, transfer and inheritance layers
//
// Mutating operations report through result structs carrying an ErrorCode.
// Storage backends throw StoreError; callers that mutate convert it into
// ErrorCode::StoreFailure, read-only queries let it propagate.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sandhi {

enum class ErrorCode : uint8_t {
    None = 0,
    StackOverflow = 1,      // Push beyond max depth, stack unchanged
    FrameNotFound = 2,      // Update addressed to a frame not in the stack
    UnknownIntent = 3,      // Intent not in the catalog
    SourceUnavailable = 4,  // Collaborator failed or timed out
    CacheCorrupt = 5,       // Malformed cache payload
    StoreFailure = 6,       // Backing store raised an error
    CorruptState = 7,       // Persisted stack could not be decoded
    InvalidArgument = 8,
};

inline const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::StackOverflow: return "stack_overflow";
        case ErrorCode::FrameNotFound: return "frame_not_found";
        case ErrorCode::UnknownIntent: return "unknown_intent";
        case ErrorCode::SourceUnavailable: return "source_unavailable";
        case ErrorCode::CacheCorrupt: return "cache_corrupt";
        case ErrorCode::StoreFailure: return "store_failure";
        case ErrorCode::CorruptState: return "corrupt_state";
        case ErrorCode::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

// Raised by KVStore backends
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Raised when a persisted payload exists but cannot be decoded
class CorruptStateError : public StoreError {
public:
    explicit CorruptStateError(const std::string& what) : StoreError(what) {}
};

} // namespace sandhi
