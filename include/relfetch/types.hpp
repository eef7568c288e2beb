#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace relfetch {

// ============================================================================
// Error Classification
// ============================================================================

enum class ErrorKind {
    None,
    Transport,        // Connection failure, proxy failure, timeout
    HttpStatus,       // Non-success HTTP status
    Decode,           // Response body is not the expected JSON shape
    Resolution,       // Every latest-version attempt failed
    RepoMismatch,     // Version record belongs to another repository
    RecordNotFound,
    RecordMalformed,
    Filesystem,
    Archive,          // Corrupt compressed stream or container header
    NoMatch,          // Pattern search found no asset
    InvalidArgument
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::HttpStatus: return "http_status";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::Resolution: return "resolution";
        case ErrorKind::RepoMismatch: return "repo_mismatch";
        case ErrorKind::RecordNotFound: return "record_not_found";
        case ErrorKind::RecordMalformed: return "record_malformed";
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Archive: return "archive";
        case ErrorKind::NoMatch: return "no_match";
        case ErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

// Generic outcome for operations that only succeed or fail
struct Status {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

inline Status make_ok() {
    Status s;
    s.ok = true;
    return s;
}

inline Status make_error(ErrorKind kind, const std::string& message) {
    Status s;
    s.kind = kind;
    s.error = message;
    return s;
}

// ============================================================================
// Version Record
// ============================================================================

// Persisted marker of what is installed in an installation directory
struct VersionRecord {
    std::string tag_name;  // Release tag exactly as reported by the host
    std::string repo;      // "<owner>/<name>"
};

inline bool operator==(const VersionRecord& a, const VersionRecord& b) {
    return a.tag_name == b.tag_name && a.repo == b.repo;
}

inline bool operator!=(const VersionRecord& a, const VersionRecord& b) {
    return !(a == b);
}

// ============================================================================
// Retry Policy
// ============================================================================

// Applies to latest-version resolution only. The loop runs exactly `count`
// times and sleeps `delay` after every failed attempt, including the last.
struct RetryPolicy {
    uint32_t count = 3;
    std::chrono::milliseconds delay{3000};
};

// ============================================================================
// Progress Reporting
// ============================================================================

struct ProgressEvent {
    std::string source;        // URL being transferred
    uint64_t downloaded = 0;   // Bytes received so far
    uint64_t total = 0;        // Content length, 0 when unknown
    double mib_per_sec = 0.0;
    bool complete = false;
};

// An empty function disables progress reporting
using ProgressFn = std::function<void(const ProgressEvent&)>;

// ============================================================================
// Asset Download Target
// ============================================================================

// Produced by the asset locator and consumed immediately by the fetch engine
struct DownloadSpec {
    std::string repo;
    std::string asset_name;
    std::string version;          // Empty: resolve latest
    std::string destination_dir;
};

} // namespace relfetch
