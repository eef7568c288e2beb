#pragma once

#include "relfetch/types.hpp"

#include <string>
#include <vector>

namespace relfetch {

// ============================================================================
// Archive Extraction
// ============================================================================
//
// Entries are replayed directly into the destination directory. Extraction
// stops at the first malformed header or filesystem error and leaves what was
// already written in place.

struct UnpackResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;   // Archive or Filesystem
    std::string error;
    std::vector<std::string> entries;   // Relative paths written, in archive order
};

struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;  // Normalized relative path
};

// Rejects absolute paths and any ".." component
PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root);

// Drop the first `count` path segments: "pkg-v1/bin/tool" -> "bin/tool".
// Returns an empty string when nothing remains ("pkg-v1/", "pkg-v1").
std::string strip_path_components(const std::string& path, size_t count);

// Stream-decompress a .tar.gz file and extract it into dest_dir, dropping
// the first `strip_components` segments of every entry path. Directories,
// regular files and symlinks are materialized; other entry types are skipped.
// An existing symlink at the target path is not an error.
UnpackResult extract_tar_gz(const std::string& archive_path, const std::string& dest_dir,
                            size_t strip_components = 1);

// Extract a .zip file (stored and deflate entries) into dest_dir without
// stripping. Unix permission bits are restored when the archive records them.
UnpackResult extract_zip(const std::string& archive_path, const std::string& dest_dir);

} // namespace relfetch
