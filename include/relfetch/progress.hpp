#pragma once

#include "relfetch/types.hpp"

#include <cstdint>
#include <string>

namespace relfetch {

// ============================================================================
// Progress Rendering
// ============================================================================

// "downloading <source>... <n> MiB of <m> MiB (<r> MiB/s)"; the total is
// omitted when unknown
std::string format_progress_line(const ProgressEvent& event);

double bytes_to_mib(uint64_t bytes);

// Rewrites a single stderr line per event and ends it on completion
ProgressFn default_progress_tracker();

} // namespace relfetch
