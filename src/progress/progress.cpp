#include "relfetch/progress.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace relfetch {

double bytes_to_mib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

std::string format_progress_line(const ProgressEvent& event) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "downloading " << event.source << "... " << bytes_to_mib(event.downloaded) << " MiB";
    if (event.total > 0) {
        out << " of " << bytes_to_mib(event.total) << " MiB";
    }
    out << " (" << event.mib_per_sec << " MiB/s)";
    return out.str();
}

ProgressFn default_progress_tracker() {
    return [](const ProgressEvent& event) {
        std::fprintf(stderr, "\r%s", format_progress_line(event).c_str());
        if (event.complete) {
            std::fputc('\n', stderr);
        }
        std::fflush(stderr);
    };
}

} // namespace relfetch
