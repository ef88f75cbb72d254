#include "util/console_progress.hpp"

#include <cstdio>

namespace coldstash {

namespace {
bool g_progress_line_active = false;
} // namespace

std::string ReadableBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        size /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", size, kUnits[unit]);
    return buf;
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string stage(e.stage);
    if (stage != last_stage_) {
        ClearProgressLine();
        last_stage_ = stage;
        next_ = 0;
    }

    const bool finished = e.total > 0 && e.done >= e.total;
    if (e.done < next_ && !finished) return;
    next_ = e.done + min_step_;

    if (e.total > 0) {
        int pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100) pct = 100;
        std::fprintf(stderr,
                     "\r[%.*s] %.*s %3d%% (%s / %s)",
                     (int)e.stage.size(), e.stage.data(),
                     (int)e.subject.size(), e.subject.data(),
                     pct,
                     ReadableBytes(e.done).c_str(),
                     ReadableBytes(e.total).c_str());
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %.*s %s",
                     (int)e.stage.size(), e.stage.data(),
                     (int)e.subject.size(), e.subject.data(),
                     ReadableBytes(e.done).c_str());
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (finished) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace coldstash
