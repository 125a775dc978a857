#pragma once

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace tootbert::perf {

/// True when TOOTBERT_PERF_REPORT is set to something other than "" or "0".
inline bool reporting_enabled() {
    const char* flag = std::getenv("TOOTBERT_PERF_REPORT");
    return flag != nullptr && *flag != '\0' && *flag != '0';
}

/**
 * Times a scope and, with reporting enabled, writes
 *
 *   [TB_PERF] classify_batch 12.345s (250 records, 20.3/s)
 *
 * to stderr when it ends. The record count is optional. stdout stays
 * reserved for the prediction table.
 */
class PerfTimer {
public:
    explicit PerfTimer(std::string label)
        : label_(std::move(label)), report_(reporting_enabled()), start_(Clock::now()) {}

    ~PerfTimer() {
        if (!report_) return;
        const double secs = elapsed();
        if (records_ > 0 && secs > 0.0) {
            std::fprintf(stderr, "[TB_PERF] %s %.3fs (%zu records, %.1f/s)\n", label_.c_str(),
                         secs, records_, static_cast<double>(records_) / secs);
        } else {
            std::fprintf(stderr, "[TB_PERF] %s %.3fs\n", label_.c_str(), secs);
        }
    }

    PerfTimer(const PerfTimer&) = delete;
    PerfTimer& operator=(const PerfTimer&) = delete;

    void set_records(size_t n) { records_ = n; }

    double elapsed() const {
        return std::chrono::duration<double>(Clock::now() - start_).count();
    }

private:
    using Clock = std::chrono::steady_clock;

    std::string label_;
    bool report_;
    size_t records_ = 0;
    Clock::time_point start_;
};

}  // namespace tootbert::perf
