#pragma once

#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <utility>

namespace tootbert {
namespace common {

/// "42s", "7m" or "1h 5m".
inline std::string format_eta(long long seconds) {
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m";
    }
    return std::to_string(seconds / 3600) + "h " + std::to_string((seconds % 3600) / 60) + "m";
}

/**
 * Record counter drawn on one rewritten stderr line while a FASTA file is
 * classified or embedded:
 *
 *   [########........]  40% (20/50) 1 problem sequences [ETA: 3m]
 *
 * Drive it from the thread that consumes outcomes.
 */
class ProgressBar {
public:
    explicit ProgressBar(int total, std::string label = "", int width = 20,
                         std::ostream& out = std::cerr)
        : total_(total < 1 ? 1 : total),
          label_(std::move(label)),
          width_(width),
          out_(out),
          started_(std::chrono::steady_clock::now()) {}

    /// One more record done; `problem` marks it as a problem record.
    void tick(bool problem = false) {
        if (done_) return;
        if (problem) ++problems_;
        if (seen_ < total_) ++seen_;
        draw();
    }

    void finish() {
        if (done_) return;
        seen_ = total_;
        draw();
        out_ << '\n';
        done_ = true;
    }

    int current() const { return seen_; }
    int total() const { return total_; }
    int problems() const { return problems_; }
    bool is_finished() const { return done_; }

    std::string line() const {
        const int filled = (seen_ * width_ + total_ / 2) / total_;
        const int percent = (seen_ * 100) / total_;

        char counts[64];
        std::snprintf(counts, sizeof(counts), "] %3d%% (%d/%d)", percent, seen_, total_);

        std::string text = "[";
        text.append(static_cast<size_t>(filled), '#');
        text.append(static_cast<size_t>(width_ - filled), '.');
        text += counts;

        if (problems_ > 0) {
            text += " " + std::to_string(problems_) + (problems_ == 1 ? " problem" : " problems");
        }
        if (!label_.empty()) {
            text += " " + label_;
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::steady_clock::now() - started_)
                                 .count();
        if (elapsed > 5 && seen_ > 0 && seen_ < total_) {
            const long long left =
                static_cast<long long>(elapsed) * (total_ - seen_) / seen_;
            text += " [ETA: " + format_eta(left) + "]";
        }
        return text;
    }

private:
    void draw() {
        // pad so a shorter line overwrites a longer one
        out_ << '\r' << line() << "   " << std::flush;
    }

    int total_;
    int seen_ = 0;
    int problems_ = 0;
    std::string label_;
    int width_;
    std::ostream& out_;
    bool done_ = false;
    std::chrono::steady_clock::time_point started_;
};

/// Calls finish() on scope exit, so an aborted run still ends the line.
class ScopedProgressBar {
public:
    template <typename... Args>
    explicit ScopedProgressBar(Args&&... args) : bar_(std::forward<Args>(args)...) {}

    ~ScopedProgressBar() { bar_.finish(); }

    ScopedProgressBar(const ScopedProgressBar&) = delete;
    ScopedProgressBar& operator=(const ScopedProgressBar&) = delete;

    ProgressBar& get() { return bar_; }
    void tick(bool problem = false) { bar_.tick(problem); }

private:
    ProgressBar bar_;
};

}  // namespace common
}  // namespace tootbert
