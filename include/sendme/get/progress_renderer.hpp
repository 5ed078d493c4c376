#pragma once

#include "sendme/get/progress_reducer.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace sendme::get {

/// "999 B", "1.50 KiB", "3.00 GiB"
std::string human_bytes(std::uint64_t bytes);

/// "0 seconds", "1 second", "12 minutes", "2 hours"
std::string human_duration(std::chrono::nanoseconds duration);

/// "Transferred 1.00 MiB in 2 seconds, 512.00 KiB/s"
std::string format_summary(const TransferSummary& summary);

/**
 * @brief Draws a ProgressState as two bars on a terminal stream
 *
 * On a terminal the overall and current-item bars are redrawn in place;
 * on anything else only phase changes are written, one line each.
 */
class ProgressRenderer {
public:
    explicit ProgressRenderer(std::FILE* out = stderr);

    void render(const ProgressState& state);

    /// Erase the bars and, if the transfer finished, print the summary line.
    void finish(const ProgressState& state);

    static std::string phase_message(const ProgressState& state);
    static std::string bar(std::uint64_t position, std::uint64_t length, std::size_t width);

private:
    void clear();

    std::FILE* out_;
    bool interactive_;
    int lines_drawn_ = 0;
    std::string last_message_;
    std::chrono::steady_clock::time_point started_{std::chrono::steady_clock::now()};
};

} // namespace sendme::get
