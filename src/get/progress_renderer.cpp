#include "sendme/get/progress_renderer.hpp"

#include <spdlog/fmt/fmt.h>

#include <unistd.h>

#include <algorithm>
#include <iterator>

namespace sendme::get {

namespace {

constexpr std::size_t kBarWidth = 40;

std::string elapsed_precise(std::chrono::steady_clock::duration elapsed) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

std::string plural(std::uint64_t value, const char* unit) {
    return fmt::format("{} {}{}", value, unit, value == 1 ? "" : "s");
}

} // namespace

std::string human_bytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

std::string human_duration(std::chrono::nanoseconds duration) {
    using namespace std::chrono;
    const auto secs = duration_cast<seconds>(duration).count();
    if (secs < 60) {
        return plural(static_cast<std::uint64_t>(secs), "second");
    }
    if (secs < 3600) {
        return plural(static_cast<std::uint64_t>(secs / 60), "minute");
    }
    if (secs < 86400) {
        return plural(static_cast<std::uint64_t>(secs / 3600), "hour");
    }
    return plural(static_cast<std::uint64_t>(secs / 86400), "day");
}

std::string format_summary(const TransferSummary& summary) {
    return fmt::format("Transferred {} in {}, {}/s",
                       human_bytes(summary.total_bytes),
                       human_duration(summary.elapsed),
                       human_bytes(summary.bytes_per_second));
}

ProgressRenderer::ProgressRenderer(std::FILE* out)
    : out_(out), interactive_(out != nullptr && ::isatty(::fileno(out)) == 1) {}

std::string ProgressRenderer::phase_message(const ProgressState& state) {
    switch (state.phase) {
        case TransferPhase::Connecting:
            return "[1/3] Connecting ...";
        case TransferPhase::Requesting:
        case TransferPhase::EnumeratingOrSingleItem:
            return "[2/3] Requesting ...";
        case TransferPhase::ReceivingCollection:
            return fmt::format("[3/3] Downloading {} blob(s)", state.overall.length);
        case TransferPhase::ReceivingSingleItem:
            return "[3/3] Downloading 1 blob";
        case TransferPhase::Finished:
            return "Done";
        case TransferPhase::Aborted:
            return "Aborted";
    }
    return {};
}

std::string ProgressRenderer::bar(std::uint64_t position, std::uint64_t length, std::size_t width) {
    if (length == 0) {
        return std::string(width, position > 0 ? '#' : '-');
    }
    const auto clamped = std::min(position, length);
    const auto filled = static_cast<std::size_t>((static_cast<double>(clamped) / static_cast<double>(length)) * width);
    std::string out(filled, '#');
    if (filled < width) {
        out.push_back('>');
        out.append(width - filled - 1, '-');
    }
    return out;
}

void ProgressRenderer::clear() {
    if (!interactive_ || lines_drawn_ == 0) {
        return;
    }
    // Move to the first drawn line, clearing each on the way.
    std::fputs("\r\033[2K", out_);
    for (int i = 1; i < lines_drawn_; ++i) {
        std::fputs("\033[1A\r\033[2K", out_);
    }
    lines_drawn_ = 0;
}

void ProgressRenderer::render(const ProgressState& state) {
    if (out_ == nullptr) {
        return;
    }
    const auto message = phase_message(state);

    if (!interactive_) {
        if (message != last_message_) {
            fmt::print(out_, "{}\n", message);
            last_message_ = message;
        }
        return;
    }

    clear();
    const auto elapsed = elapsed_precise(std::chrono::steady_clock::now() - started_);
    std::string frame = message;
    int lines = 1;
    if (state.overall.visible) {
        frame += fmt::format("\n[{}] [{}] {}/{}", elapsed,
                             bar(state.overall.position, state.overall.length, kBarWidth),
                             state.overall.position, state.overall.length);
        ++lines;
    }
    if (state.current.visible) {
        frame += fmt::format("\n[{}] [{}] {}/{}", elapsed,
                             bar(state.current.position, state.current.length, kBarWidth),
                             human_bytes(state.current.position), human_bytes(state.current.length));
        ++lines;
    }
    std::fputs(frame.c_str(), out_);
    std::fflush(out_);
    lines_drawn_ = lines;
    last_message_ = message;
}

void ProgressRenderer::finish(const ProgressState& state) {
    if (out_ == nullptr) {
        return;
    }
    clear();
    if (state.summary) {
        fmt::print(out_, "{}\n", format_summary(*state.summary));
    }
    std::fflush(out_);
}

} // namespace sendme::get
