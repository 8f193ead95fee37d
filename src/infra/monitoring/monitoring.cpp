#include "monitoring.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <cmath>

namespace persevere::infra {

ProgressMonitor::ProgressMonitor(bool enabled)
    : enabled_(enabled)
{
    stats_.start_time = std::chrono::steady_clock::now();
}

void ProgressMonitor::set_total(std::uint64_t parts, std::uint64_t bytes,
                                std::uint64_t done_parts, std::uint64_t done_bytes) {
    stats_.total_parts = parts;
    stats_.total_bytes = bytes;
    stats_.processed_parts = done_parts;
    stats_.processed_bytes = done_bytes;
    stats_.session_bytes = 0;
    stats_.start_time = std::chrono::steady_clock::now();
}

void ProgressMonitor::update(std::uint64_t parts, std::uint64_t bytes) {
    stats_.processed_parts += parts;
    stats_.processed_bytes += bytes;
    stats_.session_bytes += bytes;
    report_();
}

auto ProgressMonitor::get_stats() const -> Stats {
    return stats_;
}

auto ProgressMonitor::describe() const -> std::string {
    const auto& stats = stats_;

    const double progress = stats.total_bytes > 0
        ? 100.0 * static_cast<double>(stats.processed_bytes) / static_cast<double>(stats.total_bytes)
        : 0.0;

    // Throughput only counts what this process moved, resumed parts took no time here.
    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double bytes_per_sec = elapsed_sec > 0 ? static_cast<double>(stats.session_bytes) / elapsed_sec : 0.0;

    double eta_sec = 0.0;
    if (bytes_per_sec > 0) {
        eta_sec = static_cast<double>(stats.total_bytes - stats.processed_bytes) / bytes_per_sec;
    }

    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024.0 * 1024 * 1024) { speed /= 1024.0 * 1024 * 1024; unit = "GB/s"; }
    else if (speed > 1024.0 * 1024) { speed /= 1024.0 * 1024; unit = "MB/s"; }
    else if (speed > 1024.0) { speed /= 1024.0; unit = "KB/s"; }

    std::string eta_str = "inf";
    if (stats.processed_bytes >= stats.total_bytes) {
        eta_str = "00:00";
    } else if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    return fmt::format("{:.1f}% | {}/{} parts | {:.1f} {} | ETA: {}",
                       progress,
                       stats.processed_parts, stats.total_parts,
                       speed, unit,
                       eta_str);
}

void ProgressMonitor::report_() const {
    if (!enabled_) return;
    spdlog::info("Progress: {}", describe());
}

} // namespace persevere::infra
