#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace persevere::infra {

// Tracks part and byte progress of one transfer and reports it through the log.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_parts = 0;
        std::uint64_t processed_parts = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::uint64_t session_bytes = 0; // moved by this process, excludes resumed progress
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true);

    // `done_*` is what an earlier run already finished.
    void set_total(std::uint64_t parts, std::uint64_t bytes,
                   std::uint64_t done_parts = 0, std::uint64_t done_bytes = 0);
    void update(std::uint64_t parts, std::uint64_t bytes);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    // "42.0% | 3/7 parts | 12.5 MB/s | ETA: 00:31"
    [[nodiscard]] auto describe() const -> std::string;

private:
    void report_() const;

    Stats stats_{};
    const bool enabled_;
};

} // namespace persevere::infra
