#include "sbridge/transfer/progress.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace sbridge::transfer {

ProgressSample make_progress_sample(std::uint64_t bytes_transferred,
                                    std::uint64_t total_size,
                                    std::chrono::duration<double> elapsed) {
    ProgressSample sample;
    sample.percent = total_size == 0
        ? 100.0
        : 100.0 * static_cast<double>(bytes_transferred) / static_cast<double>(total_size);
    sample.percent = std::min(sample.percent, 100.0);

    const double seconds = std::max(1e-6, elapsed.count());
    sample.throughput_bytes_per_sec = static_cast<double>(bytes_transferred) / seconds;

    const std::uint64_t remaining = total_size > bytes_transferred ? total_size - bytes_transferred : 0;
    if (sample.throughput_bytes_per_sec > 0.0) {
        sample.eta_seconds = static_cast<double>(remaining) / sample.throughput_bytes_per_sec;
    } else if (remaining == 0) {
        sample.eta_seconds = 0.0;
    }
    return sample;
}

std::string format_eta(const std::optional<double>& seconds) {
    if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0) {
        return "--:--";
    }
    const auto total = static_cast<long long>(*seconds);
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << total / 60 << ':'
        << std::setw(2) << std::setfill('0') << total % 60;
    return oss.str();
}

std::string format_progress_line(std::uint64_t bytes_transferred,
                                 std::uint64_t total_size,
                                 const ProgressSample& sample,
                                 std::size_t bar_width) {
    const auto filled = std::min(bar_width,
        static_cast<std::size_t>(static_cast<double>(bar_width) * sample.percent / 100.0));

    std::ostringstream oss;
    oss << '[' << std::string(filled, '#') << std::string(bar_width - filled, '-') << "] "
        << std::fixed << std::setprecision(2) << std::setw(6) << sample.percent << "% "
        << bytes_transferred << '/' << total_size << " bytes  "
        << std::setw(7) << sample.throughput_bytes_per_sec / 1024.0 << " KB/s ETA "
        << format_eta(sample.eta_seconds);
    return oss.str();
}

} // namespace sbridge::transfer
