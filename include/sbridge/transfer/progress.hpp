#pragma once

#include "sbridge/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sbridge::transfer {

/**
 * @brief Compute percent, throughput and ETA
 *
 * A zero total counts as 100%. Elapsed time is clamped to one microsecond so
 * a sample taken immediately after start does not divide by zero. The ETA is
 * empty while throughput is zero.
 */
ProgressSample make_progress_sample(std::uint64_t bytes_transferred,
                                    std::uint64_t total_size,
                                    std::chrono::duration<double> elapsed);

/// "mm:ss", or "--:--" when unknown
std::string format_eta(const std::optional<double>& seconds);

/// "[#####-----]  50.00% 5000/10000 bytes   12.34 KB/s ETA 00:03"
std::string format_progress_line(std::uint64_t bytes_transferred,
                                 std::uint64_t total_size,
                                 const ProgressSample& sample,
                                 std::size_t bar_width = 34);

} // namespace sbridge::transfer
