#pragma once

#include "sbridge/core/result.hpp"
#include "sbridge/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace sbridge::config {

struct LinkConfig {
    std::string device;                                  ///< Platform default when empty
    unsigned int baud_rate = 2000000;
    std::chrono::milliseconds read_timeout{1000};        ///< 0 blocks; receiving needs > 0
};

/**
 * @brief Everything the CLI needs to run one session
 *
 * JSON layout (every key optional):
 * {
 *   "link":     { "device": "/dev/ttyUSB0", "baud_rate": 2000000, "read_timeout_ms": 1000 },
 *   "transfer": { "chunk_size": 4096, "handshake_retries": 8, "handshake_backoff_ms": 150,
 *                 "chunk_retries": 5, "chunk_backoff_ms": 50, "stall_timeout_ms": 30000 },
 *   "output_dir": ".",
 *   "log_level": "info"
 * }
 */
struct BridgeConfig {
    LinkConfig link;
    transfer::TransferOptions transfer;
    std::filesystem::path output_dir{"."};
    std::string log_level{"info"};
};

/// Defaults with the platform's default serial device filled in
BridgeConfig default_config();

/// Overlay the keys present in json onto base; unknown keys are ignored
Result<BridgeConfig> config_from_json(const nlohmann::json& json, BridgeConfig base = default_config());

Result<BridgeConfig> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const BridgeConfig& config);

/// Range checks; ConfigError names the first offending key
Result<void> validate(const BridgeConfig& config);

} // namespace sbridge::config
