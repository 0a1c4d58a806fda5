#include "sbridge/config/config.hpp"
#include "sbridge/core/platform.hpp"
#include "sbridge/protocol/frame.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <stdexcept>

namespace sbridge::config {
using json = nlohmann::json;

namespace {

std::chrono::milliseconds millis(const json& object, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(object.value(key, static_cast<long long>(fallback.count())));
}

/// Counts and sizes are read signed so a negative value is rejected instead of wrapping
template <typename T>
T unsigned_field(const json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer");
    }
    const auto value = it->get<long long>();
    if (value < 0 || static_cast<unsigned long long>(value) > std::numeric_limits<T>::max()) {
        throw std::out_of_range(std::string(key) + " out of range: " + it->dump());
    }
    return static_cast<T>(value);
}

} // namespace

BridgeConfig default_config() {
    BridgeConfig config;
    config.link.device = default_serial_device();
    return config;
}

Result<BridgeConfig> config_from_json(const json& j, BridgeConfig base) {
    if (!j.is_object()) {
        return Err<BridgeConfig>(ErrorCode::ConfigError, "configuration root must be an object");
    }

    try {
        if (auto it = j.find("link"); it != j.end()) {
            const auto& link = *it;
            base.link.device = link.value("device", base.link.device);
            base.link.baud_rate = unsigned_field(link, "baud_rate", base.link.baud_rate);
            base.link.read_timeout = millis(link, "read_timeout_ms", base.link.read_timeout);
        }

        if (auto it = j.find("transfer"); it != j.end()) {
            const auto& t = *it;
            base.transfer.chunk_size = unsigned_field(t, "chunk_size", base.transfer.chunk_size);
            base.transfer.handshake_retries = unsigned_field(t, "handshake_retries", base.transfer.handshake_retries);
            base.transfer.handshake_backoff = millis(t, "handshake_backoff_ms", base.transfer.handshake_backoff);
            base.transfer.chunk_retries = unsigned_field(t, "chunk_retries", base.transfer.chunk_retries);
            base.transfer.chunk_backoff = millis(t, "chunk_backoff_ms", base.transfer.chunk_backoff);
            base.transfer.stall_timeout = millis(t, "stall_timeout_ms", base.transfer.stall_timeout);
        }

        base.output_dir = j.value("output_dir", base.output_dir.string());
        base.log_level = j.value("log_level", base.log_level);
    } catch (const json::exception& e) {
        return Err<BridgeConfig>(ErrorCode::ConfigError, std::string("invalid configuration value: ") + e.what());
    } catch (const std::logic_error& e) {
        return Err<BridgeConfig>(ErrorCode::ConfigError, std::string("invalid configuration value: ") + e.what());
    }

    return Ok(std::move(base));
}

Result<BridgeConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<BridgeConfig>(ErrorCode::ConfigError, "Cannot open config file: " + path.string());
    }

    auto parsed = json::parse(input, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<BridgeConfig>(ErrorCode::ConfigError, "Invalid JSON in " + path.string());
    }

    auto config = config_from_json(parsed);
    if (config.is_error()) {
        return config;
    }
    if (auto valid = validate(config.value()); valid.is_error()) {
        return Err<BridgeConfig>(valid.error());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

json config_to_json(const BridgeConfig& config) {
    json j;
    j["link"] = {
        {"device", config.link.device},
        {"baud_rate", config.link.baud_rate},
        {"read_timeout_ms", config.link.read_timeout.count()}
    };
    j["transfer"] = {
        {"chunk_size", config.transfer.chunk_size},
        {"handshake_retries", config.transfer.handshake_retries},
        {"handshake_backoff_ms", config.transfer.handshake_backoff.count()},
        {"chunk_retries", config.transfer.chunk_retries},
        {"chunk_backoff_ms", config.transfer.chunk_backoff.count()},
        {"stall_timeout_ms", config.transfer.stall_timeout.count()}
    };
    j["output_dir"] = config.output_dir.string();
    j["log_level"] = config.log_level;
    return j;
}

Result<void> validate(const BridgeConfig& config) {
    if (config.link.device.empty()) {
        return Err<void>(ErrorCode::ConfigError, "link.device must not be empty");
    }
    if (config.link.baud_rate == 0) {
        return Err<void>(ErrorCode::ConfigError, "link.baud_rate must be positive");
    }
    if (config.link.read_timeout.count() < 0) {
        return Err<void>(ErrorCode::ConfigError, "link.read_timeout_ms must not be negative");
    }
    if (config.transfer.chunk_size == 0 || config.transfer.chunk_size > protocol::kMaxChunkPayload) {
        return Err<void>(ErrorCode::ConfigError, "transfer.chunk_size must be within 1..65535");
    }
    if (config.transfer.handshake_retries == 0) {
        return Err<void>(ErrorCode::ConfigError, "transfer.handshake_retries must be at least 1");
    }
    if (config.transfer.chunk_retries == 0) {
        return Err<void>(ErrorCode::ConfigError, "transfer.chunk_retries must be at least 1");
    }
    if (config.transfer.handshake_backoff.count() < 0 || config.transfer.chunk_backoff.count() < 0) {
        return Err<void>(ErrorCode::ConfigError, "transfer backoff values must not be negative");
    }
    if (config.transfer.stall_timeout.count() <= 0) {
        return Err<void>(ErrorCode::ConfigError, "transfer.stall_timeout_ms must be positive");
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<void>(ErrorCode::ConfigError, "log_level not recognised: " + config.log_level);
    }
    return Ok();
}

} // namespace sbridge::config
