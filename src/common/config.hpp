//
// Created by cv2 on 15.01.2026.
//

#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace comb {

    enum class ConfigError {
        NotFound,
        ParseFailed,
        InvalidValue
    };

    std::string_view to_string(ConfigError e);

    struct BalancerConfig {
        uint32_t cooldown_ms = 200;
        uint32_t max_operations = 5;
        uint32_t contention_step_ms = 50;
        uint32_t busy_backoff_ms = 50;
    };

    struct Config {
        // Bot tokens of the chunk store API, one per rate-limited account
        std::vector<std::string> credentials;
        std::string channel_id;

        std::string gateway_endpoint = "tcp://127.0.0.1:7100";
        std::string ipc_endpoint = "tcp://127.0.0.1:9002";
        std::filesystem::path download_dir = "downloads";
        // SQLite catalog of uploaded files
        std::filesystem::path catalog_path = "comb.db";

        uint32_t max_concurrent_uploads = 3;
        uint32_t max_concurrent_downloads = 3;
        uint32_t scheduler_workers = 4;
        uint64_t chunk_size = 4 * 1024 * 1024;

        BalancerConfig balancer;
    };

    // Keys missing from the document keep their defaults
    std::expected<Config, ConfigError> parse_config(const nlohmann::json& j);
    std::expected<Config, ConfigError> load_config(const std::filesystem::path& path);

} // namespace comb
