//
// Created by cv2 on 15.01.2026.
//

#include "config.hpp"
#include <fstream>
#include <print>

namespace comb {

using json = nlohmann::json;

std::string_view to_string(ConfigError e) {
    switch (e) {
        case ConfigError::NotFound:     return "config file not found";
        case ConfigError::ParseFailed:  return "config is not valid JSON";
        case ConfigError::InvalidValue: return "config has an invalid value";
    }
    return "unknown";
}

template <typename T>
static void read_opt(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}

std::expected<Config, ConfigError> parse_config(const json& j) {
    if (!j.is_object()) return std::unexpected(ConfigError::InvalidValue);

    Config cfg;
    try {
        read_opt(j, "credentials", cfg.credentials);
        read_opt(j, "channel_id", cfg.channel_id);
        read_opt(j, "gateway_endpoint", cfg.gateway_endpoint);
        read_opt(j, "ipc_endpoint", cfg.ipc_endpoint);
        read_opt(j, "max_concurrent_uploads", cfg.max_concurrent_uploads);
        read_opt(j, "max_concurrent_downloads", cfg.max_concurrent_downloads);
        read_opt(j, "scheduler_workers", cfg.scheduler_workers);
        read_opt(j, "chunk_size", cfg.chunk_size);

        std::string dir;
        read_opt(j, "download_dir", dir);
        if (!dir.empty()) cfg.download_dir = dir;

        std::string catalog;
        read_opt(j, "catalog_path", catalog);
        if (!catalog.empty()) cfg.catalog_path = catalog;

        if (j.contains("balancer")) {
            const auto& b = j.at("balancer");
            read_opt(b, "cooldown_ms", cfg.balancer.cooldown_ms);
            read_opt(b, "max_operations", cfg.balancer.max_operations);
            read_opt(b, "contention_step_ms", cfg.balancer.contention_step_ms);
            read_opt(b, "busy_backoff_ms", cfg.balancer.busy_backoff_ms);
        }
    } catch (const json::exception& e) {
        std::println(stderr, "[Config] Bad value: {}", e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }

    if (cfg.chunk_size == 0 || cfg.max_concurrent_uploads == 0 ||
        cfg.max_concurrent_downloads == 0 || cfg.scheduler_workers == 0 ||
        cfg.balancer.max_operations == 0) {
        return std::unexpected(ConfigError::InvalidValue);
    }

    return cfg;
}

std::expected<Config, ConfigError> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) return std::unexpected(ConfigError::NotFound);

    try {
        return parse_config(json::parse(in));
    } catch (const json::parse_error& e) {
        std::println(stderr, "[Config] Parse error in {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::ParseFailed);
    }
}

} // namespace comb
