#pragma once

#include <uaver/result.hpp>
#include <uaver/constraint.hpp>
#include <uaver/log.hpp>
#include <uaver/version_map.hpp>
#include <map>
#include <optional>
#include <string>

namespace uaver {

struct EngineConfig {
    Strategy strategy = Strategy::Canonical;
    int semver_parts = 3;  // 1..4
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: global > local
// Lower layers override higher layers (local wins over global)
struct Config {
    EngineConfig engine;
    LogConfig logging;
    // Track which scalar fields were explicitly set (for merge)
    bool strategy_set = false;
    bool semver_parts_set = false;
    bool log_level_set = false;
    bool log_color_set = false;
    std::map<std::string, VersionReq> constraints;
    std::map<std::string, VersionMap> version_maps;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; `origin` names the source in errors
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "");

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    Result<VersionReq> constraint(const std::string& name) const;
    Result<VersionMap> version_map(const std::string& name) const;
};

// Discover the global config file path: ~/.uaver/config.toml
std::string global_config_path();

} // namespace uaver
