#include <uaver/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace uaver {

static UaverError config_error(std::string msg, std::string hint,
                               const std::string& origin, const toml::node& at) {
    return UaverError{UaverError::Config, std::move(msg), std::move(hint),
                      origin, static_cast<int>(at.source().begin.line)};
}

static Status parse_engine(const toml::table& engine, Config& cfg,
                           const std::string& origin) {
    if (auto node = engine.get("strategy")) {
        auto name = node->value<std::string>();
        if (!name) {
            return config_error("engine.strategy must be a string",
                                "expected 'ordinal' or 'canonical'", origin, *node);
        }
        auto s = parse_strategy(*name);
        if (s.is_err()) {
            return config_error(s.error().message, s.error().hint, origin, *node);
        }
        cfg.engine.strategy = s.value();
        cfg.strategy_set = true;
    }

    if (auto node = engine.get("semver-parts")) {
        auto parts = node->value<std::int64_t>();
        if (!parts || *parts < 1 || *parts > 4) {
            return config_error("engine.semver-parts must be an integer from 1 to 4",
                                "use 4 to keep a pre-release field", origin, *node);
        }
        cfg.engine.semver_parts = static_cast<int>(*parts);
        cfg.semver_parts_set = true;
    }
    return ok_status();
}

static Status parse_logging(const toml::table& section, Config& cfg,
                            const std::string& origin) {
    if (auto node = section.get("level")) {
        auto name = node->value<std::string>();
        if (!name) {
            return config_error("log.level must be a string", "", origin, *node);
        }
        auto lvl = log::parse_level(*name);
        if (lvl.is_err()) {
            return config_error(lvl.error().message, lvl.error().hint, origin, *node);
        }
        cfg.logging.level = lvl.value();
        cfg.log_level_set = true;
    }

    if (auto node = section.get("color")) {
        auto color = node->value<bool>();
        if (!color) {
            return config_error("log.color must be a boolean", "", origin, *node);
        }
        cfg.logging.color = *color;
        cfg.log_color_set = true;
    }
    return ok_status();
}

static Status parse_constraints(const toml::table& section, Config& cfg,
                                const std::string& origin) {
    for (const auto& [key, val] : section) {
        std::string name(key.str());
        auto text = val.value<std::string>();
        if (!text) {
            return config_error("constraint '" + name + "' must be a string",
                                "e.g. " + name + " = \">=7.0\"", origin, val);
        }
        auto req = VersionReq::parse(*text);
        if (req.is_err()) {
            return config_error("constraint '" + name + "': " + req.error().message,
                                req.error().hint, origin, val);
        }
        cfg.constraints[name] = std::move(req).value();
    }
    return ok_status();
}

static Status parse_version_maps(const toml::table& section, Config& cfg,
                                 const std::string& origin) {
    for (const auto& [key, val] : section) {
        std::string name(key.str());
        auto tbl = val.as_table();
        if (!tbl) {
            return config_error("version-maps." + name + " must be a table",
                                "[version-maps." + name + "]", origin, val);
        }

        VersionMap map(name);
        for (const auto& [from, to] : *tbl) {
            if (auto s = to.value_exact<std::string>()) {
                map.insert(std::string(from.str()), *s);
            } else if (auto n = to.value_exact<std::int64_t>()) {
                map.insert(std::string(from.str()), std::to_string(*n));
            } else {
                return config_error("version-maps." + name + ": value for '" +
                                    std::string(from.str()) + "' must be a string",
                                    "", origin, to);
            }
        }
        cfg.version_maps[name] = std::move(map);
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UaverError{UaverError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [engine] section
    if (auto engine = doc["engine"].as_table()) {
        UAVER_TRY(parse_engine(*engine, cfg, origin));
    }

    // [log] section
    if (auto section = doc["log"].as_table()) {
        UAVER_TRY(parse_logging(*section, cfg, origin));
    }

    // [constraints] section
    if (auto section = doc["constraints"].as_table()) {
        UAVER_TRY(parse_constraints(*section, cfg, origin));
    }

    // [version-maps.<name>] sections
    if (auto section = doc["version-maps"].as_table()) {
        UAVER_TRY(parse_version_maps(*section, cfg, origin));
    }

    log::debug("config%s%s: %zu constraint(s), %zu version map(s)",
               origin.empty() ? "" : " ", origin.c_str(),
               cfg.constraints.size(), cfg.version_maps.size());

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UaverError{UaverError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    // Scalars: other overrides only explicitly-set fields
    if (other.strategy_set) {
        engine.strategy = other.engine.strategy;
        strategy_set = true;
    }
    if (other.semver_parts_set) {
        engine.semver_parts = other.engine.semver_parts;
        semver_parts_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }

    // Named constraints and maps: other overrides this per name
    for (const auto& [k, v] : other.constraints) {
        constraints[k] = v;
    }
    for (const auto& [k, v] : other.version_maps) {
        version_maps[k] = v;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

Result<VersionReq> Config::constraint(const std::string& name) const {
    auto it = constraints.find(name);
    if (it == constraints.end()) {
        return UaverError{UaverError::NotFound,
            "no constraint named '" + name + "'",
            "declare it under [constraints]"};
    }
    return Result<VersionReq>::ok(it->second);
}

Result<VersionMap> Config::version_map(const std::string& name) const {
    auto it = version_maps.find(name);
    if (it == version_maps.end()) {
        return UaverError{UaverError::NotFound,
            "no version map named '" + name + "'",
            "declare it as [version-maps." + name + "]"};
    }
    return Result<VersionMap>::ok(it->second);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.uaver/config.toml";
}

} // namespace uaver
