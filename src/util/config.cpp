#include <cuuid/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cuuid {

static CuuidError config_error(const std::string& msg, const std::string& hint) {
    return CuuidError{CuuidError::Config, msg, hint};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return CuuidError{CuuidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log]
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            CUUID_TRY(lvl);
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [generate]
    if (auto gen = doc["generate"].as_table()) {
        if (auto v = (*gen)["version"].value<int64_t>()) {
            if (*v != 4 && *v != 7) {
                return config_error(
                    "unsupported generate.version " + std::to_string(*v),
                    "use 4 (random) or 7 (time-ordered)");
            }
            cfg.generate_version = static_cast<int>(*v);
            cfg.generate_version_set = true;
        }
        if (auto v = (*gen)["count"].value<int64_t>()) {
            if (*v < min_generate_count || *v > max_generate_count) {
                return config_error(
                    "generate.count out of range: " + std::to_string(*v),
                    "count must be between 1 and 1000000");
            }
            cfg.generate_count = static_cast<int>(*v);
            cfg.generate_count_set = true;
        }
    }

    // [render]
    if (auto render = doc["render"].as_table()) {
        if (auto v = (*render)["group"].value<int64_t>()) {
            if (*v < 0 || *v > max_render_group) {
                return config_error(
                    "render.group out of range: " + std::to_string(*v),
                    "group must be between 0 and 26 (0 = canonical)");
            }
            cfg.render_group = static_cast<int>(*v);
            cfg.render_group_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CuuidError{CuuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
        return cfg;
    }
    log::debug("loaded config %s", path.c_str());
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.generate_version_set) {
        generate_version = other.generate_version;
        generate_version_set = true;
    }
    if (other.generate_count_set) {
        generate_count = other.generate_count;
        generate_count_set = true;
    }
    if (other.render_group_set) {
        render_group = other.render_group;
        render_group_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

Result<int> parse_int_option(const std::string& name, const std::string& raw,
                             int min, int max) {
    std::string range = std::to_string(min) + ".." + std::to_string(max);
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(raw.c_str(), &end, 10);
    if (raw.empty() || *end != '\0' || errno == ERANGE) {
        return CuuidError{CuuidError::InvalidArg,
            "invalid value '" + raw + "' for " + name,
            "expected an integer in " + range};
    }
    if (v < min || v > max) {
        return CuuidError{CuuidError::InvalidArg,
            name + " out of range: " + raw,
            "expected an integer in " + range};
    }
    return Result<int>::ok(static_cast<int>(v));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.cuuid/config.toml";
}

} // namespace cuuid
