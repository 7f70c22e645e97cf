#pragma once

#include <cuuid/log.hpp>
#include <cuuid/result.hpp>
#include <optional>
#include <string>

namespace cuuid {

// Tool configuration, layered global -> local (local wins).
//
//   [log]       level = "info", color = true
//   [generate]  version = 4 | 7, count = N
//   [render]    group = 0 (canonical) or N (hyphen every N symbols)
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    int generate_version = 4;
    int generate_count = 1;
    int render_group = 0;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool generate_version_set = false;
    bool generate_count_set = false;
    bool render_group_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push log settings into cuuid::log; unset fields are left alone
    void apply_logging() const;
};

// Accepted ranges, shared by the TOML keys and the CLI flags
inline constexpr int min_generate_count = 1;
inline constexpr int max_generate_count = 1000000;
inline constexpr int max_render_group = 26;

// Parse a decimal integer within [min, max]; InvalidArg otherwise.
// `name` identifies the option in the error message.
Result<int> parse_int_option(const std::string& name, const std::string& raw,
                             int min, int max);

// ~/.cuuid/config.toml, or empty when no home directory is known
std::string global_config_path();

} // namespace cuuid
