// cuuid_cli.cpp
//
// Command-line front end for the Crockford UUID codec:
//
//     cuuid gen [-n N] [--v4|--v7] [--group N]
//     cuuid encode <xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx>
//     cuuid decode <crockford>
//     cuuid check <crockford>
//
// Defaults come from ~/.cuuid/config.toml, then ./.cuuid.toml.

#include <cuuid/config.hpp>
#include <cuuid/log.hpp>
#include <cuuid/result.hpp>
#include <cuuid/uuid.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace cuuid;

static const char* usage =
    "usage: cuuid gen [-n N] [--v4|--v7] [--group N]\n"
    "       cuuid encode <hex-uuid>\n"
    "       cuuid decode <crockford>\n"
    "       cuuid check <crockford>";

// Missing files are fine; malformed ones are not.
static Result<std::optional<Config>> load_optional(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    CUUID_TRY(cfg);
    return Result<std::optional<Config>>::ok(cfg.value());
}

static Result<Config> load_config() {
    auto global = load_optional(global_config_path());
    CUUID_TRY(global);
    auto local = load_optional(".cuuid.toml");
    CUUID_TRY(local);
    return Result<Config>::ok(Config::effective(global.value(), local.value()));
}

static Status cmd_gen(const std::vector<std::string>& args, Config cfg) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--v4") {
            cfg.generate_version = 4;
        } else if (a == "--v7") {
            cfg.generate_version = 7;
        } else if (a == "-n" && i + 1 < args.size()) {
            auto n = parse_int_option(a, args[++i], min_generate_count, max_generate_count);
            CUUID_TRY(n);
            cfg.generate_count = n.value();
        } else if (a == "--group" && i + 1 < args.size()) {
            auto n = parse_int_option(a, args[++i], 0, max_render_group);
            CUUID_TRY(n);
            cfg.render_group = n.value();
        } else {
            return CuuidError{CuuidError::InvalidArg,
                "unexpected argument '" + a + "' for gen", usage};
        }
    }

    log::debug("generating %d v%d identifier(s)", cfg.generate_count, cfg.generate_version);
    for (int i = 0; i < cfg.generate_count; ++i) {
        Uuid u = cfg.generate_version == 7 ? Uuid::generate_ordered()
                                           : Uuid::generate_random();
        std::cout << u.format_grouped(static_cast<size_t>(cfg.render_group)) << "\n";
    }
    return ok_status();
}

static Status cmd_encode(const std::string& hex, const Config& cfg) {
    auto u = Uuid::from_uuid_string(hex);
    CUUID_TRY(u);
    std::cout << u.value().format_grouped(static_cast<size_t>(cfg.render_group)) << "\n";
    return ok_status();
}

static Status cmd_decode(const std::string& text) {
    auto u = Uuid::from_string(text);
    CUUID_TRY(u);
    std::cout << u.value().to_uuid_string() << "\n";
    if (auto ts = u.value().timestamp_ms()) {
        log::info("version 7, timestamp %llu ms", static_cast<unsigned long long>(*ts));
    }
    return ok_status();
}

static Status cmd_check(const std::string& text) {
    auto canonical = crockford::canonicalize(text);
    CUUID_TRY(canonical);
    if (canonical.value() != text) {
        log::info("canonical form: %s", canonical.value().c_str());
    }
    return ok_status();
}

static Status run(int argc, char** argv) {
    if (argc < 2) {
        return CuuidError{CuuidError::InvalidArg, "no command given", usage};
    }

    auto cfg = load_config();
    CUUID_TRY(cfg);
    cfg.value().apply_logging();

    std::string cmd = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (cmd == "gen") return cmd_gen(args, cfg.value());

    if (args.size() != 1) {
        return CuuidError{CuuidError::InvalidArg,
            "'" + cmd + "' takes exactly one argument", usage};
    }
    if (cmd == "encode") return cmd_encode(args[0], cfg.value());
    if (cmd == "decode") return cmd_decode(args[0]);
    if (cmd == "check") return cmd_check(args[0]);

    return CuuidError{CuuidError::InvalidArg, "unknown command '" + cmd + "'", usage};
}

int main(int argc, char** argv) {
    auto status = run(argc, argv);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
