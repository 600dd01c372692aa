#include "config.hpp"
#include "util.hpp"
#include <cmath>
#include <iostream>

// Upper bound for durations handed to the sweeper's millisecond timer.
static constexpr double kMaxSeconds = 1e8;

static double parse_seconds(const std::string& flag, const std::string& v, double def) {
    try {
        double s = std::stod(v);
        if (std::isfinite(s) && s >= 0) return s;
        std::cerr << "[frontier] Ignoring out-of-range " << flag << " " << v << ", using " << def << std::endl;
    } catch (const std::exception&) {
        std::cerr << "[frontier] Ignoring invalid " << flag << " " << v << ", using " << def << std::endl;
    }
    return def;
}

static double bounded_seconds(const char* name, double v, double def) {
    if (v >= 0 && v <= kMaxSeconds) return v;
    std::cerr << "[frontier] " << name << " " << v << " out of range, using " << def << std::endl;
    return def;
}

FrontierConfig load_config(int argc, char** argv) {
    FrontierConfig cfg;
    cfg.dir = getenv_or("FRONTIER_DIR", cfg.dir);
    cfg.backend = parse_backend(getenv_or("FRONTIER_BACKEND", backend_name(cfg.backend)));
    cfg.port = getenv_int_or("FRONTIER_PORT", cfg.port);
    cfg.stall_timeout_s = getenv_double_or("FRONTIER_STALL_TIMEOUT", cfg.stall_timeout_s);
    cfg.recover_interval_s = getenv_double_or("FRONTIER_RECOVER_INTERVAL", cfg.recover_interval_s);

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--dir" && i + 1 < argc) cfg.dir = argv[++i];
        else if (a == "--backend" && i + 1 < argc) cfg.backend = parse_backend(argv[++i]);
        else if (a == "--port" && i + 1 < argc) {
            std::string v = argv[++i];
            try {
                cfg.port = std::stoi(v);
            } catch (const std::exception&) {
                std::cerr << "[frontier] Ignoring invalid --port " << v << ", using " << cfg.port << std::endl;
            }
        }
        else if (a == "--stall-timeout" && i + 1 < argc) cfg.stall_timeout_s = parse_seconds(a, argv[++i], cfg.stall_timeout_s);
        else if (a == "--recover-interval" && i + 1 < argc) cfg.recover_interval_s = parse_seconds(a, argv[++i], cfg.recover_interval_s);
        else throw ConfigError("unknown or incomplete argument: " + a);
    }

    if (cfg.port < 0 || cfg.port > 65535) {
        std::cerr << "[frontier] Port " << cfg.port << " out of range, using 7100" << std::endl;
        cfg.port = 7100;
    }
    cfg.stall_timeout_s = bounded_seconds("stall timeout", cfg.stall_timeout_s, 300.0);
    cfg.recover_interval_s = bounded_seconds("recover interval", cfg.recover_interval_s, 60.0);
    return cfg;
}
