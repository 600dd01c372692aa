#pragma once
#include "state_store.hpp"
#include <string>

struct FrontierConfig {
    std::string dir{"./data/frontier"};
    StoreBackend backend{StoreBackend::Auto};
    int port{7100};
    double stall_timeout_s{300.0};
    // 0 disables the stall supervisor.
    double recover_interval_s{60.0};
};

// Environment (FRONTIER_DIR, FRONTIER_BACKEND, FRONTIER_PORT,
// FRONTIER_STALL_TIMEOUT, FRONTIER_RECOVER_INTERVAL) first, then flags
// (--dir, --backend, --port, --stall-timeout, --recover-interval).
// Throws ConfigError for an unknown backend or flag. Durations outside
// [0, 1e8] seconds fall back to their defaults.
FrontierConfig load_config(int argc, char** argv);
