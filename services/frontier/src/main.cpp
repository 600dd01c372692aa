#include "config.hpp"
#include "frontier_queue.hpp"
#include "frontier_server.hpp"
#include "supervisor.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>

int main(int argc, char** argv) {
    // Block before any thread starts so the daemon and sweeper threads inherit
    // the mask and only sigwait() below sees the signals.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    FrontierConfig cfg;
    std::unique_ptr<FrontierQueue> queue;
    try {
        cfg = load_config(argc, argv);
        queue = std::make_unique<FrontierQueue>(cfg.dir, cfg.backend);
    } catch (const ConfigError& e) {
        std::cerr << "[frontier] " << e.what() << std::endl;
        return 1;
    } catch (const StoreError& e) {
        std::cerr << "[frontier] Failed to open queue at " << cfg.dir << ": " << e.what() << std::endl;
        return 1;
    }

    FrontierServer server(*queue);
    std::cout << "[frontier] Starting HTTP server on port " << cfg.port << "...\n";
    if (!server.start(cfg.port)) {
        std::cerr << "[frontier] Failed to start HTTP server" << std::endl;
        return 1;
    }

    std::unique_ptr<StallSupervisor> supervisor;
    if (cfg.recover_interval_s > 0) {
        // load_config bounds the interval, so the cast cannot overflow.
        auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(cfg.recover_interval_s));
        if (interval < std::chrono::milliseconds(1)) interval = std::chrono::milliseconds(1);
        supervisor = std::make_unique<StallSupervisor>(*queue, interval, cfg.stall_timeout_s);
        supervisor->start();
        std::cout << "[frontier] Stall sweep every " << cfg.recover_interval_s << "s, timeout "
                  << cfg.stall_timeout_s << "s\n";
    }

    int sig = 0;
    sigwait(&stop_signals, &sig);
    std::cout << "[frontier] Signal " << sig << ", shutting down" << std::endl;

    server.stop();
    if (supervisor) supervisor->stop();
    queue->close();
    return 0;
}
