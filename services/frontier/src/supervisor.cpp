#include "supervisor.hpp"
#include <iostream>

StallSupervisor::StallSupervisor(FrontierQueue& queue, std::chrono::milliseconds interval, double stall_timeout_s)
    : queue_(queue), interval_(interval), stall_timeout_s_(stall_timeout_s) {}

StallSupervisor::~StallSupervisor() {
    stop();
}

void StallSupervisor::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (worker_.joinable()) return;
    stopping_ = false;
    worker_ = std::thread(&StallSupervisor::run, this);
}

void StallSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

std::size_t StallSupervisor::sweeps() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sweeps_;
}

void StallSupervisor::run() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) return;
        }
        try {
            queue_.recover_stalled(stall_timeout_s_);
        } catch (const std::exception& e) {
            // The next tick retries; the failed sweep changed nothing.
            std::cerr << "[frontier] stall sweep failed: " << e.what() << std::endl;
        }
        std::lock_guard<std::mutex> lock(mtx_);
        ++sweeps_;
    }
}
