#pragma once
#include "frontier_queue.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

// Calls FrontierQueue::recover_stalled on a fixed interval from a background
// thread until stop().
class StallSupervisor {
public:
    StallSupervisor(FrontierQueue& queue, std::chrono::milliseconds interval, double stall_timeout_s);
    ~StallSupervisor();

    void start();
    void stop();
    std::size_t sweeps() const;

private:
    void run();

    FrontierQueue& queue_;
    std::chrono::milliseconds interval_;
    double stall_timeout_s_;
    std::thread worker_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::size_t sweeps_{0};
};
