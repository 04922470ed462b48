/**
 * @file timer.hpp
 * @brief Wall-clock timing for evaluation budgets and run statistics
 */

#pragma once

#include <chrono>

namespace smcpso::utils {

/**
 * @brief Elapsed wall-clock time since start()
 */
class ElapsedTimer {
public:
    using Clock = std::chrono::steady_clock;

    void start() {
        startTime_ = Clock::now();
        running_ = true;
    }

    /**
     * @brief Freeze the elapsed time
     */
    void stop() {
        if (running_) {
            frozen_ = getElapsedSec();
            running_ = false;
        }
    }

    bool isRunning() const { return running_; }

    double getElapsedSec() const {
        if (!running_) return frozen_;
        return std::chrono::duration<double>(Clock::now() - startTime_).count();
    }

    /**
     * @brief Budget check in seconds; a non-positive budget never expires
     */
    bool hasExpired(double budgetSec) const {
        return budgetSec > 0.0 && getElapsedSec() >= budgetSec;
    }

private:
    Clock::time_point startTime_;
    bool running_ = false;
    double frozen_ = 0.0;
};

}  // namespace smcpso::utils
