#pragma once

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

namespace hashsweep {

class Timer {
private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
    bool running_ = false;
    bool started_ = false;

public:
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        running_ = true;
        started_ = true;
    }

    // Returns elapsed seconds; a timer that was never started reads zero.
    double stop() {
        if (running_) {
            end_time_ = std::chrono::steady_clock::now();
            running_ = false;
        }
        return elapsed_seconds();
    }

    double elapsed_seconds() const {
        if (!started_) return 0.0;
        auto end = running_ ? std::chrono::steady_clock::now() : end_time_;
        return std::chrono::duration<double>(end - start_time_).count();
    }

    bool is_running() const { return running_; }

    static std::string format(double seconds) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2);
        if (seconds < 60) {
            ss << seconds << "s";
        } else if (seconds < 3600) {
            int minutes = static_cast<int>(seconds / 60);
            ss << minutes << "m " << (seconds - minutes * 60) << "s";
        } else {
            int hours = static_cast<int>(seconds / 3600);
            int minutes = static_cast<int>((seconds - hours * 3600) / 60);
            ss << hours << "h " << minutes << "m " << (seconds - hours * 3600 - minutes * 60) << "s";
        }
        return ss.str();
    }
};

} // namespace hashsweep
