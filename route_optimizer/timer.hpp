#pragma once
#include <chrono>

// Wall-clock budget for one solve. Starts counting on construction.
class SearchTimer {
    using steady_clock = std::chrono::steady_clock;

public:
    explicit SearchTimer(double time_limit_seconds)
        : time_limit(time_limit_seconds), begin(steady_clock::now()) {}

    bool check_time_limit() const { return elapsed_time() >= time_limit; }

    double elapsed_time() const
    {
        return std::chrono::duration<double>(steady_clock::now() - begin).count();
    }

private:
    double time_limit;
    steady_clock::time_point begin;
};
