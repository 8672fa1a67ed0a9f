// utils.hpp - Common utility functions

#pragma once
#include <atomic>
#include <chrono>
#include <thread>
#include <string>

namespace utils {
    void sleep_ms(int milliseconds);
    // Sleeps in short slices; returns false as soon as cancel is set.
    bool sleep_unless(int milliseconds, const std::atomic<bool>& cancel, int slice_ms = 20);
    std::string timestamp();
    std::string file_timestamp();
}
