// utils.cpp - Common utility function implementations

#include "utils.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils {

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
}

bool sleep_unless(int milliseconds, const std::atomic<bool>& cancel, int slice_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(milliseconds);
    while (!cancel) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(slice_ms)));
    }
    return false;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&now_time), "%F %T");
    return ss.str();
}

std::string file_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&now_time), "%Y%m%d_%H%M%S");
    return ss.str();
}

}
