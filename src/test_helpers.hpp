// test_helpers.hpp - shared pieces for the standalone test programs

#pragma once
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "hardware/car_interface.hpp"

inline void printTestHeader(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n";
}

inline bool printResult(bool success) {
    std::cout << "RESULT: " << (success ? "✓ PASS" : "✗ FAIL") << "\n";
    return success;
}

inline int printSummary(int passed, int total) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << passed << "/" << total << " TESTS PASSED\n";
    std::cout << std::string(60, '=') << "\n";
    return passed == total ? 0 : 1;
}

/** Default config with every wait zeroed. */
inline MapperConfig fastConfig() {
    MapperConfig cfg;
    cfg.coarse_sweep.settle_ms     = 0;
    cfg.coarse_sweep.sample_gap_ms = 0;
    cfg.fine_sweep.settle_ms       = 0;
    cfg.fine_sweep.sample_gap_ms   = 0;
    cfg.turn_wait_ms    = 0;
    cfg.cycle_pause_ms  = 0;
    cfg.error_pause_ms  = 0;
    cfg.motion_reference_s = 0.0;
    return cfg;
}

/*** Scripted car: readings come from a function of the relative pan
 *   angle, commands are recorded and can be made to fail or throw.   */
class FakeCar : public CarInterface {
public:
    // relative angle (pan - 90) -> distance in cm
    std::function<double(double)> reading = [](double) { return 200.0; };

    bool setSensorHeading(double angle_deg) override {
        std::lock_guard<std::mutex> lk(mtx_);
        pan_deg_ = angle_deg;
        return record("pan");
    }

    double readDistance() override {
        std::lock_guard<std::mutex> lk(mtx_);
        ++reads_;
        if (throws_remaining_ > 0) {
            --throws_remaining_;
            throw std::runtime_error("sensor bus error");
        }
        return reading(pan_deg_ - SENSOR_CENTER_DEG);
    }

    bool turnLeft(double degrees) override {
        std::lock_guard<std::mutex> lk(mtx_);
        turned_deg_ -= degrees;
        return record("turn_left");
    }
    bool turnRight(double degrees) override {
        std::lock_guard<std::mutex> lk(mtx_);
        turned_deg_ += degrees;
        return record("turn_right");
    }
    bool forward() override {
        std::lock_guard<std::mutex> lk(mtx_);
        return record("forward");
    }
    bool backward() override {
        std::lock_guard<std::mutex> lk(mtx_);
        return record("backward");
    }
    bool setSpeed(int percent) override {
        std::lock_guard<std::mutex> lk(mtx_);
        last_speed_ = percent;
        return record("speed");
    }
    bool stop() override {
        std::lock_guard<std::mutex> lk(mtx_);
        return record("stop");
    }

    /* ───── Scripting ───── */
    void failCommands(bool fail) {
        std::lock_guard<std::mutex> lk(mtx_);
        fail_ = fail;
    }
    void throwOnNextReads(int n) {
        std::lock_guard<std::mutex> lk(mtx_);
        throws_remaining_ = n;
    }

    /* ───── Inspection ───── */
    std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return commands_;
    }
    int count(const std::string& command) const {
        std::lock_guard<std::mutex> lk(mtx_);
        int n = 0;
        for (const auto& c : commands_) if (c == command) ++n;
        return n;
    }
    void clearCommands() {
        std::lock_guard<std::mutex> lk(mtx_);
        commands_.clear();
    }
    double panDeg() const     { std::lock_guard<std::mutex> lk(mtx_); return pan_deg_; }
    double turnedDeg() const  { std::lock_guard<std::mutex> lk(mtx_); return turned_deg_; }
    int    reads() const      { std::lock_guard<std::mutex> lk(mtx_); return reads_; }
    int    lastSpeed() const  { std::lock_guard<std::mutex> lk(mtx_); return last_speed_; }

private:
    bool record(const char* command) {   // caller holds mtx_
        commands_.push_back(command);
        return !fail_;
    }

    mutable std::mutex       mtx_;
    std::vector<std::string> commands_;
    double pan_deg_{SENSOR_CENTER_DEG};
    double turned_deg_{0.0};
    int    reads_{0};
    int    last_speed_{0};
    int    throws_remaining_{0};
    bool   fail_{false};
};
