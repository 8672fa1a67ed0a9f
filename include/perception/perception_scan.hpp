#ifndef PERCEPTION_SCAN_HPP
#define PERCEPTION_SCAN_HPP

#include <atomic>
#include <vector>

#include "core/config.hpp"
#include "hardware/car_interface.hpp"
#include "perception/scan_profile.hpp"

/*** Drives the pan servo through a sweep and averages range readings
 *   into a ScanProfile relative to the current heading.               */
class PerceptionScan {
public:
    explicit PerceptionScan(CarInterface& car, bool verbose = false);

    /** Pans over [lo, hi] (both ends inclusive) by step.  Angles with no
        valid reading are left out of the profile.                      */
    ScanProfile sweep(const SweepSettings& settings);

    /** Stops between angles once cancel is set (partial profile). */
    void setCancelFlag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    static std::vector<double> sweepAngles(const SweepSettings& settings);

    int failedCommands() const { return failed_commands_; }

private:
    void wait(int ms) const;

    CarInterface&             car_;
    bool                      verbose_;
    const std::atomic<bool>*  cancel_{nullptr};
    int                       failed_commands_{0};
};

#endif // PERCEPTION_SCAN_HPP
