#include "perception/perception_scan.hpp"
#include "utils.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

PerceptionScan::PerceptionScan(CarInterface& car, bool verbose)
    : car_(car), verbose_(verbose)
{
}

std::vector<double> PerceptionScan::sweepAngles(const SweepSettings& s)
{
    if (s.step_deg <= 0.0)
        throw std::invalid_argument("sweep step must be positive");

    std::vector<double> angles;
    if (s.hi_deg < s.lo_deg) return angles;

    // index-based so float steps neither drift nor skip the upper end
    const int n = static_cast<int>(std::floor((s.hi_deg - s.lo_deg) / s.step_deg + 1e-9));
    angles.reserve(n + 1);
    for (int i = 0; i <= n; ++i) {
        double a = s.lo_deg + i * s.step_deg;
        angles.push_back(std::round(a * 1e6) / 1e6);
    }
    return angles;
}

ScanProfile PerceptionScan::sweep(const SweepSettings& s)
{
    ScanProfile profile;
    int rejected = 0;

    for (double angle : sweepAngles(s))
    {
        if (cancel_ && *cancel_) break;

        if (!car_.setSensorHeading(SENSOR_CENTER_DEG + angle)) {
            ++failed_commands_;
            std::cerr << "[SCAN] pan to " << SENSOR_CENTER_DEG + angle << "° failed\n";
        }
        wait(s.settle_ms);

        double sum = 0.0;
        int valid = 0;
        for (int k = 0; k < s.samples; ++k) {
            double d = car_.readDistance();
            if (d > 0.0 && d <= s.max_valid_cm) {
                sum += d;
                ++valid;
            } else {
                ++rejected;
            }
            if (k + 1 < s.samples) wait(s.sample_gap_ms);
        }

        if (valid > 0)
            profile.set(angle, sum / valid);
    }

    if (!car_.centerSensor()) {
        ++failed_commands_;
        std::cerr << "[SCAN] centering sensor failed\n";
    }

    if (verbose_) {
        std::cout << "[SCAN] " << profile.size() << " angles, "
                  << rejected << " readings rejected\n";
    }
    return profile;
}

void PerceptionScan::wait(int ms) const
{
    if (ms <= 0) return;
    if (cancel_)
        utils::sleep_unless(ms, *cancel_);
    else
        utils::sleep_ms(ms);
}
