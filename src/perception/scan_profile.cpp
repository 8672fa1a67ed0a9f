#include "perception/scan_profile.hpp"
#include <algorithm>
#include <cmath>

void ScanProfile::set(double angle_deg, double distance_cm)
{
    auto it = std::find_if(samples_.begin(), samples_.end(),
                           [angle_deg](const ProfileSample& s)
                           { return s.angle_deg == angle_deg; });
    if (it != samples_.end()) {
        it->distance_cm = distance_cm;
        return;
    }
    samples_.push_back({angle_deg, distance_cm});
}

std::optional<double> ScanProfile::find(double angle_deg) const
{
    for (const auto& s : samples_)
        if (s.angle_deg == angle_deg) return s.distance_cm;
    return std::nullopt;
}

std::optional<double> ScanProfile::nearest(double angle_deg, double max_gap_deg) const
{
    std::optional<double> found;
    double best_gap = max_gap_deg;
    for (const auto& s : samples_) {
        double gap = std::abs(s.angle_deg - angle_deg);
        if (gap <= best_gap && (!found || gap < best_gap)) {
            best_gap = gap;
            found    = s.distance_cm;
        }
    }
    return found;
}
