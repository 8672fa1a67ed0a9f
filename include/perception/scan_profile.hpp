#ifndef SCAN_PROFILE_HPP
#define SCAN_PROFILE_HPP

#include <cstddef>
#include <optional>
#include <vector>

/*** A single averaged range sample of a sweep */
struct ProfileSample {
    double angle_deg;     // relative to robot heading, signed
    double distance_cm;
};

/*** One sweep's angle -> distance readings, kept in sweep order.
 *   Re-adding an angle overwrites its distance in place.              */
class ScanProfile {
public:
    void set(double angle_deg, double distance_cm);
    std::optional<double> find(double angle_deg) const;
    /** Distance of the sample closest to angle_deg, if within max_gap_deg. */
    std::optional<double> nearest(double angle_deg, double max_gap_deg) const;

    bool        empty() const { return samples_.empty(); }
    std::size_t size()  const { return samples_.size(); }
    void        clear()       { samples_.clear(); }

    const std::vector<ProfileSample>& samples() const { return samples_; }

    std::vector<ProfileSample>::const_iterator begin() const { return samples_.begin(); }
    std::vector<ProfileSample>::const_iterator end()   const { return samples_.end(); }

private:
    std::vector<ProfileSample> samples_;
};

#endif // SCAN_PROFILE_HPP
