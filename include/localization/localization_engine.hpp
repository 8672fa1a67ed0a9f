#ifndef LOCALIZATION_ENGINE_HPP
#define LOCALIZATION_ENGINE_HPP

#include <vector>
#include <Eigen/Dense>

#include "core/config.hpp"
#include "core/types.hpp"
#include "mapping/occupancy_map.hpp"
#include "perception/scan_profile.hpp"

struct LocalizationResult {
    bool   ran{false};          // map was large enough to match against
    bool   corrected{false};    // pose was replaced by the best candidate
    double score{0.0};          // best match score found
    double correction{0.0};     // grid units between estimate and best candidate
    Pose   best;
};

/**
 * @brief Corrects dead-reckoning drift by brute-force scan matching.
 *
 * Every candidate pose on a coarse (dx, dy, dheading) lattice around the
 * current estimate is scored against the map; the first candidate reaching
 * the highest score wins.  The estimate is only replaced when the score
 * clears the acceptance gate and the correction is significant (or the
 * score is very high).  Confidence is refreshed on every run.
 */
class LocalizationEngine {
public:
    explicit LocalizationEngine(double resolution_cm,
                                const LocalizationConfig& config = LocalizationConfig(),
                                bool verbose = false);

    LocalizationResult localize(const ScanProfile& profile,
                                const OccupancyMap& map,
                                Pose& pose);

    /** Mean per-point agreement of profile seen from pose, 0 … 1. */
    double matchScore(const ScanProfile& profile, const Grid& grid, const Pose& pose) const;

    double confidence() const { return confidence_; }
    void   reset() { confidence_ = 0.0; }

    const LocalizationConfig& config() const { return config_; }

private:
    struct MatchPoint {
        double angle_deg;
        double distance_cm;
    };

    std::vector<MatchPoint> usablePoints(const ScanProfile& profile) const;
    std::vector<Eigen::Vector2d> projectOffsets(const std::vector<MatchPoint>& points,
                                                double heading_deg) const;
    double scoreCandidate(const std::vector<MatchPoint>& points,
                          const std::vector<Eigen::Vector2d>& offsets,
                          const Grid& grid, double x, double y) const;
    static std::vector<double> lattice(double range, double step);

    double             resolution_;
    LocalizationConfig config_;
    bool               verbose_;
    double             confidence_{0.0};
};

#endif // LOCALIZATION_ENGINE_HPP
