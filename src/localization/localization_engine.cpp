#include "localization/localization_engine.hpp"
#include "core/robot_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

/* 8-neighbourhood, scanned in this order for the loose match */
static const int NEIGHBOURS[8][2] = {
    {-1, -1}, {-1, 0}, {-1, 1},
    { 0, -1},          { 0, 1},
    { 1, -1}, { 1, 0}, { 1, 1}
};

LocalizationEngine::LocalizationEngine(double resolution_cm,
                                       const LocalizationConfig& config,
                                       bool verbose)
    : resolution_(resolution_cm), config_(config), verbose_(verbose)
{
    if (resolution_ <= 0.0)
        throw std::invalid_argument("map resolution must be positive");
    if (config_.position_step <= 0.0 || config_.heading_step_deg <= 0.0)
        throw std::invalid_argument("localization search steps must be positive");
}

/* ── Main routine ───────────────────────────────────────────────────── */
LocalizationResult LocalizationEngine::localize(const ScanProfile& profile,
                                                const OccupancyMap& map,
                                                Pose& pose)
{
    LocalizationResult result;
    result.best = pose;

    if (map.cellCount() <= config_.min_cells)
        return result;                       // not enough map to trust

    result.ran = true;
    const Grid grid = map.cells();
    const auto points = usablePoints(profile);

    if (points.empty()) {
        confidence_ = 0.0;
        return result;
    }

    const auto xy_offsets      = lattice(config_.search_radius, config_.position_step);
    const auto heading_offsets = lattice(config_.heading_range_deg, config_.heading_step_deg);

    double best_score = -1.0;
    Pose   best = pose;

    for (double dth : heading_offsets) {
        double heading = RobotUtils::normalizeHeading(pose.heading_deg + dth);

        /* Pre-project the profile once for this heading */
        auto offsets = projectOffsets(points, heading);

        for (double dx : xy_offsets) {
            for (double dy : xy_offsets) {
                double x = pose.x + dx;
                double y = pose.y + dy;
                double score = scoreCandidate(points, offsets, grid, x, y);

                if (score > best_score) {
                    best_score = score;
                    best = Pose(x, y, heading);
                }
            }
        }
    }

    result.score      = best_score;
    result.best       = best;
    result.correction = RobotUtils::planarDistance(best, pose);
    confidence_       = best_score;

    if (best_score > config_.accept_score &&
        (result.correction > config_.min_correction ||
         best_score > config_.high_confidence_score))
    {
        if (verbose_ || result.correction > config_.min_correction) {
            std::cout << "[LOC] pose corrected (" << std::fixed << std::setprecision(1)
                      << pose.x << ", " << pose.y << ", " << pose.heading_deg << "°) -> ("
                      << best.x << ", " << best.y << ", " << best.heading_deg << "°)"
                      << std::setprecision(3) << " score=" << best_score << "\n";
        }
        pose = best;
        result.corrected = true;
    }
    else if (verbose_) {
        std::cout << "[LOC] no correction, best score " << std::fixed
                  << std::setprecision(3) << best_score << "\n";
    }

    return result;
}

double LocalizationEngine::matchScore(const ScanProfile& profile,
                                      const Grid& grid,
                                      const Pose& pose) const
{
    const auto points = usablePoints(profile);
    if (points.empty()) return 0.0;
    return scoreCandidate(points, projectOffsets(points, pose.heading_deg),
                          grid, pose.x, pose.y);
}

/* ── Utility helpers ────────────────────────────────────────────────── */
std::vector<LocalizationEngine::MatchPoint>
LocalizationEngine::usablePoints(const ScanProfile& profile) const
{
    std::vector<MatchPoint> points;
    points.reserve(profile.size());
    for (const auto& s : profile)
        if (s.distance_cm > 0.0 && s.distance_cm <= config_.max_match_distance_cm)
            points.push_back({s.angle_deg, s.distance_cm});
    return points;
}

std::vector<Eigen::Vector2d>
LocalizationEngine::projectOffsets(const std::vector<MatchPoint>& points,
                                   double heading_deg) const
{
    std::vector<Eigen::Vector2d> offsets;
    offsets.reserve(points.size());
    for (const auto& p : points)
        offsets.push_back(RobotUtils::polarOffset(heading_deg, p.angle_deg,
                                                  p.distance_cm, resolution_));
    return offsets;
}

double LocalizationEngine::scoreCandidate(const std::vector<MatchPoint>& points,
                                          const std::vector<Eigen::Vector2d>& offsets,
                                          const Grid& grid,
                                          double x, double y) const
{
    const double exact_tol = config_.exact_tolerance_cm;
    const double loose_tol = config_.neighbor_tolerance_cm;

    double total = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        const double d = points[i].distance_cm;
        const GridCell c = RobotUtils::toCell(x, y, offsets[i]);

        if (auto m = OccupancyMap::lookup(grid, c.x, c.y)) {
            total += std::max(0.0, exact_tol - std::abs(d - *m)) / exact_tol;
            continue;
        }

        // half-weighted credit for the first close neighbour that agrees
        for (const auto& n : NEIGHBOURS) {
            auto v = OccupancyMap::lookup(grid, c.x + n[0], c.y + n[1]);
            if (!v) continue;
            double diff = std::abs(d - *v);
            if (diff < loose_tol) {
                total += (loose_tol - diff) / (2.0 * loose_tol);
                break;
            }
        }
    }
    return total / static_cast<double>(points.size());
}

std::vector<double> LocalizationEngine::lattice(double range, double step)
{
    std::vector<double> values;
    const int n = static_cast<int>(std::floor(range / step + 1e-9));
    for (int i = -n; i <= n; ++i)
        values.push_back(i * step);
    return values;
}
