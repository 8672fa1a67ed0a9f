#include "navigation/navigation_planner.hpp"
#include "core/robot_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>

const char* toString(CompletionReason reason)
{
    switch (reason) {
        case CompletionReason::NONE:              return "none";
        case CompletionReason::TURN_LIMIT:        return "turn limit";
        case CompletionReason::MAP_STABLE:        return "map stable";
        case CompletionReason::REVISITED:         return "position revisited";
        case CompletionReason::BACKUPS_EXHAUSTED: return "backups exhausted";
    }
    return "unknown";
}

NavigationPlanner::NavigationPlanner(const PlannerConfig& config, bool verbose)
    : config_(config), verbose_(verbose)
{
}

/* ───────────────────────── Per-cycle decision ───────────────────── */
Action NavigationPlanner::plan(const ScanProfile& profile, const Pose& pose,
                               std::size_t cell_count)
{
    ++state_.cycles;

    // 1) completion
    if (explorationComplete(pose, cell_count))
        return Action::complete();

    // 2) stuck -> back up while attempts remain
    if (state_.no_progress >= config_.progress_cycles) {
        if (state_.backup_attempts < config_.max_backups) {
            ++state_.backup_attempts;
            state_.no_progress = 0;
            std::cout << "[PLAN] no progress, backing up (attempt "
                      << state_.backup_attempts << "/" << config_.max_backups << ")\n";
            return Action::backup(config_.backup_distance_cm);
        }
        state_.completion = CompletionReason::BACKUPS_EXHAUSTED;
        return Action::complete();
    }

    // 3) score candidate headings, earliest wins ties
    DirectionScore best;
    best.combined = -std::numeric_limits<double>::infinity();
    for (double angle : config_.candidate_angles) {
        DirectionScore s = scoreDirection(profile, angle);
        if (verbose_) {
            std::cout << "[PLAN]   " << std::setw(4) << angle << "°: clearance="
                      << s.clearance_cm << " bonus=" << s.bonus << "\n";
        }
        if (s.combined > best.combined) best = s;
    }

    // 4) act; the turn limit itself is judged by explorationComplete()
    if (best.combined < config_.safe_distance_cm) {
        ++state_.consecutive_turns;
        return Action::turn(config_.turn_angle_deg);
    }

    state_.consecutive_turns = 0;
    double distance = config_.move_distance_cm;
    if (best.clearance_cm < config_.small_space_cm)
        distance = config_.small_space_move_cm;
    if (best.bonus > 0.0)
        distance = std::min(distance, config_.gap_move_cap_cm);

    return Action::move(best.angle_deg, distance);
}

void NavigationPlanner::recordMoveResult(double displacement_cm)
{
    if (displacement_cm < config_.min_progress_cm)
        ++state_.no_progress;
    else
        state_.no_progress = 0;
}

bool NavigationPlanner::explorationComplete(const Pose& pose, std::size_t cell_count)
{
    int& visits = state_.visits[RobotUtils::poseCell(pose)];
    ++visits;

    if (cell_count == state_.last_cell_count)
        ++state_.stable_cycles;
    else
        state_.stable_cycles = 0;
    state_.last_cell_count = cell_count;

    if (state_.consecutive_turns >= config_.max_consecutive_turns)
        state_.completion = CompletionReason::TURN_LIMIT;
    else if (state_.stable_cycles >= config_.stability_cycles)
        state_.completion = CompletionReason::MAP_STABLE;
    else if (visits >= config_.max_visits)
        state_.completion = CompletionReason::REVISITED;

    return state_.completion != CompletionReason::NONE;
}

/* ───────────────────────── Direction scoring ────────────────────── */
DirectionScore NavigationPlanner::scoreDirection(const ScanProfile& profile,
                                                 double angle_deg) const
{
    DirectionScore s;
    s.angle_deg    = angle_deg;
    s.clearance_cm = clearance(profile, angle_deg);
    s.bonus        = gapBonus(profile, angle_deg);
    s.combined     = s.clearance_cm + 2.0 * s.bonus;
    return s;
}

double NavigationPlanner::clearance(const ScanProfile& profile, double angle_deg) const
{
    double nearest = std::numeric_limits<double>::infinity();
    for (const auto& s : profile)
        if (std::abs(s.angle_deg - angle_deg) <= config_.clearance_cone_deg)
            nearest = std::min(nearest, s.distance_cm);

    return std::isinf(nearest) ? 0.0 : nearest;
}

double NavigationPlanner::gapBonus(const ScanProfile& profile, double angle_deg) const
{
    std::vector<ProfileSample> cone;
    for (const auto& s : profile)
        if (std::abs(s.angle_deg - angle_deg) <= config_.gap_cone_deg)
            cone.push_back(s);

    std::sort(cone.begin(), cone.end(),
              [](const ProfileSample& a, const ProfileSample& b)
              { return a.angle_deg < b.angle_deg; });

    double bonus = 0.0;
    for (size_t i = 1; i + 1 < cone.size(); ++i) {
        double prev = cone[i - 1].distance_cm;
        double mid  = cone[i].distance_cm;
        double next = cone[i + 1].distance_cm;

        // sudden opening: corridor or doorway
        if (mid - prev > config_.gap_jump_cm && mid - next > config_.gap_jump_cm)
            bonus += (mid - std::max(prev, next)) / 10.0;

        // tight but passable
        if (mid < config_.small_space_cm)
            bonus += (config_.small_space_cm - mid) / 20.0;
    }
    return bonus;
}
