#ifndef NAVIGATION_PLANNER_HPP
#define NAVIGATION_PLANNER_HPP

#include <cstddef>
#include <map>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "navigation/action.hpp"
#include "perception/scan_profile.hpp"

enum class CompletionReason : uint8_t
{
    NONE              = 0,
    TURN_LIMIT        = 1,
    MAP_STABLE        = 2,
    REVISITED         = 3,
    BACKUPS_EXHAUSTED = 4
};

const char* toString(CompletionReason reason);

/*** Counters the planner carries from cycle to cycle ***/
struct ExplorationState
{
    int                     consecutive_turns{0};
    int                     stable_cycles{0};
    std::size_t             last_cell_count{0};
    std::map<GridCell, int> visits;         // rounded position -> cycles spent there
    int                     no_progress{0};
    int                     backup_attempts{0};
    long                    cycles{0};
    CompletionReason        completion{CompletionReason::NONE};
};

struct DirectionScore
{
    double angle_deg{0.0};
    double clearance_cm{0.0};   // nearest reading within the clearance cone
    double bonus{0.0};          // gap / small-space bonus
    double combined{0.0};       // clearance + 2 * bonus
};

/**
 * @brief Reactive exploration policy: completion checks, stuck recovery,
 *        clearance / gap scoring of candidate headings, one Action per cycle.
 */
class NavigationPlanner
{
public:
    explicit NavigationPlanner(const PlannerConfig& config = PlannerConfig(), bool verbose = false);

    Action plan(const ScanProfile& profile, const Pose& pose, std::size_t cell_count);

    /** Net displacement achieved by the last executed Move. */
    void recordMoveResult(double displacement_cm);

    DirectionScore scoreDirection(const ScanProfile& profile, double angle_deg) const;
    double clearance(const ScanProfile& profile, double angle_deg) const;
    double gapBonus(const ScanProfile& profile, double angle_deg) const;

    const ExplorationState& state() const { return state_; }
    void reset() { state_ = ExplorationState(); }

private:
    bool explorationComplete(const Pose& pose, std::size_t cell_count);

    PlannerConfig    config_;
    bool             verbose_;
    ExplorationState state_;
};

#endif // NAVIGATION_PLANNER_HPP
