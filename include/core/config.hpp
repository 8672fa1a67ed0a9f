#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Map configuration
constexpr double MAP_RESOLUTION_CM = 10.0; // cm per grid cell

// Sensor configuration (pan servo centre is straight ahead)
constexpr double SENSOR_CENTER_DEG  = 90.0;
constexpr double SENSOR_MIN_DEG     = 0.0;
constexpr double SENSOR_MAX_DEG     = 180.0;
constexpr double MAX_VALID_RANGE_CM = 400.0;

// Motion configuration
constexpr int    DEFAULT_SPEED_PCT   = 25;
constexpr double MOTION_REFERENCE_CM = 50.0; // dead reckoning: 50 cm ...
constexpr double MOTION_REFERENCE_S  = 2.0;  // ... takes 2 s at DEFAULT_SPEED_PCT

// Timing configuration (milliseconds)
constexpr int TURN_WAIT_MS    = 1000;
constexpr int CYCLE_PAUSE_MS  = 1000;
constexpr int ERROR_PAUSE_MS  = 2000;
constexpr int STOP_TIMEOUT_MS = 2000;

enum class ScanMode : uint8_t
{
    COARSE = 0, // stationary sweep, few well-settled samples
    FINE   = 1  // dense sweep with minimal settle, noisier
};

/*** One sensor sweep: angles are relative to the robot heading ***/
struct SweepSettings
{
    double lo_deg{-90.0};
    double hi_deg{90.0};
    double step_deg{15.0};
    int    settle_ms{100};     // servo settle after each pan command
    int    samples{3};         // readings averaged per angle
    int    sample_gap_ms{20};  // pause between readings
    double max_valid_cm{MAX_VALID_RANGE_CM};
};

const SweepSettings COARSE_SWEEP{-90.0, 90.0, 15.0, 100, 3, 20, MAX_VALID_RANGE_CM};
const SweepSettings FINE_SWEEP  {-90.0, 90.0, 0.4,  5,   1, 0,  MAX_VALID_RANGE_CM};

struct LocalizationConfig
{
    std::size_t min_cells{10};          // runs only when cell count exceeds this
    double search_radius{50.0};         // grid units
    double position_step{10.0};         // grid units
    double heading_range_deg{30.0};
    double heading_step_deg{10.0};
    double max_match_distance_cm{300.0};
    double exact_tolerance_cm{20.0};
    double neighbor_tolerance_cm{30.0};
    double accept_score{0.6};
    double high_confidence_score{0.8};
    double min_correction{2.0};         // grid units
};

struct PlannerConfig
{
    // completion
    int max_consecutive_turns{5};
    int stability_cycles{10};
    int max_visits{3};

    // stuck / backup
    int    progress_cycles{3};
    double min_progress_cm{5.0};
    int    max_backups{3};
    double backup_distance_cm{25.0};

    // direction scoring
    std::vector<double> candidate_angles{-90.0, -60.0, -30.0, 0.0, 30.0, 60.0, 90.0};
    double clearance_cone_deg{30.0};
    double gap_cone_deg{45.0};
    double gap_jump_cm{30.0};
    double small_space_cm{80.0};

    // action selection
    double safe_distance_cm{50.0};
    double turn_angle_deg{45.0};
    double move_distance_cm{30.0};
    double small_space_move_cm{15.0};
    double gap_move_cap_cm{20.0};
};

/*** Everything the mapping controller and its collaborators need ***/
struct MapperConfig
{
    double map_resolution_cm{MAP_RESOLUTION_CM};
    int    speed_pct{DEFAULT_SPEED_PCT};

    ScanMode      scan_mode{ScanMode::COARSE};
    SweepSettings coarse_sweep{COARSE_SWEEP};
    SweepSettings fine_sweep{FINE_SWEEP};

    // rotation mode: clear map, sweep, spin, sweep again
    bool   rotation_scan_on_start{false};
    double rotation_turn_deg{180.0};

    double min_turn_before_move_deg{10.0};
    double progress_range_tolerance_deg{7.5};   // range-ahead match across a Move
    double motion_reference_cm{MOTION_REFERENCE_CM};
    double motion_reference_s{MOTION_REFERENCE_S};

    int turn_wait_ms{TURN_WAIT_MS};
    int cycle_pause_ms{CYCLE_PAUSE_MS};
    int error_pause_ms{ERROR_PAUSE_MS};
    int stop_timeout_ms{STOP_TIMEOUT_MS};

    bool verbose{false};

    LocalizationConfig localization;
    PlannerConfig      planner;

    /** Time the dead-reckoning model allows for travelling distance_cm. */
    int motionTimeMs(double distance_cm) const
    {
        return static_cast<int>(distance_cm / motion_reference_cm * motion_reference_s * 1000.0);
    }
};

#endif // CONFIG_HPP
