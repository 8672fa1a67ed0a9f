#ifndef MAPPING_CONTROLLER_HPP
#define MAPPING_CONTROLLER_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

#include "core/config.hpp"
#include "core/types.hpp"
#include "hardware/car_interface.hpp"
#include "localization/localization_engine.hpp"
#include "mapping/occupancy_map.hpp"
#include "navigation/navigation_planner.hpp"
#include "perception/perception_scan.hpp"

/*** Owns the mapping run:
 *   scan → map update → localize → plan → execute → pause
 *   on a dedicated thread, Idle → Running → Idle.                      */
class MappingController {
public:
    explicit MappingController(CarInterface& car,
                               const MapperConfig& config = MapperConfig());
    ~MappingController();

    MappingController(const MappingController&) = delete;
    MappingController& operator=(const MappingController&) = delete;

    /* ───── Lifecycle ─────────────────────────────────────────────── */
    bool start();          ///< false if a run is already in progress
    void stop();           ///< bounded wait, always stops the car
    bool isRunning() const { return running_; }

    /** One full cycle on the calling thread; returns the executed action. */
    Action runCycle();

    /** Next cycle clears the map and harvests a spin-in-place scan. */
    void requestRotationScan() { rotation_requested_ = true; }

    /* ───── Read-only access (any thread) ─────────────────────────── */
    MapSnapshot      snapshot() const;
    Pose             pose() const;
    double           confidence() const { return confidence_; }
    long             cycleCount() const { return cycles_; }
    int              failedCommands() const { return failed_commands_; }
    ExplorationState explorationState() const;
    const OccupancyMap& map() const { return map_; }

    void setPose(const Pose& pose);   ///< initial pose before a run

private:
    struct PendingMove {
        std::optional<double> range_ahead_cm;   // reading along the travel direction before it
        double                commanded_cm;
    };

    void        mappingLoop();
    double      moveProgress(const PendingMove& move, const ScanProfile& profile) const;
    ScanProfile rotationScan();
    void        integrateProfile(const ScanProfile& profile, const Pose& from);
    void        execute(const Action& action);
    void        turnBy(double degrees);
    void        drive(double distance_cm, bool reverse);
    void        issue(bool ok, const char* command);
    void        safeStop();
    void        wait(int ms);

    CarInterface&      car_;
    MapperConfig       config_;
    OccupancyMap       map_;
    PerceptionScan     scanner_;
    LocalizationEngine localizer_;
    NavigationPlanner  planner_;

    mutable std::mutex         state_mtx_;     // pose_ + planner_ + pending_move_
    Pose                       pose_;
    std::optional<PendingMove> pending_move_;  // last executed Move, not yet judged

    std::mutex          lifecycle_mtx_;
    std::thread         worker_;
    std::atomic<bool>   running_{false};
    std::atomic<bool>   stop_requested_{false};
    std::atomic<bool>   loop_finished_{true};
    std::atomic<bool>   rotation_requested_{false};
    std::atomic<double> confidence_{0.0};
    std::atomic<long>   cycles_{0};
    std::atomic<int>    failed_commands_{0};
};

#endif // MAPPING_CONTROLLER_HPP
