#include "control/mapping_controller.hpp"
#include "core/robot_utils.hpp"
#include "utils.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

MappingController::MappingController(CarInterface& car, const MapperConfig& config)
    : car_(car),
      config_(config),
      scanner_(car, config.verbose),
      localizer_(config.map_resolution_cm, config.localization, config.verbose),
      planner_(config.planner, config.verbose)
{
    scanner_.setCancelFlag(&stop_requested_);
    std::cout << "[MAPPER] initialized (resolution " << config_.map_resolution_cm
              << " cm/cell, speed " << config_.speed_pct << "%)\n";
}

MappingController::~MappingController()
{
    stop();
    if (worker_.joinable())
        worker_.join();
}

/* ───────────────────────── Lifecycle ────────────────────────────── */
bool MappingController::start()
{
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);

    if (running_) {
        std::cout << "[MAPPER] mapping already in progress\n";
        return false;
    }
    if (worker_.joinable()) {
        if (!loop_finished_) {
            std::cerr << "[MAPPER] previous mapping loop still shutting down\n";
            return false;
        }
        worker_.join();
    }

    {
        std::lock_guard<std::mutex> state_lk(state_mtx_);
        planner_.reset();
        pending_move_.reset();
    }
    localizer_.reset();
    confidence_ = 0.0;
    cycles_     = 0;
    if (config_.rotation_scan_on_start)
        rotation_requested_ = true;

    stop_requested_ = false;
    loop_finished_  = false;
    running_        = true;
    worker_ = std::thread(&MappingController::mappingLoop, this);

    std::cout << "[MAPPER] autonomous mapping started at " << utils::timestamp() << "\n";
    return true;
}

void MappingController::stop()
{
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);

    stop_requested_ = true;
    running_        = false;

    if (worker_.joinable()) {
        auto deadline = std::chrono::steady_clock::now()
                      + std::chrono::milliseconds(config_.stop_timeout_ms);
        while (!loop_finished_ && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));

        if (loop_finished_)
            worker_.join();
        else
            std::cerr << "[MAPPER] mapping loop did not finish within "
                      << config_.stop_timeout_ms << " ms\n";
    }

    safeStop();
    std::cout << "[MAPPER] autonomous mapping stopped (" << map_.cellCount()
              << " cells mapped)\n";
}

void MappingController::mappingLoop()
{
    std::cout << "[MAPPER] mapping loop started\n";

    while (running_)
    {
        try {
            Action action = runCycle();
            if (action.type == ActionType::COMPLETE && !stop_requested_) {
                std::cout << "[MAPPER] exploration complete ("
                          << toString(explorationState().completion) << ") after "
                          << cycles_ << " cycles, " << map_.cellCount() << " cells\n";
                break;
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[MAPPER] mapping error: " << e.what() << "\n";
            safeStop();
            wait(config_.error_pause_ms);
        }
    }

    running_       = false;
    loop_finished_ = true;
    std::cout << "[MAPPER] mapping loop ended\n";
}

/* ───────────────────────── One cycle ────────────────────────────── */
Action MappingController::runCycle()
{
    ++cycles_;

    // 1) perceive + 2) map
    ScanProfile profile;
    const bool rotated = rotation_requested_.exchange(false);
    if (rotated) {
        profile = rotationScan();
    } else {
        const SweepSettings& sweep = (config_.scan_mode == ScanMode::FINE)
                                   ? config_.fine_sweep : config_.coarse_sweep;
        Pose at = pose();
        profile = scanner_.sweep(sweep);
        integrateProfile(profile, at);
    }
    if (stop_requested_)
        return Action::complete();

    // 3) localize
    Pose estimate = pose();
    LocalizationResult loc = localizer_.localize(profile, map_, estimate);
    confidence_ = localizer_.confidence();

    Action action;
    {
        std::lock_guard<std::mutex> lk(state_mtx_);
        if (loc.corrected) pose_ = estimate;

        // a spin in between leaves nothing comparable ahead
        if (pending_move_) {
            if (!rotated)
                planner_.recordMoveResult(moveProgress(*pending_move_, profile));
            pending_move_.reset();
        }

        // 4) plan
        action = planner_.plan(profile, pose_, map_.cellCount());
    }

    if (config_.verbose || action.type != ActionType::MOVE) {
        Pose p = pose();
        std::cout << "[MAPPER] cycle " << cycles_ << ": " << action.toString()
                  << std::fixed << std::setprecision(1)
                  << "  pose=(" << p.x << ", " << p.y << ", " << p.heading_deg << "°)"
                  << " cells=" << map_.cellCount()
                  << std::setprecision(2) << " conf=" << confidence_ << "\n";
    }

    // 5) act
    execute(action);
    if (action.type == ActionType::MOVE) {
        PendingMove move{profile.nearest(action.heading_offset_deg,
                                         config_.progress_range_tolerance_deg),
                         action.distance_cm};
        std::lock_guard<std::mutex> lk(state_mtx_);
        pending_move_ = move;
    }

    if (action.type != ActionType::COMPLETE)
        wait(config_.cycle_pause_ms);

    return action;
}

/* Net travel of a Move: how much the range along its direction changed.
 * A blocked robot keeps seeing the obstacle at the same distance.       */
double MappingController::moveProgress(const PendingMove& move,
                                       const ScanProfile& profile) const
{
    std::optional<double> ahead =
        profile.nearest(0.0, config_.progress_range_tolerance_deg);

    // no echo before or after: nothing to measure against
    if (!move.range_ahead_cm || !ahead)
        return move.commanded_cm;

    double moved = std::abs(*move.range_ahead_cm - *ahead);
    if (config_.verbose) {
        std::cout << "[MAPPER] range ahead " << *move.range_ahead_cm << " -> "
                  << *ahead << " cm (moved " << moved << " cm)\n";
    }
    return moved;
}

ScanProfile MappingController::rotationScan()
{
    std::cout << "[MAPPER] rotation scan: clearing map\n";
    map_.clear();

    Pose at = pose();
    ScanProfile first = scanner_.sweep(config_.fine_sweep);
    integrateProfile(first, at);

    turnBy(config_.rotation_turn_deg);

    at = pose();
    ScanProfile second = scanner_.sweep(config_.fine_sweep);
    integrateProfile(second, at);

    std::cout << "[MAPPER] rotation scan harvested " << first.size() + second.size()
              << " points, " << map_.cellCount() << " cells\n";
    return second;
}

void MappingController::integrateProfile(const ScanProfile& profile, const Pose& from)
{
    for (const auto& s : profile) {
        GridCell c = RobotUtils::polarToGrid(from, s.angle_deg, s.distance_cm,
                                             config_.map_resolution_cm);
        map_.observe(c.x, c.y, s.distance_cm);
    }
}

/* ───────────────────────── Execution ────────────────────────────── */
void MappingController::execute(const Action& action)
{
    switch (action.type)
    {
        case ActionType::TURN:
            turnBy(action.degrees);
            break;

        case ActionType::MOVE:
            if (std::abs(action.heading_offset_deg) > config_.min_turn_before_move_deg)
                turnBy(action.heading_offset_deg);
            drive(action.distance_cm, false);
            break;

        case ActionType::BACKUP:
            drive(action.distance_cm, true);
            break;

        case ActionType::COMPLETE:
            issue(car_.stop(), "stop");
            break;
    }
}

void MappingController::turnBy(double degrees)
{
    if (degrees > 0)
        issue(car_.turnRight(degrees), "turn right");
    else
        issue(car_.turnLeft(std::abs(degrees)), "turn left");

    {
        std::lock_guard<std::mutex> lk(state_mtx_);
        pose_.heading_deg = RobotUtils::normalizeHeading(pose_.heading_deg + degrees);
    }
    wait(config_.turn_wait_ms);
}

void MappingController::drive(double distance_cm, bool reverse)
{
    issue(reverse ? car_.backward() : car_.forward(), reverse ? "backward" : "forward");
    issue(car_.setSpeed(config_.speed_pct), "set speed");
    wait(config_.motionTimeMs(distance_cm));
    issue(car_.stop(), "stop");

    // dead reckoning from the commanded distance
    std::lock_guard<std::mutex> lk(state_mtx_);
    double h = RobotUtils::degToRad(pose_.heading_deg + (reverse ? 180.0 : 0.0));
    pose_.x += distance_cm * std::cos(h) / config_.map_resolution_cm;
    pose_.y += distance_cm * std::sin(h) / config_.map_resolution_cm;
}

void MappingController::issue(bool ok, const char* command)
{
    if (ok) return;
    ++failed_commands_;
    std::cerr << "[MAPPER] command '" << command << "' failed\n";
}

void MappingController::safeStop()
{
    try {
        issue(car_.stop(), "stop");
    }
    catch (const std::exception& e) {
        std::cerr << "[MAPPER] stop command threw: " << e.what() << "\n";
    }
}

void MappingController::wait(int ms)
{
    utils::sleep_unless(ms, stop_requested_);
}

/* ───────────────────────── Accessors ────────────────────────────── */
MapSnapshot MappingController::snapshot() const
{
    MapSnapshot s;
    s.grid       = map_.cells();
    s.bounds     = OccupancyMap::boundsOf(s.grid);
    s.pose       = pose();
    s.resolution = config_.map_resolution_cm;
    s.confidence = confidence_;
    s.cycle      = cycles_;
    return s;
}

Pose MappingController::pose() const
{
    std::lock_guard<std::mutex> lk(state_mtx_);
    return pose_;
}

void MappingController::setPose(const Pose& pose)
{
    std::lock_guard<std::mutex> lk(state_mtx_);
    pose_ = Pose(pose.x, pose.y, RobotUtils::normalizeHeading(pose.heading_deg));
}

ExplorationState MappingController::explorationState() const
{
    std::lock_guard<std::mutex> lk(state_mtx_);
    return planner_.state();
}
