#include "control/mapping_controller.hpp"
#include "hardware/simulated_car.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

static void printPose(const char* label, const Pose& p) {
    std::cout << label << std::fixed << std::setprecision(2)
              << "(" << p.x << ", " << p.y << ", " << p.heading_deg << "°)\n";
}

static bool waitFor(const std::function<bool()>& done, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

bool test1_SingleCycle() {
    printTestHeader("TEST 1: ONE CYCLE IN OPEN SPACE");
    std::cout << "Every reading 200 cm: all headings tie, the first (-90°) wins\n";

    FakeCar car;
    MappingController mapper(car, fastConfig());
    Action a = mapper.runCycle();

    auto cmds = car.commands();
    Pose p = mapper.pose();
    std::cout << "Action: " << a.toString() << "\n";
    printPose("Pose: ", p);

    bool tail_ok = cmds.size() >= 4 &&
                   cmds[cmds.size() - 4] == "turn_left" && cmds[cmds.size() - 3] == "forward" &&
                   cmds[cmds.size() - 2] == "speed"     && cmds[cmds.size() - 1] == "stop";

    std::cout << "SUCCESS CRITERIA: Move(-90°, 30 cm), turn left 90, drive at 25%, pose (0,-3,270°)\n";
    bool success = a.type == ActionType::MOVE && a.heading_offset_deg == -90.0 &&
                   tail_ok && car.turnedDeg() == -90.0 && car.lastSpeed() == 25 &&
                   std::abs(p.x) < 1e-9 && std::abs(p.y + 3.0) < 1e-9 && p.heading_deg == 270.0 &&
                   mapper.map().cellCount() > 0 && mapper.cycleCount() == 1;
    return printResult(success);
}

bool test2_StableMapCompletes() {
    printTestHeader("TEST 2: UNCHANGING MAP COMPLETES");
    std::cout << "Localization and revisit limit disabled; the robot circles a square\n";
    std::cout << "No echo straight ahead, 200 cm elsewhere\n";

    FakeCar car;
    car.reading = [](double a) { return std::abs(a) < 1e-9 ? 500.0 : 200.0; };
    MapperConfig cfg = fastConfig();
    cfg.localization.min_cells = 1000000;
    cfg.planner.max_visits     = 1000;
    MappingController mapper(car, cfg);

    int cycles = 0;
    Action a;
    while (cycles < 30) {
        a = mapper.runCycle();
        ++cycles;
        if (a.type == ActionType::COMPLETE) break;
    }

    ExplorationState st = mapper.explorationState();
    std::cout << "Completed after " << cycles << " cycles (" << toString(st.completion)
              << "), cells=" << mapper.map().cellCount() << "\n";
    std::cout << "SUCCESS CRITERIA: one lap of 4 cycles adds cells, complete after 10 unchanged ones"
                 " (cycle 14), reason map stable, no backups, car stopped\n";
    return printResult(a.type == ActionType::COMPLETE && cycles == 14 &&
                       st.completion == CompletionReason::MAP_STABLE &&
                       st.backup_attempts == 0 && car.commands().back() == "stop");
}

bool test3_DeadEndCompletes() {
    printTestHeader("TEST 3: DEAD END");
    std::cout << "Every reading 10 cm: turn in place until a completion check fires\n";

    FakeCar car;
    car.reading = [](double) { return 10.0; };
    MappingController mapper(car, fastConfig());

    Action a;
    int turns = 0;
    for (int i = 0; i < 10; ++i) {
        a = mapper.runCycle();
        if (a.type == ActionType::TURN) ++turns;
        if (a.type == ActionType::COMPLETE) break;
    }

    std::cout << "Turns: " << turns << ", result: " << a.toString() << "\n";
    std::cout << "SUCCESS CRITERIA: turns right 45° per cycle, then Complete with a stop command\n";
    return printResult(a.type == ActionType::COMPLETE && turns >= 1 &&
                       car.turnedDeg() == 45.0 * turns && car.commands().back() == "stop");
}

bool test4_FailedCommandsContinue() {
    printTestHeader("TEST 4: FAILED COMMANDS");
    std::cout << "Car rejects every command; cycle must still finish\n";

    FakeCar car;
    car.failCommands(true);
    MappingController mapper(car, fastConfig());
    Action a = mapper.runCycle();

    Pose p = mapper.pose();
    printPose("Pose: ", p);
    std::cout << "Failed commands: " << mapper.failedCommands() << "\n";
    std::cout << "SUCCESS CRITERIA: action executed, failures counted, dead reckoning applied\n";
    return printResult(a.type == ActionType::MOVE && mapper.failedCommands() >= 3 &&
                       std::abs(p.y + 3.0) < 1e-9);
}

bool test5_StartStop() {
    printTestHeader("TEST 5: START / STOP LIFECYCLE");

    FakeCar car;
    MapperConfig cfg = fastConfig();
    cfg.cycle_pause_ms = 20;
    MappingController mapper(car, cfg);

    bool first  = mapper.start();
    bool second = mapper.start();
    bool running = mapper.isRunning();
    waitFor([&] { return mapper.cycleCount() >= 1; }, 2000);
    mapper.stop();

    bool stopped = !mapper.isRunning() && car.commands().back() == "stop";
    bool restart = mapper.start();
    mapper.stop();

    std::cout << "start=" << first << " again=" << second << " restart=" << restart << "\n";
    std::cout << "SUCCESS CRITERIA: second start refused, stop idles and stops the car, restart allowed\n";
    return printResult(first && !second && running && stopped && restart && !mapper.isRunning());
}

bool test6_RecoversFromException() {
    printTestHeader("TEST 6: CYCLE EXCEPTION RECOVERY");
    std::cout << "First sensor read throws; loop must log, stop the car and carry on\n";

    FakeCar car;
    car.throwOnNextReads(1);
    MappingController mapper(car, fastConfig());

    mapper.start();
    bool progressed = waitFor([&] { return mapper.cycleCount() >= 2 || !mapper.isRunning(); }, 3000);
    mapper.stop();

    std::cout << "Cycles: " << mapper.cycleCount() << "\n";
    std::cout << "SUCCESS CRITERIA: at least 2 cycles, map filled after the failure\n";
    return printResult(progressed && mapper.cycleCount() >= 2 &&
                       mapper.map().cellCount() > 0 && car.count("stop") >= 2);
}

bool test7_RotationScan() {
    printTestHeader("TEST 7: ROTATION SCAN");
    std::cout << "Fine sweep, spin 180°, fine sweep; map rebuilt from both\n";

    FakeCar car;
    MappingController mapper(car, fastConfig());
    mapper.runCycle();
    int reads_before = car.reads();
    double turned_before = car.turnedDeg();
    car.clearCommands();

    mapper.requestRotationScan();
    mapper.runCycle();

    auto cmds = car.commands();
    int reads = car.reads() - reads_before;
    std::cout << "Readings: " << reads << ", cells: " << mapper.map().cellCount() << "\n";
    std::cout << "SUCCESS CRITERIA: 2 x 451 readings, turn right 180° between sweeps\n";

    bool turned_first = false;
    for (const auto& c : cmds) {
        if (c == "turn_right") { turned_first = true; break; }
        if (c == "forward") break;
    }
    return printResult(reads == 902 && turned_first &&
                       car.turnedDeg() - turned_before == 180.0 - 90.0 &&
                       mapper.map().cellCount() > 13);
}

bool test8_Snapshot() {
    printTestHeader("TEST 8: SNAPSHOT");

    FakeCar car;
    MappingController mapper(car, fastConfig());
    mapper.setPose(Pose(1.0, 2.0, -90.0));
    mapper.runCycle();
    MapSnapshot s = mapper.snapshot();

    std::size_t cells = 0;
    for (const auto& col : s.grid) cells += col.second.size();
    MapBounds b = OccupancyMap::boundsOf(s.grid);

    std::cout << "SUCCESS CRITERIA: snapshot matches the live map, pose and cycle count\n";
    return printResult(cells == mapper.map().cellCount() && s.resolution == MAP_RESOLUTION_CM &&
                       s.cycle == 1 && b.min_x == s.bounds.min_x && b.max_y == s.bounds.max_y &&
                       s.pose.x == mapper.pose().x && s.pose.heading_deg == mapper.pose().heading_deg);
}

bool test9_InvalidConfig() {
    printTestHeader("TEST 9: INVALID CONFIGURATION");

    FakeCar car;
    MapperConfig cfg = fastConfig();
    cfg.map_resolution_cm = 0.0;
    bool threw = false;
    try {
        MappingController mapper(car, cfg);
    } catch (const std::invalid_argument& e) {
        std::cout << "Rejected: " << e.what() << "\n";
        threw = true;
    }
    return printResult(threw);
}

bool test10_SimulatedRoom() {
    printTestHeader("TEST 10: SIMULATED ROOM");
    std::cout << "300x300 cm room, travel sped up 100x\n";

    SimulatedCar car(300.0, 300.0, 1.0);
    car.setTimeScale(100.0);
    MapperConfig cfg = fastConfig();
    cfg.motion_reference_s = 0.02;
    MappingController mapper(car, cfg);

    for (int i = 0; i < 6; ++i)
        if (mapper.runCycle().type == ActionType::COMPLETE) break;

    std::cout << "True position: (" << car.trueX() << ", " << car.trueY() << ") cm, cells: "
              << mapper.map().cellCount() << "\n";
    std::cout << "SUCCESS CRITERIA: map populated, car inside the room and stopped\n";
    return printResult(mapper.map().cellCount() > 10 &&
                       std::abs(car.trueX()) < 150.0 && std::abs(car.trueY()) < 150.0 &&
                       !car.isMoving());
}

bool test11_BlockedMovesBackUp() {
    printTestHeader("TEST 11: BLOCKED MOVES BACK UP");
    std::cout << "Every reading 200 cm: each Move leaves the range ahead unchanged\n";

    FakeCar car;
    MapperConfig cfg = fastConfig();
    cfg.localization.min_cells     = 1000000;
    cfg.planner.max_visits         = 1000;
    cfg.planner.stability_cycles   = 1000;
    MappingController mapper(car, cfg);

    int first_backup = 0;
    int attempts_after_first = -1;
    int progress_after_first = -1;
    int cycles = 0;
    Action a;
    while (cycles < 30) {
        a = mapper.runCycle();
        ++cycles;
        if (a.type == ActionType::BACKUP && !first_backup) {
            first_backup = cycles;
            ExplorationState st = mapper.explorationState();
            attempts_after_first = st.backup_attempts;
            progress_after_first = st.no_progress;
        }
        if (a.type == ActionType::COMPLETE) break;
    }

    ExplorationState st = mapper.explorationState();
    std::cout << "First backup at cycle " << first_backup << ", completed at cycle " << cycles
              << " (" << toString(st.completion) << "), backward commands: "
              << car.count("backward") << "\n";
    std::cout << "SUCCESS CRITERIA: 3 unproductive Moves, Backup on cycle 4 using one attempt;"
                 " 3 backups, then Complete on cycle 16 (backups exhausted)\n";
    return printResult(first_backup == 4 && attempts_after_first == 1 && progress_after_first == 0 &&
                       a.type == ActionType::COMPLETE && cycles == 16 &&
                       st.completion == CompletionReason::BACKUPS_EXHAUSTED &&
                       st.backup_attempts == 3 && car.count("backward") == 3 &&
                       car.commands().back() == "stop");
}

int main() {
    std::cout << "╔══════════════════════════════════════════════╗\n";
    std::cout << "║          MAPPING CONTROLLER TESTS            ║\n";
    std::cout << "╚══════════════════════════════════════════════╝\n";

    int passed = 0;
    passed += test1_SingleCycle();
    passed += test2_StableMapCompletes();
    passed += test3_DeadEndCompletes();
    passed += test4_FailedCommandsContinue();
    passed += test5_StartStop();
    passed += test6_RecoversFromException();
    passed += test7_RotationScan();
    passed += test8_Snapshot();
    passed += test9_InvalidConfig();
    passed += test10_SimulatedRoom();
    passed += test11_BlockedMovesBackUp();

    return printSummary(passed, 11);
}
