// main.cpp
#include "control/mapping_controller.hpp"
#include "hardware/simulated_car.hpp"
#include "mapping/map_export.hpp"
#include "core/config.hpp"
#include "utils.hpp"
#include <boost/filesystem.hpp>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

namespace fs = boost::filesystem;

struct DemoOptions {
    int         cycles   = 60;
    std::string out_dir  = "maps";
    bool        rotation = false;
    bool        verbose  = false;
    bool        fast     = true;
};

static void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [--cycles N] [--out DIR] [--rotation] [--verbose] [--realtime]\n"
              << "  --cycles N    stop after N mapping cycles (default 60)\n"
              << "  --out DIR     directory for the exported map (default maps/)\n"
              << "  --rotation    start with a spin-in-place rotation scan\n"
              << "  --verbose     per-cycle and per-candidate logging\n"
              << "  --realtime    keep the real servo / travel timings\n";
}

static bool parseArgs(int argc, char** argv, DemoOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--cycles" && i + 1 < argc) {
            opt.cycles = std::atoi(argv[++i]);
            if (opt.cycles <= 0) {
                std::cerr << "--cycles must be positive\n";
                return false;
            }
        } else if (arg == "--out" && i + 1 < argc) {
            opt.out_dir = argv[++i];
        } else if (arg == "--rotation") {
            opt.rotation = true;
        } else if (arg == "--verbose") {
            opt.verbose = true;
        } else if (arg == "--realtime") {
            opt.fast = false;
        } else {
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

/* ---------- Simulated room ------------------------------------------------ */
// 4 m x 3 m room with a cabinet and a table leg group
static void buildRoom(SimulatedCar& car) {
    car.addBox( 100.0,   60.0,  180.0,  140.0);
    car.addBox(-160.0,  -40.0, -120.0,    0.0);
    car.addBox( -20.0, -140.0,   20.0, -100.0);
    car.setTruePose(0.0, 0.0, 0.0);
}

/* ---------- Main Function ------------------------------------------------ */
int main(int argc, char** argv)
{
    DemoOptions opt;
    if (!parseArgs(argc, argv, opt))
        return 1;

    MapperConfig cfg;
    cfg.verbose                = opt.verbose;
    cfg.rotation_scan_on_start = opt.rotation;

    // Shrink every wait by this factor; the simulated car travels faster to match
    const double time_scale = opt.fast ? 50.0 : 1.0;
    if (opt.fast) {
        cfg.coarse_sweep.settle_ms     = 0;
        cfg.coarse_sweep.sample_gap_ms = 0;
        cfg.fine_sweep.settle_ms       = 0;
        cfg.turn_wait_ms               = static_cast<int>(cfg.turn_wait_ms / time_scale);
        cfg.cycle_pause_ms             = static_cast<int>(cfg.cycle_pause_ms / time_scale);
        cfg.error_pause_ms             = static_cast<int>(cfg.error_pause_ms / time_scale);
        cfg.motion_reference_s        /= time_scale;
    }

    SimulatedCar car(400.0, 300.0, 2.0);
    car.setTimeScale(time_scale);
    buildRoom(car);

    try {
        fs::create_directories(opt.out_dir);
    }
    catch (const fs::filesystem_error& e) {
        std::cerr << "Can't create " << opt.out_dir << ": " << e.what() << std::endl;
        return 1;
    }

    MappingController mapper(car, cfg);
    if (!mapper.start()) {
        std::cerr << "Mapping failed to start" << std::endl;
        return 1;
    }

    long last_cycle = 0;
    while (mapper.isRunning() && mapper.cycleCount() < opt.cycles)
    {
        long cycle = mapper.cycleCount();
        if (cycle != last_cycle && cycle % 10 == 0) {
            MapSnapshot snap = mapper.snapshot();
            std::cout << "Mapping stats - cycle: " << snap.cycle
                      << ", cells: " << mapper.map().cellCount()
                      << std::fixed << std::setprecision(2)
                      << ", confidence: " << snap.confidence
                      << ", true pos: (" << std::setprecision(1) << car.trueX() << ", "
                      << car.trueY() << ") cm" << std::endl;
            last_cycle = cycle;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    mapper.stop();

    MapSnapshot snap = mapper.snapshot();
    const std::string ts = utils::file_timestamp();
    const fs::path img_file = fs::path(opt.out_dir) / ("map_" + ts + ".png");
    const fs::path csv_file = fs::path(opt.out_dir) / ("map_" + ts + ".csv");

    bool saved = saveSnapshotImage(img_file.string(), snap);
    saved = saveSnapshotCSV(csv_file.string(), snap) && saved;

    std::cout << "\nFinal map: " << mapper.map().cellCount() << " cells after "
              << snap.cycle << " cycles" << std::endl;
    std::cout << "Estimated pose: (" << std::fixed << std::setprecision(1)
              << snap.pose.x * snap.resolution << ", " << snap.pose.y * snap.resolution
              << ") cm, heading " << snap.pose.heading_deg << "°" << std::endl;
    std::cout << "True pose:      (" << car.trueX() << ", " << car.trueY()
              << ") cm, heading " << car.trueHeading() << "°" << std::endl;
    if (saved)
        std::cout << "Saved " << img_file.string() << " and " << csv_file.string() << std::endl;

    return saved ? 0 : 1;
}
