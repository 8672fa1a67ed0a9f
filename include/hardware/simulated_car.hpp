#ifndef SIMULATED_CAR_HPP
#define SIMULATED_CAR_HPP

#include <chrono>
#include <mutex>
#include <random>
#include <vector>
#include <Eigen/Dense>

#include "hardware/car_interface.hpp"

/*** Stand-in for the real car when no hardware is attached:
 *   - a rectangular room centred on (0,0) plus optional box obstacles
 *   - sonar readings are ray casts from the true pose (+ Gaussian noise)
 *   - forward/backward travel speed_pct cm/s until stop()
 *   - turns are applied immediately                                   */
class SimulatedCar : public CarInterface {
public:
    SimulatedCar(double room_width_cm,
                 double room_height_cm,
                 double noise_std_cm = 0.0,
                 unsigned seed = 42);

    void addBox(double min_x_cm, double min_y_cm, double max_x_cm, double max_y_cm);
    void setTruePose(double x_cm, double y_cm, double heading_deg);
    /** Speeds up simulated travel to match shortened controller waits. */
    void setTimeScale(double scale) { time_scale_ = scale; }

    // CarInterface
    bool   setSensorHeading(double angle_deg) override;
    double readDistance() override;
    bool   turnLeft(double degrees) override;
    bool   turnRight(double degrees) override;
    bool   forward() override;
    bool   backward() override;
    bool   setSpeed(int percent) override;
    bool   stop() override;

    // Ground truth
    double trueX() const;
    double trueY() const;
    double trueHeading() const;
    double sensorHeading() const;
    bool   isMoving() const;

    /** Noise-free distance to the nearest wall along an absolute heading. */
    double rangeAt(double absolute_heading_deg) const;

    static constexpr double MAX_ECHO_CM    = 450.0;
    static constexpr double WALL_MARGIN_CM = 5.0;

private:
    struct Segment {
        Eigen::Vector2d a, b;
    };

    double castRay(const Eigen::Vector2d& origin, double heading_deg) const;
    void   integrateMotion();   // caller holds mtx_

    mutable std::mutex   mtx_;
    std::vector<Segment> walls_;

    Eigen::Vector2d position_{0.0, 0.0};   // cm
    double          heading_deg_{0.0};
    double          pan_deg_{SENSOR_CENTER_DEG};
    int             speed_pct_{0};
    int             direction_{0};          // +1 forward, -1 backward, 0 stopped
    double          time_scale_{1.0};
    std::chrono::steady_clock::time_point motion_start_;

    double                           noise_std_;
    std::mt19937                     rng_;
    std::normal_distribution<double> noise_{0.0, 1.0};
};

#endif // SIMULATED_CAR_HPP
