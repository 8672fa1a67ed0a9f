#include "hardware/simulated_car.hpp"
#include "core/robot_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

static inline double cross2(const Eigen::Vector2d& a, const Eigen::Vector2d& b)
{
    return a.x() * b.y() - a.y() * b.x();
}

SimulatedCar::SimulatedCar(double room_width_cm, double room_height_cm,
                           double noise_std_cm, unsigned seed)
    : noise_std_(noise_std_cm), rng_(seed)
{
    if (room_width_cm <= 0.0 || room_height_cm <= 0.0)
        throw std::invalid_argument("room dimensions must be positive");

    addBox(-room_width_cm / 2.0, -room_height_cm / 2.0,
            room_width_cm / 2.0,  room_height_cm / 2.0);

    std::cout << "[SIM] room " << room_width_cm << "×" << room_height_cm
              << " cm, noise σ=" << noise_std_cm << " cm\n";
}

void SimulatedCar::addBox(double min_x, double min_y, double max_x, double max_y)
{
    std::lock_guard<std::mutex> lk(mtx_);
    const Eigen::Vector2d p0(min_x, min_y), p1(max_x, min_y),
                          p2(max_x, max_y), p3(min_x, max_y);
    walls_.push_back({p0, p1});
    walls_.push_back({p1, p2});
    walls_.push_back({p2, p3});
    walls_.push_back({p3, p0});
}

void SimulatedCar::setTruePose(double x_cm, double y_cm, double heading_deg)
{
    std::lock_guard<std::mutex> lk(mtx_);
    position_    = Eigen::Vector2d(x_cm, y_cm);
    heading_deg_ = RobotUtils::normalizeHeading(heading_deg);
}

/* ───────────────────────── Sensor ───────────────────────────────── */
bool SimulatedCar::setSensorHeading(double angle_deg)
{
    std::lock_guard<std::mutex> lk(mtx_);
    pan_deg_ = std::clamp(angle_deg, SENSOR_MIN_DEG, SENSOR_MAX_DEG);
    return true;
}

double SimulatedCar::readDistance()
{
    std::lock_guard<std::mutex> lk(mtx_);
    double d = castRay(position_, heading_deg_ + (pan_deg_ - SENSOR_CENTER_DEG));
    if (d > MAX_ECHO_CM) return 0.0;   // no echo
    if (noise_std_ > 0.0) d += noise_std_ * noise_(rng_);
    return std::max(0.0, d);
}

double SimulatedCar::rangeAt(double absolute_heading_deg) const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return castRay(position_, absolute_heading_deg);
}

/* Ray / segment intersection ------------------------------------- */
double SimulatedCar::castRay(const Eigen::Vector2d& origin, double heading_deg) const
{
    double a = RobotUtils::degToRad(heading_deg);
    const Eigen::Vector2d dir(std::cos(a), std::sin(a));

    double best = std::numeric_limits<double>::infinity();
    for (const auto& w : walls_) {
        const Eigen::Vector2d e = w.b - w.a;
        double denom = cross2(dir, e);
        if (std::abs(denom) < 1e-12) continue;          // parallel

        const Eigen::Vector2d q = w.a - origin;
        double t = cross2(q, e) / denom;                 // along the ray
        double u = cross2(q, dir) / denom;               // along the wall
        if (t > 1e-9 && u >= 0.0 && u <= 1.0)
            best = std::min(best, t);
    }
    return best;
}

/* ───────────────────────── Motion ───────────────────────────────── */
bool SimulatedCar::turnLeft(double degrees)
{
    std::lock_guard<std::mutex> lk(mtx_);
    integrateMotion();
    heading_deg_ = RobotUtils::normalizeHeading(heading_deg_ - degrees);
    return true;
}

bool SimulatedCar::turnRight(double degrees)
{
    std::lock_guard<std::mutex> lk(mtx_);
    integrateMotion();
    heading_deg_ = RobotUtils::normalizeHeading(heading_deg_ + degrees);
    return true;
}

bool SimulatedCar::forward()
{
    std::lock_guard<std::mutex> lk(mtx_);
    integrateMotion();
    direction_ = 1;
    return true;
}

bool SimulatedCar::backward()
{
    std::lock_guard<std::mutex> lk(mtx_);
    integrateMotion();
    direction_ = -1;
    return true;
}

bool SimulatedCar::setSpeed(int percent)
{
    std::lock_guard<std::mutex> lk(mtx_);
    integrateMotion();
    speed_pct_ = std::clamp(percent, 0, 100);
    return true;
}

bool SimulatedCar::stop()
{
    std::lock_guard<std::mutex> lk(mtx_);
    integrateMotion();
    direction_ = 0;
    speed_pct_ = 0;
    return true;
}

/* Applies travel since the last motion command; walls stop the car */
void SimulatedCar::integrateMotion()
{
    auto now = std::chrono::steady_clock::now();
    double dt = std::chrono::duration<double>(now - motion_start_).count();
    motion_start_ = now;

    if (direction_ == 0 || speed_pct_ == 0) return;

    double travel = dt * time_scale_ * speed_pct_;    // speed_pct cm/s
    double travel_heading = heading_deg_ + (direction_ < 0 ? 180.0 : 0.0);
    double free = castRay(position_, travel_heading) - WALL_MARGIN_CM;
    travel = std::clamp(travel, 0.0, std::max(0.0, free));

    double a = RobotUtils::degToRad(travel_heading);
    position_ += travel * Eigen::Vector2d(std::cos(a), std::sin(a));
}

/* ───────────────────────── Ground truth ─────────────────────────── */
double SimulatedCar::trueX() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return position_.x();
}

double SimulatedCar::trueY() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return position_.y();
}

double SimulatedCar::trueHeading() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return heading_deg_;
}

double SimulatedCar::sensorHeading() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return pan_deg_;
}

bool SimulatedCar::isMoving() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return direction_ != 0 && speed_pct_ > 0;
}
