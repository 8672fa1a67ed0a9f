#ifndef ROBOT_UTILS_HPP
#define ROBOT_UTILS_HPP

#include "core/types.hpp"
#include <Eigen/Dense>
#include <cmath>

class RobotUtils {
public:
    // Convert degrees to radians
    static double degToRad(double degrees) {
        return degrees * M_PI / 180.0;
    }

    // Convert radians to degrees
    static double radToDeg(double radians) {
        return radians * 180.0 / M_PI;
    }

    // Normalize heading to [0, 360)
    static double normalizeHeading(double degrees) {
        double h = std::fmod(degrees, 360.0);
        if (h < 0.0) h += 360.0;
        if (h >= 360.0) h -= 360.0;   // fmod(-1e-17) + 360 rounds up to 360
        return h;
    }

    // Rounds half away from zero (std::lround), e.g. 2.5 -> 3, -2.5 -> -3
    static int roundToCell(double v) {
        return static_cast<int>(std::lround(v));
    }

    /** Un-rounded grid offset of a reading taken at relative_angle_deg from a
        robot heading heading_deg.                                         */
    static Eigen::Vector2d polarOffset(double heading_deg, double relative_angle_deg,
                                       double distance_cm, double resolution_cm) {
        double a = degToRad(heading_deg + relative_angle_deg);
        return { distance_cm * std::cos(a) / resolution_cm,
                 distance_cm * std::sin(a) / resolution_cm };
    }

    static GridCell toCell(double x, double y, const Eigen::Vector2d& offset) {
        return { roundToCell(x + offset.x()), roundToCell(y + offset.y()) };
    }

    /** Grid cell hit by a reading of distance_cm at relative_angle_deg. */
    static GridCell polarToGrid(const Pose& origin, double relative_angle_deg,
                                double distance_cm, double resolution_cm) {
        return toCell(origin.x, origin.y,
                      polarOffset(origin.heading_deg, relative_angle_deg,
                                  distance_cm, resolution_cm));
    }

    // Grid cell the robot currently occupies
    static GridCell poseCell(const Pose& pose) {
        return { roundToCell(pose.x), roundToCell(pose.y) };
    }

    // Euclidean distance between two poses in grid units
    static double planarDistance(const Pose& a, const Pose& b) {
        return std::hypot(a.x - b.x, a.y - b.y);
    }
};

#endif // ROBOT_UTILS_HPP
