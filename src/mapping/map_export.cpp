#include "mapping/map_export.hpp"
#include "core/robot_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

/* ────────────────────────── Image export ────────────────────────── */
cv::Mat renderSnapshot(const MapSnapshot& snapshot, int pixels_per_cell, int canvas)
{
    cv::Mat img(canvas, canvas, CV_8UC3, cv::Scalar(249, 249, 249));
    const cv::Point c(canvas / 2, canvas / 2);

    for (const auto& [gx, column] : snapshot.grid)
        for (const auto& [gy, distance] : column)
        {
            cv::Point p(c.x + gx * pixels_per_cell,
                        c.y - gy * pixels_per_cell);          // flip y
            int g = static_cast<int>(std::max(0.0, 255.0 - distance * 2.0));
            g = std::min(g, 255);
            cv::Scalar col(0, g, 255 - g);                     // BGR
            cv::rectangle(img, cv::Point(p.x - 2, p.y - 2),
                          cv::Point(p.x + 2, p.y + 2), col, cv::FILLED);
        }

    /* robot position + heading --------------------------------------- */
    cv::Point robot(c.x + static_cast<int>(snapshot.pose.x * pixels_per_cell),
                    c.y - static_cast<int>(snapshot.pose.y * pixels_per_cell));
    cv::circle(img, robot, 8, cv::Scalar(255, 123, 0), cv::FILLED);

    double h = RobotUtils::degToRad(snapshot.pose.heading_deg);
    cv::Point tip(robot.x + static_cast<int>(std::cos(h) * 12.0),
                  robot.y - static_cast<int>(std::sin(h) * 12.0));
    cv::line(img, robot, tip, cv::Scalar(0, 0, 255), 2);

    return img;
}

bool saveSnapshotImage(const std::string& filename, const MapSnapshot& snapshot)
{
    try {
        cv::Mat img = renderSnapshot(snapshot);
        if (!cv::imwrite(filename, img)) {
            std::cerr << "[EXPORT] can't write " << filename << '\n';
            return false;
        }
        return true;
    }
    catch (const cv::Exception& e) {
        std::cerr << "[EXPORT] image export failed: " << e.what() << '\n';
        return false;
    }
}

/* ─────────────────────────── CSV export ─────────────────────────── */
bool saveSnapshotCSV(const std::string& filename, const MapSnapshot& snapshot)
{
    std::ofstream ofs(filename);
    if (!ofs) {
        std::cerr << "[EXPORT] can't open " << filename << '\n';
        return false;
    }

    ofs << "# resolution_cm," << snapshot.resolution << '\n';
    ofs << "# pose," << snapshot.pose.x << ',' << snapshot.pose.y << ','
        << snapshot.pose.heading_deg << '\n';
    ofs << "grid_x,grid_y,distance_cm\n";
    for (const auto& [gx, column] : snapshot.grid)
        for (const auto& [gy, distance] : column)
            ofs << gx << ',' << gy << ',' << distance << '\n';

    return static_cast<bool>(ofs);
}
