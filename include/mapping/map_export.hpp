#ifndef MAP_EXPORT_HPP
#define MAP_EXPORT_HPP

#include <string>
#include <opencv2/core.hpp>

#include "core/types.hpp"

/** BGR image of a snapshot centred on grid (0,0), y axis pointing up.
 *  Obstacles are coloured by distance (closer = redder), the robot is a
 *  blue dot with a red heading line.                                    */
cv::Mat renderSnapshot(const MapSnapshot& snapshot,
                       int pixels_per_cell = 20,
                       int canvas = 600);

bool saveSnapshotImage(const std::string& filename, const MapSnapshot& snapshot);
bool saveSnapshotCSV(const std::string& filename, const MapSnapshot& snapshot);

#endif // MAP_EXPORT_HPP
