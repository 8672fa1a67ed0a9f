#ifndef TYPES_HPP
#define TYPES_HPP

#include <map>

/*** Robot pose: x, y in grid units, heading in degrees [0, 360) ***/
struct Pose {
    double x, y, heading_deg;

    Pose() : x(0), y(0), heading_deg(0) {}
    Pose(double x_, double y_, double heading_) : x(x_), y(y_), heading_deg(heading_) {}
};

/*** Grid cell coordinate ***/
struct GridCell {
    int x{0};
    int y{0};

    bool operator==(const GridCell& o) const { return x == o.x && y == o.y; }
    bool operator<(const GridCell& o) const { return x < o.x || (x == o.x && y < o.y); }
};

struct MapBounds {
    int min_x{0}, max_x{0};
    int min_y{0}, max_y{0};
};

// grid_x -> (grid_y -> nearest obstacle distance, cm)
using GridColumn = std::map<int, double>;
using Grid       = std::map<int, GridColumn>;

/*** Read-only export of the mapper state for visualisation ***/
struct MapSnapshot {
    Grid      grid;
    Pose      pose;
    double    resolution{0.0};   // cm per cell
    MapBounds bounds;
    double    confidence{0.0};   // last localization score
    long      cycle{0};
};

#endif // TYPES_HPP
