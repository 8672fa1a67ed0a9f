#include "mapping/occupancy_map.hpp"
#include <algorithm>

/* ───────────────────────── Update ───────────────────────────────── */
void OccupancyMap::observe(int grid_x, int grid_y, double distance_cm)
{
    std::lock_guard<std::mutex> lock(grid_mutex_);

    GridColumn& column = grid_[grid_x];
    auto it = column.find(grid_y);
    if (it == column.end()) {
        column.emplace(grid_y, distance_cm);
        ++cell_count_;
    } else {
        it->second = std::min(it->second, distance_cm);
    }
}

/* ───────────────────────── Queries ──────────────────────────────── */
std::optional<double> OccupancyMap::get(int grid_x, int grid_y) const
{
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return lookup(grid_, grid_x, grid_y);
}

std::size_t OccupancyMap::cellCount() const
{
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return cell_count_;
}

MapBounds OccupancyMap::bounds() const
{
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return boundsOf(grid_);
}

Grid OccupancyMap::cells() const
{
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return grid_;   // copy
}

void OccupancyMap::clear()
{
    std::lock_guard<std::mutex> lock(grid_mutex_);
    grid_.clear();
    cell_count_ = 0;
}

/* ───────────────────────── Static helpers ───────────────────────── */
std::optional<double> OccupancyMap::lookup(const Grid& grid, int grid_x, int grid_y)
{
    auto col = grid.find(grid_x);
    if (col == grid.end()) return std::nullopt;

    auto cell = col->second.find(grid_y);
    if (cell == col->second.end()) return std::nullopt;

    return cell->second;
}

MapBounds OccupancyMap::boundsOf(const Grid& grid)
{
    MapBounds b;
    bool first = true;

    for (const auto& [x, column] : grid) {
        if (column.empty()) continue;

        // columns are ordered by y
        int lo = column.begin()->first;
        int hi = column.rbegin()->first;

        if (first) {
            b.min_x = b.max_x = x;
            b.min_y = lo;
            b.max_y = hi;
            first = false;
            continue;
        }
        b.min_x = std::min(b.min_x, x);
        b.max_x = std::max(b.max_x, x);
        b.min_y = std::min(b.min_y, lo);
        b.max_y = std::max(b.max_y, hi);
    }
    return b;
}
