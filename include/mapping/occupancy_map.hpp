#pragma once
/********************************************************************
 * OccupancyMap – sparse 2-D grid of nearest obstacle distance.
 *  - cells keyed by signed grid coordinates, created on first write
 *  - a cell keeps the smallest distance ever projected into it
 *  - thread-safe (internal mutex); readers copy via cells()
 *******************************************************************/
#include <cstddef>
#include <mutex>
#include <optional>

#include "core/types.hpp"

class OccupancyMap
{
public:
    OccupancyMap() = default;

    /* ───── Updates & queries ─────────────────────────────────────── */
    void observe(int grid_x, int grid_y, double distance_cm);

    std::optional<double> get(int grid_x, int grid_y) const;
    std::size_t           cellCount() const;

    /** min/max over every populated cell; all zero when empty.       */
    MapBounds bounds() const;

    void clear();   ///< only used when a rotation scan restarts the map

    /* ───── Copy-on-read helpers ──────────────────────────────────── */
    Grid cells() const;

    static std::optional<double> lookup(const Grid& grid, int grid_x, int grid_y);
    static MapBounds             boundsOf(const Grid& grid);

private:
    mutable std::mutex grid_mutex_;
    Grid               grid_;
    std::size_t        cell_count_{0};
};
