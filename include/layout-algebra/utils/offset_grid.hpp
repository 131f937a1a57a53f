/**
 * @file offset_grid.hpp
 * @brief Offset tables of layouts for external renderers
 */

#ifndef LAYOUT_ALGEBRA_UTILS_OFFSET_GRID_HPP
#define LAYOUT_ALGEBRA_UTILS_OFFSET_GRID_HPP

#include <string>
#include <vector>
#include "../layout/layout.hpp"
#include "../layout/coordinate.hpp"
#include "../core/error.hpp"

namespace layout_algebra {

/**
 * @struct OffsetGrid
 * @brief Offsets of a layout arranged as rows x cols, stored row by row
 */
struct OffsetGrid {
    index_t rows = 0;
    index_t cols = 0;
    std::vector<index_t> offsets;
    std::vector<std::string> row_labels;
    std::vector<std::string> col_labels;

    /**
     * @brief Offset in a cell
     * @throws RangeError if the cell is outside the grid
     */
    index_t at(index_t row, index_t col) const {
        if (row < 0 || row >= rows || col < 0 || col >= cols) {
            throw RangeError("Cell (" + std::to_string(row) + "," + std::to_string(col) +
                             ") outside " + std::to_string(rows) + "x" +
                             std::to_string(cols) + " grid");
        }
        return offsets[row * cols + col];
    }
};

/**
 * @brief Build the offset table of a layout
 * @param layout Layout to tabulate
 * @return For rank 2, rows are the coordinates of mode 0 and columns those of
 *         mode 1; any other rank gives a single row in enumeration order
 *
 * (4,8):(1,4) gives a 4x8 grid with at(r, c) == r + 4 * c.
 */
inline OffsetGrid make_offset_grid(const Layout& layout) {
    OffsetGrid grid;

    if (!layout.is_leaf() && layout.rank() == 2) {
        Layout row_mode = layout.mode(0);
        Layout col_mode = layout.mode(1);
        std::vector<Coord> row_coords = row_mode.coordinates();
        std::vector<Coord> col_coords = col_mode.coordinates();

        grid.rows = static_cast<index_t>(row_coords.size());
        grid.cols = static_cast<index_t>(col_coords.size());
        grid.offsets.reserve(row_coords.size() * col_coords.size());
        for (const auto& coord : row_coords) {
            grid.row_labels.push_back(format_coordinate(coord));
        }
        for (const auto& coord : col_coords) {
            grid.col_labels.push_back(format_coordinate(coord));
        }
        for (const auto& row_coord : row_coords) {
            index_t row_offset = row_mode.offset(row_coord);
            for (const auto& col_coord : col_coords) {
                grid.offsets.push_back(row_offset + col_mode.offset(col_coord));
            }
        }
        return grid;
    }

    std::vector<Coord> coords = layout.coordinates();
    grid.rows = 1;
    grid.cols = static_cast<index_t>(coords.size());
    grid.offsets.reserve(coords.size());
    for (const auto& coord : coords) {
        grid.col_labels.push_back(format_coordinate(coord));
        grid.offsets.push_back(layout.offset(coord));
    }
    return grid;
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_UTILS_OFFSET_GRID_HPP
