#pragma once

#include "panel_promote/core/types.hpp"
#include <string>
#include <vector>

namespace panel_promote::grid {

// Parses "CxR" (columns x rows), e.g. "3x2" is 3 columns and 2 rows.
// Throws ValidationError on anything but two positive decimal integers.
GridSpec parse_grid_spec(const std::string& text);

// Integer-division slicing: remainder pixels on the right/bottom edge belong
// to no panel. Throws ValidationError when the position lies outside the grid.
PanelBounds compute_panel_bounds(const GridPosition& position, const GridSpec& grid,
                                 const ImageSize& image_size);

bool position_in_grid(const GridPosition& position, const GridSpec& grid);

// 1-based row-major index used for output file names.
int panel_index(const GridPosition& position, const GridSpec& grid);

// Rejects empty plans, empty or duplicate panel ids, duplicate positions and
// positions outside the grid.
void validate_grid_positions(const std::vector<PanelSpec>& panels, const GridSpec& grid);

} // namespace panel_promote::grid
