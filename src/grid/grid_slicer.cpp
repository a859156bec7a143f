#include "panel_promote/grid/grid_slicer.hpp"
#include "panel_promote/core/errors.hpp"
#include "panel_promote/core/utils.hpp"

#include <cctype>
#include <map>
#include <set>

namespace panel_promote::grid {

namespace {

const char* kGridExample = "expected \"CxR\" = columns x rows, e.g. \"3x2\" is 3 columns and 2 rows";

bool parse_positive_int(const std::string& s, int& out) {
    if (s.empty() || s.size() > 6) return false;
    long value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    if (value <= 0) return false;
    out = static_cast<int>(value);
    return true;
}

std::string describe(const GridPosition& p) {
    return "[row=" + std::to_string(p.row) + ", col=" + std::to_string(p.col) + "]";
}

std::string describe(const GridSpec& g) {
    return std::to_string(g.cols) + "x" + std::to_string(g.rows) +
           " (cols=" + std::to_string(g.cols) + ", rows=" + std::to_string(g.rows) + ")";
}

} // namespace

GridSpec parse_grid_spec(const std::string& text) {
    const std::string spec = core::trim(text);
    const auto parts = core::split(spec, 'x');
    GridSpec grid;
    if (parts.size() != 2 ||
        !parse_positive_int(parts[0], grid.cols) ||
        !parse_positive_int(parts[1], grid.rows)) {
        throw ValidationError("invalid grid_specification '" + text + "': " + kGridExample);
    }
    return grid;
}

bool position_in_grid(const GridPosition& position, const GridSpec& grid) {
    return position.row >= 0 && position.col >= 0 &&
           position.row < grid.rows && position.col < grid.cols;
}

PanelBounds compute_panel_bounds(const GridPosition& position, const GridSpec& grid,
                                 const ImageSize& image_size) {
    if (grid.cols <= 0 || grid.rows <= 0) {
        throw ValidationError("grid must have positive cols and rows");
    }
    if (!position_in_grid(position, grid)) {
        throw ValidationError("grid_position " + describe(position) + " is outside grid " +
                              describe(grid) + "; positions are [row, col]");
    }

    const int panel_width = image_size.width / grid.cols;
    const int panel_height = image_size.height / grid.rows;

    PanelBounds b;
    b.left = position.col * panel_width;
    b.top = position.row * panel_height;
    b.right = b.left + panel_width;
    b.bottom = b.top + panel_height;
    return b;
}

int panel_index(const GridPosition& position, const GridSpec& grid) {
    return position.row * grid.cols + position.col + 1;
}

void validate_grid_positions(const std::vector<PanelSpec>& panels, const GridSpec& grid) {
    if (panels.empty()) {
        throw ValidationError("plan contains no panels");
    }

    std::set<std::string> ids;
    std::map<GridPosition, std::string> positions;
    for (const auto& p : panels) {
        if (p.panel_id.empty()) {
            throw ValidationError("panel_id must not be empty");
        }
        // Seeds hash the UTF-8 bytes of the id, and every report serializes it.
        if (!core::is_valid_utf8(p.panel_id)) {
            throw ValidationError("panel_id must be valid UTF-8 (panel at " +
                                  describe(p.grid_position) + ")");
        }
        if (!ids.insert(p.panel_id).second) {
            throw ValidationError("duplicate panel_id '" + p.panel_id + "'");
        }
        if (!position_in_grid(p.grid_position, grid)) {
            throw ValidationError("panel '" + p.panel_id + "' grid_position " +
                                  describe(p.grid_position) + " is outside grid " +
                                  describe(grid) + "; positions are [row, col], " + kGridExample);
        }
        auto it = positions.find(p.grid_position);
        if (it != positions.end()) {
            throw ValidationError("duplicate grid_position " + describe(p.grid_position) +
                                  " used by '" + it->second + "' and '" + p.panel_id + "'");
        }
        positions.emplace(p.grid_position, p.panel_id);
    }
}

} // namespace panel_promote::grid
