#ifndef _CellPath_grid_view_h_
#define _CellPath_grid_view_h_

//
// Terminal rendering and key bindings for GridSelector
//

enum class CellStyle { Normal, Selected, Cursor, CursorSelected, Label, Dim, Title, Info };

struct GridText {
    int row = 0;
    int col = 0;
    std::string text;
    CellStyle style = CellStyle::Normal;
};

// Screen content of one frame; rows/cols is the terminal size it needs
struct GridLayout {
    std::vector<GridText> items;
    int rows = 0;
    int cols = 0;

    void put(int row, int col, const std::string& text, CellStyle style = CellStyle::Normal);
    std::vector<std::string> lines() const;   // plain text, styles dropped
};

size_t display_width(const std::string& utf8);

GridLayout layout_selector(const SelectorSnapshot& snap);
std::vector<std::string> selector_instructions(LatticeGeometry geometry);

std::optional<SelectorAction> action_for_key(int key, LatticeGeometry geometry);

// Full-screen ncurses session; none when the operator cancels
std::optional<LatticeSpec> run_grid_selector(LatticeGeometry geometry, const LatticeBounds& bounds, bool unbounded);

#endif
