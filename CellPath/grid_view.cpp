#include "CellPath.h"
#include "ui_backend.h"

namespace {

std::vector<std::string> split_glyphs(const std::string& utf8){
    std::vector<std::string> out;
    for(size_t pos = 0; pos < utf8.size();){
        unsigned char c = static_cast<unsigned char>(utf8[pos]);
        size_t len = 1;
        if((c & 0xE0) == 0xC0) len = 2;
        else if((c & 0xF0) == 0xE0) len = 3;
        else if((c & 0xF8) == 0xF0) len = 4;
        len = std::min(len, utf8.size() - pos);
        out.push_back(utf8.substr(pos, len));
        pos += len;
    }
    return out;
}

std::string pad_int(int64_t v, int width){
    std::string s = std::to_string(v);
    if(static_cast<int>(s.size()) < width) s.insert(0, static_cast<size_t>(width) - s.size(), ' ');
    return s;
}

std::string repeat(const std::string& s, int n){
    std::string out;
    for(int i = 0; i < n; ++i) out += s;
    return out;
}

CellStyle cell_style(bool at_cursor, bool selected){
    if(at_cursor && selected) return CellStyle::CursorSelected;
    if(at_cursor) return CellStyle::Cursor;
    if(selected) return CellStyle::Selected;
    return CellStyle::Normal;
}

void layout_rectangular(const SelectorSnapshot& snap, GridLayout& layout, int start_row, int start_col){
    const auto& b = snap.bounds;
    std::string header = "    ";
    for(int64_t i = b.i.min; i <= b.i.max; ++i) header += pad_int(i, 4);
    layout.put(start_row, start_col, header, CellStyle::Label);

    int width = static_cast<int>(b.i.size()) * 4 + 1;
    layout.put(start_row + 1, start_col + 4, "┌" + repeat("─", width - 2) + "┐", CellStyle::Dim);

    for(int64_t j = b.j.min; j <= b.j.max; ++j){
        int row = start_row + 2 + static_cast<int>(j - b.j.min);
        layout.put(row, start_col, pad_int(j, 3) + " ", CellStyle::Label);
        for(int64_t i = b.i.min; i <= b.i.max; ++i){
            int col = start_col + 4 + static_cast<int>(i - b.i.min) * 4;
            bool at_cursor = (i == snap.cursor_i && j == snap.cursor_j);
            bool selected = snap.isSelected(static_cast<int>(i), static_cast<int>(j));
            const char* glyph = selected ? "█" : (at_cursor ? "░" : "·");
            layout.put(row, col + 1, std::string(" ") + glyph + " ", cell_style(at_cursor, selected));
        }
    }

    int bottom = start_row + 2 + static_cast<int>(b.j.size());
    layout.put(bottom, start_col + 4, "└" + repeat("─", width - 2) + "┘", CellStyle::Dim);
}

// Compact hex format: odd j rows shifted right by two columns
void layout_hexagonal(const SelectorSnapshot& snap, GridLayout& layout, int start_row, int start_col){
    const auto& b = snap.bounds;
    std::string header = "   ";
    for(int64_t i = b.i.min; i <= b.i.max; ++i) header += " " + pad_int(i, 2) + " ";
    layout.put(start_row, start_col, header, CellStyle::Dim);
    int row = start_row + 1;

    for(int64_t j = b.j.min; j <= b.j.max; ++j, ++row){
        layout.put(row, start_col, pad_int(j, 2) + " ", CellStyle::Dim);
        int col = start_col + 3;
        if(j % 2 != 0) col += 2;
        for(int64_t i = b.i.min; i <= b.i.max; ++i, col += 4){
            bool at_cursor = (i == snap.cursor_i && j == snap.cursor_j);
            bool selected = snap.isSelected(static_cast<int>(i), static_cast<int>(j));
            const char* glyph = "·";
            if(at_cursor && selected) glyph = "@";
            else if(at_cursor) glyph = "█";
            else if(selected) glyph = "X";
            layout.put(row, col, std::string(" ") + glyph + "  ", cell_style(at_cursor, selected));
        }
    }

    int legend = row + 2;
    layout.put(legend, start_col, "Legend: X=Selected  ·=Unselected  █=Cursor  @=Cursor+Selected", CellStyle::Dim);
    layout.put(legend + 1, start_col, "Note: Odd rows (j) shifted right to show hexagonal adjacency", CellStyle::Dim);
}

attr_t attr_for(CellStyle style){
    switch(style){
        case CellStyle::Normal: return A_NORMAL;
        case CellStyle::Selected: return A_BOLD | (has_colors() ? COLOR_PAIR(2) : 0);
        case CellStyle::Cursor: return A_REVERSE;
        case CellStyle::CursorSelected: return A_REVERSE | A_BOLD;
        case CellStyle::Label: return A_NORMAL;
        case CellStyle::Dim: return A_DIM;
        case CellStyle::Title: return A_BOLD | (has_colors() ? COLOR_PAIR(1) : 0);
        case CellStyle::Info: return A_REVERSE;
    }
    return A_NORMAL;
}

void draw_layout(const GridLayout& layout){
    for(const auto& item : layout.items){
        ui_print(item.row, item.col, item.text, attr_for(item.style));
    }
}

void show_message(const char* msg){
    ui_print(0, 0, msg, A_REVERSE);
    ui_refresh();
}

} // namespace

size_t display_width(const std::string& utf8){
    return split_glyphs(utf8).size();
}

void GridLayout::put(int row, int col, const std::string& text, CellStyle style){
    items.push_back(GridText{row, col, text, style});
    rows = std::max(rows, row + 1);
    cols = std::max(cols, col + static_cast<int>(display_width(text)));
}

std::vector<std::string> GridLayout::lines() const {
    std::vector<std::vector<std::string>> screen(static_cast<size_t>(rows),
                                                 std::vector<std::string>(static_cast<size_t>(cols), " "));
    for(const auto& item : items){
        int col = item.col;
        for(const auto& glyph : split_glyphs(item.text)){
            if(item.row >= 0 && col >= 0 && col < cols) screen[item.row][col] = glyph;
            ++col;
        }
    }
    std::vector<std::string> out;
    for(const auto& row : screen){
        size_t end = row.size();
        while(end > 0 && row[end - 1] == " ") --end;
        std::string line;
        for(size_t c = 0; c < end; ++c) line += row[c];
        out.push_back(line);
    }
    return out;
}

std::vector<std::string> selector_instructions(LatticeGeometry geometry){
    if(geometry == LatticeGeometry::Hexagonal){
        return {
            "Arrow Keys: Move (6-dir hex)  |  W/E/Z/X: Diagonals  |  Space/Enter: Toggle",
            "[/] or ,/. : K-layer  |  a: Select all  |  r: Clear  |  d: Done  |  q/ESC: Cancel"
        };
    }
    return {
        "Arrow Keys: Move cursor  |  Space/Enter: Toggle  |  [/] or ,/. : K-layer",
        "a: Select all  |  c: Clear all  |  d: Done  |  q/ESC: Cancel"
    };
}

GridLayout layout_selector(const SelectorSnapshot& snap){
    GridLayout layout;
    std::string title = std::string("VISUAL LATTICE SELECTOR - ") + geometry_label(snap.geometry) + " Lattice";
    if(snap.unbounded) title += " (viewing window)";
    auto instructions = selector_instructions(snap.geometry);
    int width = static_cast<int>(display_width(title));
    for(const auto& line : instructions) width = std::max(width, static_cast<int>(display_width(line)) + 2);
    layout.put(0, std::max(0, (width - static_cast<int>(display_width(title))) / 2), title, CellStyle::Title);

    for(size_t n = 0; n < instructions.size(); ++n){
        layout.put(2 + static_cast<int>(n), 2, instructions[n]);
    }

    std::string info = "K-Layer: " + std::to_string(snap.layer) + "  |  Selected: " +
                       std::to_string(snap.selected.size()) + " cells";
    layout.put(5, 2, info, CellStyle::Info);

    if(snap.geometry == LatticeGeometry::Hexagonal) layout_hexagonal(snap, layout, 7, 4);
    else layout_rectangular(snap, layout, 7, 4);
    return layout;
}

std::optional<SelectorAction> action_for_key(int key, LatticeGeometry geometry){
    bool hex = geometry == LatticeGeometry::Hexagonal;
    switch(key){
        case 'q':
        case 27:  // ESC
            return SelectorAction::of(SelectorAction::Type::Cancel);
        case '\n':
        case '\r':
        case ' ':
        case KEY_ENTER:
            return SelectorAction::of(SelectorAction::Type::Toggle);
        case 'd':
            return SelectorAction::of(SelectorAction::Type::Finalize);
        case KEY_UP:
            return SelectorAction::move(hex ? Direction::NorthWest : Direction::North);
        case KEY_DOWN:
            return SelectorAction::move(hex ? Direction::SouthEast : Direction::South);
        case KEY_LEFT:
            return SelectorAction::move(Direction::West);
        case KEY_RIGHT:
            return SelectorAction::move(Direction::East);
        case '[':
        case ',':
        case '<':
            return SelectorAction::layer(-1);
        case ']':
        case '.':
        case '>':
            return SelectorAction::layer(+1);
        case 'a':
            return SelectorAction::of(SelectorAction::Type::SelectAll);
        case 'r':
            return SelectorAction::of(SelectorAction::Type::Clear);
        case 'c':
            if(!hex) return SelectorAction::of(SelectorAction::Type::Clear);
            break;
        case 'e':
            if(hex) return SelectorAction::move(Direction::NorthEast);
            break;
        case 'w':
            if(hex) return SelectorAction::move(Direction::NorthWest);
            break;
        case 'x':
            if(hex) return SelectorAction::move(Direction::SouthEast);
            break;
        case 'z':
            if(hex) return SelectorAction::move(Direction::SouthWest);
            break;
        default:
            break;
    }
    return std::nullopt;
}

std::optional<LatticeSpec> run_grid_selector(LatticeGeometry geometry, const LatticeBounds& bounds, bool unbounded){
    TRACE_FN("geometry=", geometry_label(geometry), ", unbounded=", unbounded);
    GridSelector selector(geometry, bounds, unbounded);
    UiSession ui;

    while(selector.active()){
        auto layout = layout_selector(selector.snapshot());
        ui_clear();
        if(layout.rows > ui_rows() || layout.cols > ui_cols()){
            // selection and cursor survive until the terminal is resized
            show_message(i18n::get(i18n::MsgId::TERMINAL_TOO_SMALL));
        } else {
            draw_layout(layout);
            ui_refresh();
        }

        int key = ui_getch();
        if(key == ERR){
            // input closed underneath us
            selector.cancel();
            break;
        }
        if(key == KEY_RESIZE) continue;
        auto action = action_for_key(key, geometry);
        if(!action) continue;
        if(selector.apply(*action) == ActionOutcome::EmptySelection){
            show_message(i18n::get(i18n::MsgId::NO_CELLS_SELECTED));
            ui_getch();
        }
    }
    return selector.result();
}
