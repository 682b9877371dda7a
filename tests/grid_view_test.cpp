#include "test_util.h"
#include "ui_backend.h"

namespace {

SelectorSnapshot small_grid(LatticeGeometry geometry) {
    GridSelector sel(geometry, LatticeBounds{{0, 2}, {0, 1}, {0, 0}});
    sel.setCursor(0, 1, 0);
    sel.toggleSelection();
    sel.setCursor(1, 0, 0);
    return sel.snapshot();
}

} // namespace

void test_display_width() {
    test_header("Display Width");

    expect_true(display_width("abc") == 3, "ASCII width");
    expect_true(display_width("┌──┐") == 4, "box drawing glyphs count once");
    expect_true(display_width(" █ ") == 3, "block glyph counts once");
}

void test_rectangular_layout() {
    test_header("Rectangular Layout");

    auto layout = layout_selector(small_grid(LatticeGeometry::Rectangular));
    auto lines = layout.lines();
    expect_true(lines.size() == 12, "title, instructions, info and grid rows");
    expect_true(lines[0].find("VISUAL LATTICE SELECTOR - Rectangular Lattice") != std::string::npos, "title");
    expect_eq(lines[2], "  Arrow Keys: Move cursor  |  Space/Enter: Toggle  |  [/] or ,/. : K-layer", "first instruction");
    expect_eq(lines[5], "  K-Layer: 0  |  Selected: 1 cells", "info line");
    expect_eq(lines[7], "           0   1   2", "column header");
    expect_eq(lines[8], "        ┌───────────┐", "top border");
    expect_eq(lines[9], "      0   ·   ░   ·", "cursor row");
    expect_eq(lines[10], "      1   █   ·   ·", "selected row");
    expect_eq(lines[11], "        └───────────┘", "bottom border");

    bool cursor_styled = false;
    for (const auto& item : layout.items) {
        if (item.style == CellStyle::Cursor && item.row == 9) cursor_styled = true;
    }
    expect_true(cursor_styled, "cursor cell carries the cursor style");
}

void test_hexagonal_layout() {
    test_header("Hexagonal Layout");

    auto snap = small_grid(LatticeGeometry::Hexagonal);
    snap.unbounded = true;
    auto lines = layout_selector(snap).lines();
    expect_true(lines[0].find("Hexagonal Lattice (viewing window)") != std::string::npos, "viewing window title");
    expect_eq(lines[7], "         0   1   2", "column header");
    expect_eq(lines[8], "     0  ·   █   ·", "even row unshifted");
    expect_eq(lines[9], "     1    X   ·   ·", "odd row shifted right by two");
    expect_eq(lines[12], "    Legend: X=Selected  ·=Unselected  █=Cursor  @=Cursor+Selected", "legend");
}

void test_key_bindings() {
    test_header("Key Bindings");

    auto rect = LatticeGeometry::Rectangular;
    auto hex = LatticeGeometry::Hexagonal;
    auto type_of = [](std::optional<SelectorAction> a) { return a->type; };

    expect_true(action_for_key(KEY_UP, rect)->direction == Direction::North, "up is north on rectangular grids");
    expect_true(action_for_key(KEY_UP, hex)->direction == Direction::NorthWest, "up is north-west on hex grids");
    expect_true(action_for_key(KEY_DOWN, hex)->direction == Direction::SouthEast, "down is south-east on hex grids");
    expect_true(action_for_key(KEY_LEFT, hex)->direction == Direction::West, "left is west");
    expect_true(action_for_key('z', hex)->direction == Direction::SouthWest, "z is south-west");
    expect_true(!action_for_key('z', rect), "hex diagonals unbound on rectangular grids");

    expect_true(type_of(action_for_key(' ', rect)) == SelectorAction::Type::Toggle, "space toggles");
    expect_true(type_of(action_for_key('\n', hex)) == SelectorAction::Type::Toggle, "enter toggles");
    expect_true(action_for_key('[', rect)->delta == -1 && action_for_key('>', rect)->delta == 1, "layer keys");
    expect_true(type_of(action_for_key('c', rect)) == SelectorAction::Type::Clear, "c clears rectangular grids");
    expect_true(!action_for_key('c', hex), "c unbound on hex grids");
    expect_true(type_of(action_for_key('r', hex)) == SelectorAction::Type::Clear, "r clears");
    expect_true(type_of(action_for_key('a', hex)) == SelectorAction::Type::SelectAll, "a selects all");
    expect_true(type_of(action_for_key('d', rect)) == SelectorAction::Type::Finalize, "d finishes");
    expect_true(type_of(action_for_key(27, rect)) == SelectorAction::Type::Cancel, "escape cancels");
    expect_true(type_of(action_for_key('q', hex)) == SelectorAction::Type::Cancel, "q cancels");
    expect_true(!action_for_key('?', rect), "unknown keys ignored");
}

void test_keys_drive_selector() {
    test_header("Keys Drive Selector");

    GridSelector sel(LatticeGeometry::Hexagonal, LatticeBounds{{0, 4}, {0, 4}, {0, 1}});
    for (int key : {' ', 'e', ' ', ']', ' ', 'd'}) {
        auto action = action_for_key(key, sel.geometry());
        if (!action) test_fail("key without action");
        sel.apply(*action);
    }
    expect_true(sel.state() == SelectorState::Finalized, "d finalizes");
    auto spec = *sel.result();
    expect_true(spec.isDiscrete() && spec.elementCount() == 3, "three separate picks are discrete");
    auto positions = spec.enumerablePositions();
    expect_true(positions[0] == (LatticeIndex{2, 1, 0}) && positions[1] == (LatticeIndex{2, 1, 1}) &&
                positions[2] == (LatticeIndex{2, 2, 0}), "picks sorted");
}

int main() {
    return run_suite("Grid View Test Suite", {
        test_display_width,
        test_rectangular_layout,
        test_hexagonal_layout,
        test_key_bindings,
        test_keys_drive_selector,
    });
}
