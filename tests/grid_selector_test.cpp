#include "test_util.h"

namespace {

using Cell = std::pair<int64_t, int64_t>;

LatticeBounds box(int imin, int imax, int jmin, int jmax, int kmin, int kmax) {
    return LatticeBounds{{imin, imax}, {jmin, jmax}, {kmin, kmax}};
}

const Direction kHexDirections[] = {
    Direction::East, Direction::West, Direction::NorthEast,
    Direction::NorthWest, Direction::SouthEast, Direction::SouthWest,
};

Direction opposite(Direction d) {
    switch (d) {
        case Direction::North: return Direction::South;
        case Direction::South: return Direction::North;
        case Direction::East: return Direction::West;
        case Direction::West: return Direction::East;
        case Direction::NorthEast: return Direction::SouthWest;
        case Direction::NorthWest: return Direction::SouthEast;
        case Direction::SouthEast: return Direction::NorthWest;
        case Direction::SouthWest: return Direction::NorthEast;
    }
    return d;
}

} // namespace

void test_initial_state() {
    test_header("Initial State");

    GridSelector sel(LatticeGeometry::Rectangular, box(0, 9, 0, 9, 0, 2));
    expect_true(sel.active(), "selector starts active");
    expect_true(sel.cursorI() == 4 && sel.cursorJ() == 4 && sel.layer() == 1, "cursor at floor midpoint");
    expect_true(sel.selected().empty(), "nothing selected");

    GridSelector neg(LatticeGeometry::Hexagonal, box(-5, 4, -3, 0, 0, 0));
    expect_true(neg.cursorI() == -1 && neg.cursorJ() == -2, "midpoint rounds toward negative infinity");

    expect_error(CellPathError::Kind::InvalidRange,
                 []{ GridSelector bad(LatticeGeometry::Rectangular, box(3, 1, 0, 0, 0, 0)); },
                 "reversed bounds rejected");
}

void test_box_round_trip() {
    test_header("Box Round Trip");

    GridSelector sel(LatticeGeometry::Rectangular, box(2, 4, 0, 1, 0, 2));
    sel.selectAll();
    expect_true(sel.selected().size() == 18, "select all covers every layer");
    auto spec = sel.finalize();
    expect_true(spec.isContiguous(), "full box is contiguous");
    expect_true(spec.elementCount() == 18, "element count equals box volume");
    expect_eq(spec.toRangeToken(), "[2:4 0:1 0:2]", "box ranges");
    expect_true(sel.state() == SelectorState::Finalized && sel.result() && *sel.result() == spec, "result kept");
}

void test_box_with_hole() {
    test_header("Box With Hole");

    GridSelector sel(LatticeGeometry::Rectangular, box(0, 2, 0, 2, 0, 2));
    sel.selectAll();
    sel.setCursor(1, 1, 1);
    sel.toggleSelection();
    expect_true(sel.selected().size() == 26, "interior cell removed");

    auto spec = sel.finalize();
    expect_true(spec.isDiscrete(), "box with a hole is discrete");
    expect_true(spec.elementCount() == 26, "volume minus one elements");
    auto positions = spec.enumerablePositions();
    expect_true(std::is_sorted(positions.begin(), positions.end()), "elements sorted ascending");
    expect_true(std::find(positions.begin(), positions.end(), LatticeIndex{1, 1, 1}) == positions.end(),
                "removed cell absent");
}

void test_selection_contiguity() {
    test_header("Selection Contiguity");

    std::set<LatticeIndex> row = {{0, 0, 0}, {1, 0, 0}, {2, 0, 0}};
    expect_eq(spec_from_selection(row).toRangeToken(), "[0:2 0 0]", "row becomes a range");

    std::set<LatticeIndex> single = {{5, 5, 0}};
    expect_eq(spec_from_selection(single).toRangeToken(), "[5 5 0]", "single cell");

    std::set<LatticeIndex> diagonal = {{0, 0, 0}, {1, 1, 0}};
    expect_true(!is_selection_contiguous(diagonal), "diagonal pair is not contiguous");

    std::set<LatticeIndex> layers = {{0, 0, 0}, {0, 0, 2}};
    expect_true(!is_selection_contiguous(layers), "gap across layers detected");

    expect_error(CellPathError::Kind::EmptySelection,
                 []{ spec_from_selection({}); }, "empty selection rejected");
}

void test_rectangular_moves() {
    test_header("Rectangular Moves");

    GridSelector sel(LatticeGeometry::Rectangular, box(0, 1, 0, 1, 0, 0));
    sel.setCursor(0, 0, 0);
    expect_true(!sel.move(Direction::West), "move past i minimum is a no-op");
    expect_true(!sel.move(Direction::North), "move past j minimum is a no-op");
    expect_true(sel.cursorI() == 0 && sel.cursorJ() == 0, "cursor unchanged at the edge");
    expect_true(sel.move(Direction::East) && sel.cursorI() == 1, "east increments i");
    expect_true(sel.move(Direction::South) && sel.cursorJ() == 1, "south increments j");
    expect_true(!sel.move(Direction::NorthEast), "diagonals ignored on rectangular grids");

    expect_true(!sel.changeLayer(+1), "single layer cannot change");
}

void test_hex_moves() {
    test_header("Hexagonal Moves");

    auto ne_even = hex_neighbor(3, 2, Direction::NorthEast);
    auto ne_odd = hex_neighbor(3, 3, Direction::NorthEast);
    expect_true(ne_even == Cell(3, 1), "NE from even row keeps i");
    expect_true(ne_odd == Cell(4, 2), "NE from odd row shifts i");

    for (int j : {-3, -2, 0, 1, 2, 5}) {
        for (Direction d : kHexDirections) {
            auto there = hex_neighbor(0, j, d);
            auto back = hex_neighbor(there.first, there.second, opposite(d));
            if (back != Cell(0, j)) {
                test_fail(std::string("hex move ") + direction_label(d) + " not inverted at j=" + std::to_string(j));
            }
        }
    }
    test_pass("every hex move is inverted by its opposite on even and odd rows");

    GridSelector sel(LatticeGeometry::Hexagonal, box(0, 4, 0, 4, 0, 0));
    sel.setCursor(2, 2, 0);
    expect_true(sel.move(Direction::SouthWest) && sel.cursorI() == 1 && sel.cursorJ() == 3, "SW from even row");
    expect_true(sel.move(Direction::SouthEast) && sel.cursorI() == 2 && sel.cursorJ() == 4, "SE from odd row");
    expect_true(!sel.move(Direction::SouthEast), "move past j maximum is a no-op");
    expect_true(!sel.move(Direction::North), "north is not a hex direction");
}

void test_layers_and_clear() {
    test_header("Layers And Clear");

    GridSelector sel(LatticeGeometry::Rectangular, box(0, 2, 0, 2, 0, 2));
    expect_true(sel.changeLayer(+1) && sel.layer() == 2, "layer up");
    expect_true(!sel.changeLayer(+1) && sel.layer() == 2, "layer clamped at maximum");
    sel.toggleSelection();
    expect_true(sel.isSelected({1, 1, 2}), "toggle selects on the current layer");
    sel.changeLayer(-2);
    expect_true(sel.layer() == 0 && !sel.isSelected({1, 1, 0}), "layers are independent");
    expect_true(sel.snapshot().selectedInLayer() == 0 && sel.snapshot().selected.size() == 1, "snapshot counts per layer");
    sel.toggleSelection();
    sel.toggleSelection();
    expect_true(!sel.isSelected({1, 1, 0}), "second toggle deselects");
    expect_true(sel.clearSelection() && sel.selected().empty(), "clear empties the set");
    expect_true(!sel.clearSelection(), "clearing an empty set changes nothing");
}

void test_finalize_and_cancel() {
    test_header("Finalize And Cancel");

    GridSelector sel(LatticeGeometry::Rectangular, box(0, 2, 0, 2, 0, 0));
    expect_error(CellPathError::Kind::EmptySelection, [&]{ sel.finalize(); }, "empty finalize rejected");
    expect_true(sel.active(), "selector stays active after empty finalize");
    expect_true(sel.apply(SelectorAction::of(SelectorAction::Type::Finalize)) == ActionOutcome::EmptySelection,
                "apply reports empty selection without throwing");

    expect_true(sel.apply(SelectorAction::of(SelectorAction::Type::Toggle)) == ActionOutcome::Changed, "apply toggle");
    expect_true(sel.apply(SelectorAction::of(SelectorAction::Type::Finalize)) == ActionOutcome::Finalized, "apply finalize");
    expect_eq(sel.result()->toRangeToken(), "[1 1 0]", "finalized at the cursor");
    expect_true(!sel.toggleSelection(), "finalized selector ignores input");
    expect_true(sel.apply(SelectorAction::move(Direction::East)) == ActionOutcome::Unchanged, "apply on closed selector");
    expect_error(CellPathError::Kind::SelectorClosed, [&]{ sel.finalize(); }, "second finalize rejected");

    GridSelector other(LatticeGeometry::Hexagonal, box(0, 2, 0, 2, 0, 0));
    other.selectAll();
    expect_true(other.apply(SelectorAction::of(SelectorAction::Type::Cancel)) == ActionOutcome::Cancelled, "apply cancel");
    expect_true(other.state() == SelectorState::Cancelled && !other.result(), "cancel yields no spec");
}

void test_size_guard() {
    test_header("Size Guard");

    WizardConfig config;
    auto small = check_selector_size(box(0, 19, 0, 19, 0, 4), config);
    expect_true(small.ok(), "20x20x5 is within both limits");

    auto wide = check_selector_size(box(0, 20, 0, 19, 0, 0), config);
    expect_true(wide.layer_exceeded && wide.cells_per_layer == 420, "21x20 layer exceeds 400");
    expect_true(!wide.warnings().empty() && wide.warnings()[0] == "Grid is 21x20 = 420 cells per layer!",
                "layer warning names the grid");

    auto deep = check_selector_size(box(0, 9, 0, 9, 0, 20), config);
    expect_true(!deep.layer_exceeded && deep.total_exceeded && deep.total_cells == 2100, "2100 cells exceed total");
    expect_true(deep.warnings()[0] == "Total lattice has 2100 cells across 21 layers!", "total warning");

    config.max_layer_cells = 1000;
    expect_true(!check_selector_size(box(0, 20, 0, 19, 0, 0), config).layer_exceeded, "layer threshold configurable");
}

void test_int_extremes() {
    test_header("Int Extremes");

    const int hi = std::numeric_limits<int>::max();
    const int lo = std::numeric_limits<int>::min();

    GridSelector top(LatticeGeometry::Rectangular, box(hi - 1, hi, hi - 1, hi, hi - 1, hi));
    expect_true(top.cursorI() == hi - 1 && top.cursorJ() == hi - 1 && top.layer() == hi - 1,
                "midpoint stays inside bounds ending at INT_MAX");
    expect_true(top.move(Direction::East) && top.cursorI() == hi, "step onto INT_MAX");
    expect_true(!top.move(Direction::East) && top.cursorI() == hi, "step past INT_MAX is a no-op");
    expect_true(top.changeLayer(+1) && !top.changeLayer(+1) && top.layer() == hi, "layer clamped at INT_MAX");
    expect_true(top.selectAll() && top.selected().size() == 8, "select all terminates at INT_MAX");
    auto spec = top.finalize();
    expect_true(spec.isContiguous() && spec.elementCount() == 8, "full extreme box is contiguous");
    expect_eq(spec.toRangeToken(),
              "[" + std::to_string(hi - 1) + ":" + std::to_string(hi) + " " + std::to_string(hi - 1) + ":" +
              std::to_string(hi) + " " + std::to_string(hi - 1) + ":" + std::to_string(hi) + "]",
              "extreme box ranges");

    GridSelector bottom(LatticeGeometry::Hexagonal, box(lo, lo + 1, lo, lo + 1, lo, lo));
    expect_true(bottom.cursorI() == lo && bottom.cursorJ() == lo, "midpoint rounds down to INT_MIN");
    expect_true(!bottom.move(Direction::West) && !bottom.move(Direction::NorthWest) && !bottom.move(Direction::NorthEast),
                "steps past INT_MIN are no-ops");
    expect_true(bottom.move(Direction::SouthEast) && bottom.cursorJ() == lo + 1, "step away from INT_MIN");
    expect_true(bottom.selectAll() && bottom.selected().size() == 4, "select all at INT_MIN");
    expect_true(bottom.finalize().elementCount() == 4, "finalize at INT_MIN");

    GridSelector full(LatticeGeometry::Rectangular, box(lo, hi, lo, hi, 0, 0));
    expect_true(full.cursorI() == -1 && full.cursorJ() == -1, "midpoint of the whole int range");

    std::set<LatticeIndex> adjacent = {{hi - 1, 0, 0}, {hi, 0, 0}};
    expect_true(is_selection_contiguous(adjacent), "adjacent cells at INT_MAX are contiguous");
    std::set<LatticeIndex> far_apart = {{lo, lo, 0}, {hi, hi, 0}};
    expect_true(!is_selection_contiguous(far_apart), "opposite corners are not contiguous");

    auto huge = check_selector_size(box(lo, hi, lo, hi, lo, hi), WizardConfig());
    expect_true(huge.layer_exceeded && huge.total_exceeded &&
                huge.total_cells == std::numeric_limits<int64_t>::max(), "cell counts saturate");
    expect_true(hex_neighbor(hi, 1, Direction::NorthEast) == Cell(int64_t(hi) + 1, 0), "hex step computed in 64 bits");
}

int main() {
    return run_suite("Grid Selector Test Suite", {
        test_initial_state,
        test_box_round_trip,
        test_box_with_hole,
        test_selection_contiguity,
        test_rectangular_moves,
        test_hex_moves,
        test_layers_and_clear,
        test_finalize_and_cancel,
        test_size_guard,
        test_int_extremes,
    });
}
