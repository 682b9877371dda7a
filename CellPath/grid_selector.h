#ifndef _CellPath_grid_selector_h_
#define _CellPath_grid_selector_h_

//
// Interactive lattice position selection (state only, no drawing)
//

enum class Direction { North, South, East, West, NorthEast, NorthWest, SouthEast, SouthWest };

const char* direction_label(Direction d);

// Offset-coordinate hex neighbor; odd j rows are shifted right
std::pair<int64_t, int64_t> hex_neighbor(int64_t i, int64_t j, Direction d);

enum class SelectorState { Active, Finalized, Cancelled };

struct SelectorAction {
    enum class Type { Move, Layer, Toggle, SelectAll, Clear, Finalize, Cancel };

    Type type = Type::Toggle;
    Direction direction = Direction::North;  // Move
    int delta = 0;                           // Layer

    static SelectorAction move(Direction d) { SelectorAction a; a.type = Type::Move; a.direction = d; return a; }
    static SelectorAction layer(int delta) { SelectorAction a; a.type = Type::Layer; a.delta = delta; return a; }
    static SelectorAction of(Type t) { SelectorAction a; a.type = t; return a; }
};

enum class ActionOutcome { Changed, Unchanged, Finalized, Cancelled, EmptySelection };

// What a renderer needs to draw one frame
struct SelectorSnapshot {
    LatticeGeometry geometry = LatticeGeometry::Rectangular;
    LatticeBounds bounds;
    bool unbounded = false;
    int cursor_i = 0;
    int cursor_j = 0;
    int layer = 0;
    std::set<LatticeIndex> selected;
    SelectorState state = SelectorState::Active;

    bool isSelected(int i, int j) const { return selected.count(LatticeIndex{i, j, layer}) > 0; }
    size_t selectedInLayer() const;
};

class GridSelector {
public:
    // bounds is the declared lattice extent, or the viewing window when
    // unbounded; selection never leaves it either way
    GridSelector(LatticeGeometry geometry, const LatticeBounds& bounds, bool unbounded = false);

    bool move(Direction d);
    bool changeLayer(int delta);
    bool toggleSelection();
    bool selectAll();
    bool clearSelection();
    LatticeSpec finalize();   // throws EmptySelection (stays Active) or SelectorClosed
    void cancel();

    ActionOutcome apply(const SelectorAction& action);

    SelectorState state() const { return state_; }
    bool active() const { return state_ == SelectorState::Active; }
    const std::optional<LatticeSpec>& result() const { return result_; }

    LatticeGeometry geometry() const { return geometry_; }
    const LatticeBounds& bounds() const { return bounds_; }
    bool unbounded() const { return unbounded_; }
    int cursorI() const { return cursor_i_; }
    int cursorJ() const { return cursor_j_; }
    int layer() const { return layer_; }
    const std::set<LatticeIndex>& selected() const { return selected_; }
    bool isSelected(const LatticeIndex& idx) const { return selected_.count(idx) > 0; }

    // Clamped to bounds
    void setCursor(int i, int j, int layer);

    SelectorSnapshot snapshot() const;

private:
    LatticeGeometry geometry_;
    LatticeBounds bounds_;
    bool unbounded_;
    int cursor_i_;
    int cursor_j_;
    int layer_;
    std::set<LatticeIndex> selected_;
    SelectorState state_ = SelectorState::Active;
    std::optional<LatticeSpec> result_;
};

// Axis-aligned box test over i, j and k jointly
bool is_selection_contiguous(const std::set<LatticeIndex>& selected);

// Contiguous spec for a full box, Discrete spec (sorted) otherwise
LatticeSpec spec_from_selection(const std::set<LatticeIndex>& selected);

// Advisory pre-flight size check
struct SizeCheck {
    int64_t i_size = 0;
    int64_t j_size = 0;
    int64_t k_size = 0;
    int64_t cells_per_layer = 0;
    int64_t total_cells = 0;
    int64_t layer_limit = 0;
    int64_t total_limit = 0;
    bool layer_exceeded = false;
    bool total_exceeded = false;

    bool ok() const { return !layer_exceeded && !total_exceeded; }
    std::vector<std::string> warnings() const;
};

SizeCheck check_selector_size(const LatticeBounds& bounds, const WizardConfig& config);

#endif
