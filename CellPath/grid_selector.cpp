#include "CellPath.h"

const char* direction_label(Direction d){
    switch(d){
        case Direction::North: return "N";
        case Direction::South: return "S";
        case Direction::East: return "E";
        case Direction::West: return "W";
        case Direction::NorthEast: return "NE";
        case Direction::NorthWest: return "NW";
        case Direction::SouthEast: return "SE";
        case Direction::SouthWest: return "SW";
    }
    return "?";
}

std::pair<int64_t, int64_t> hex_neighbor(int64_t i, int64_t j, Direction d){
    bool odd_row = (j % 2 != 0);
    switch(d){
        case Direction::East:      return {i + 1, j};
        case Direction::West:      return {i - 1, j};
        case Direction::NorthEast: return {odd_row ? i + 1 : i, j - 1};
        case Direction::NorthWest: return {odd_row ? i : i - 1, j - 1};
        case Direction::SouthEast: return {odd_row ? i + 1 : i, j + 1};
        case Direction::SouthWest: return {odd_row ? i : i - 1, j + 1};
        case Direction::North:
        case Direction::South:
            break;
    }
    return {i, j};
}

namespace {

// Loop counters run in 64 bits so an axis ending at INT_MAX terminates
LatticeIndex index_at(int64_t i, int64_t j, int64_t k){
    return LatticeIndex{static_cast<int>(i), static_cast<int>(j), static_cast<int>(k)};
}

} // namespace

size_t SelectorSnapshot::selectedInLayer() const {
    return static_cast<size_t>(std::count_if(selected.begin(), selected.end(),
        [this](const LatticeIndex& idx){ return idx.k == layer; }));
}

// ====== GridSelector ======
GridSelector::GridSelector(LatticeGeometry geometry, const LatticeBounds& bounds, bool unbounded)
    : geometry_(geometry), bounds_(bounds), unbounded_(unbounded) {
    if(!bounds.valid()){
        throw CellPathError(CellPathError::Kind::InvalidRange, "lattice bounds need minimum <= maximum on every axis");
    }
    cursor_i_ = bounds.i.midpoint();
    cursor_j_ = bounds.j.midpoint();
    layer_ = bounds.k.midpoint();
}

bool GridSelector::move(Direction d){
    if(!active()) return false;
    // 64-bit so a step off an int extreme lands outside the bounds
    int64_t ni = cursor_i_, nj = cursor_j_;
    if(geometry_ == LatticeGeometry::Hexagonal){
        std::tie(ni, nj) = hex_neighbor(cursor_i_, cursor_j_, d);
    } else {
        switch(d){
            case Direction::North: --nj; break;
            case Direction::South: ++nj; break;
            case Direction::East:  ++ni; break;
            case Direction::West:  --ni; break;
            default: return false;
        }
    }
    if(!bounds_.i.contains(ni) || !bounds_.j.contains(nj)) return false;
    if(ni == cursor_i_ && nj == cursor_j_) return false;
    cursor_i_ = static_cast<int>(ni);
    cursor_j_ = static_cast<int>(nj);
    return true;
}

bool GridSelector::changeLayer(int delta){
    if(!active()) return false;
    int64_t next = std::clamp<int64_t>(static_cast<int64_t>(layer_) + delta, bounds_.k.min, bounds_.k.max);
    if(next == layer_) return false;
    layer_ = static_cast<int>(next);
    return true;
}

bool GridSelector::toggleSelection(){
    if(!active()) return false;
    LatticeIndex cell{cursor_i_, cursor_j_, layer_};
    auto it = selected_.find(cell);
    if(it != selected_.end()) selected_.erase(it);
    else selected_.insert(cell);
    return true;
}

bool GridSelector::selectAll(){
    if(!active()) return false;
    size_t before = selected_.size();
    for(int64_t i = bounds_.i.min; i <= bounds_.i.max; ++i)
        for(int64_t j = bounds_.j.min; j <= bounds_.j.max; ++j)
            for(int64_t k = bounds_.k.min; k <= bounds_.k.max; ++k)
                selected_.insert(index_at(i, j, k));
    return selected_.size() != before;
}

bool GridSelector::clearSelection(){
    if(!active() || selected_.empty()) return false;
    selected_.clear();
    return true;
}

LatticeSpec GridSelector::finalize(){
    TRACE_FN("selected=", selected_.size());
    if(!active()){
        throw CellPathError(CellPathError::Kind::SelectorClosed, "selection session already closed");
    }
    if(selected_.empty()){
        throw CellPathError(CellPathError::Kind::EmptySelection, "no lattice cells selected");
    }
    result_ = spec_from_selection(selected_);
    state_ = SelectorState::Finalized;
    return *result_;
}

void GridSelector::cancel(){
    if(!active()) return;
    state_ = SelectorState::Cancelled;
    result_.reset();
}

ActionOutcome GridSelector::apply(const SelectorAction& action){
    TRACE_LOOP("selector.apply", "type=", static_cast<int>(action.type));
    if(!active()) return ActionOutcome::Unchanged;
    bool changed = false;
    switch(action.type){
        case SelectorAction::Type::Move:      changed = move(action.direction); break;
        case SelectorAction::Type::Layer:     changed = changeLayer(action.delta); break;
        case SelectorAction::Type::Toggle:    changed = toggleSelection(); break;
        case SelectorAction::Type::SelectAll: changed = selectAll(); break;
        case SelectorAction::Type::Clear:     changed = clearSelection(); break;
        case SelectorAction::Type::Cancel:
            cancel();
            return ActionOutcome::Cancelled;
        case SelectorAction::Type::Finalize:
            if(selected_.empty()) return ActionOutcome::EmptySelection;
            finalize();
            return ActionOutcome::Finalized;
    }
    return changed ? ActionOutcome::Changed : ActionOutcome::Unchanged;
}

void GridSelector::setCursor(int i, int j, int layer){
    if(!active()) return;
    cursor_i_ = std::clamp(i, bounds_.i.min, bounds_.i.max);
    cursor_j_ = std::clamp(j, bounds_.j.min, bounds_.j.max);
    layer_ = std::clamp(layer, bounds_.k.min, bounds_.k.max);
}

SelectorSnapshot GridSelector::snapshot() const {
    SelectorSnapshot s;
    s.geometry = geometry_;
    s.bounds = bounds_;
    s.unbounded = unbounded_;
    s.cursor_i = cursor_i_;
    s.cursor_j = cursor_j_;
    s.layer = layer_;
    s.selected = selected_;
    s.state = state_;
    return s;
}

// ====== Contiguity analysis ======
namespace {

LatticeBounds bounding_box(const std::set<LatticeIndex>& selected){
    const auto& first = *selected.begin();
    LatticeBounds box{{first.i, first.i}, {first.j, first.j}, {first.k, first.k}};
    for(const auto& idx : selected){
        box.i.min = std::min(box.i.min, idx.i); box.i.max = std::max(box.i.max, idx.i);
        box.j.min = std::min(box.j.min, idx.j); box.j.max = std::max(box.j.max, idx.j);
        box.k.min = std::min(box.k.min, idx.k); box.k.max = std::max(box.k.max, idx.k);
    }
    return box;
}

} // namespace

bool is_selection_contiguous(const std::set<LatticeIndex>& selected){
    if(selected.size() <= 1) return true;
    auto box = bounding_box(selected);
    if(box.totalCells() != static_cast<int64_t>(selected.size())) return false;
    for(int64_t i = box.i.min; i <= box.i.max; ++i)
        for(int64_t j = box.j.min; j <= box.j.max; ++j)
            for(int64_t k = box.k.min; k <= box.k.max; ++k)
                if(!selected.count(index_at(i, j, k))) return false;
    return true;
}

LatticeSpec spec_from_selection(const std::set<LatticeIndex>& selected){
    if(selected.empty()){
        throw CellPathError(CellPathError::Kind::EmptySelection, "no lattice cells selected");
    }
    if(is_selection_contiguous(selected)){
        auto box = bounding_box(selected);
        return LatticeSpec::contiguous(Dimension::span(box.i.min, box.i.max),
                                       Dimension::span(box.j.min, box.j.max),
                                       Dimension::span(box.k.min, box.k.max));
    }
    // std::set iterates in ascending (i, j, k) order
    return LatticeSpec::discrete(std::vector<LatticeIndex>(selected.begin(), selected.end()));
}

// ====== Size guard ======
std::vector<std::string> SizeCheck::warnings() const {
    std::vector<std::string> out;
    if(layer_exceeded){
        out.push_back("Grid is " + std::to_string(i_size) + "x" + std::to_string(j_size) + " = " +
                      std::to_string(cells_per_layer) + " cells per layer!");
        out.push_back("Visual selector works best with grids of at most " + std::to_string(layer_limit) + " cells per layer.");
        out.push_back("Large grids may not fit in your terminal or be hard to navigate.");
    } else if(total_exceeded){
        out.push_back("Total lattice has " + std::to_string(total_cells) + " cells across " +
                      std::to_string(k_size) + " layers!");
        out.push_back("This may be slow or difficult to use.");
    }
    return out;
}

SizeCheck check_selector_size(const LatticeBounds& bounds, const WizardConfig& config){
    SizeCheck c;
    c.i_size = bounds.i.size();
    c.j_size = bounds.j.size();
    c.k_size = bounds.k.size();
    c.cells_per_layer = bounds.cellsPerLayer();
    c.total_cells = bounds.totalCells();
    c.layer_limit = config.max_layer_cells;
    c.total_limit = config.max_total_cells;
    c.layer_exceeded = c.cells_per_layer > c.layer_limit;
    c.total_exceeded = c.total_cells > c.total_limit;
    return c;
}
