#ifndef _CellPath_containment_h_
#define _CellPath_containment_h_

// MCNP LAT=1 / LAT=2
enum class LatticeGeometry { Rectangular = 1, Hexagonal = 2 };

const char* geometry_label(LatticeGeometry g);
std::optional<LatticeGeometry> geometry_from_lat(int lat);

// Inclusive integer range of one lattice axis
struct AxisRange {
    int min = 0;
    int max = 0;

    int64_t size() const { return static_cast<int64_t>(max) - static_cast<int64_t>(min) + 1; }
    bool contains(int64_t v) const { return v >= min && v <= max; }
    int midpoint() const { return static_cast<int>(floor_div(static_cast<int64_t>(min) + max, 2)); }
    bool valid() const { return min <= max; }
};

// Declared FILL bounds of a bounded lattice, or the viewing window of an
// infinite one
struct LatticeBounds {
    AxisRange i, j, k;

    int64_t cellsPerLayer() const { return saturating_mul(i.size(), j.size()); }
    int64_t totalCells() const { return saturating_mul(cellsPerLayer(), k.size()); }
    bool contains(const LatticeIndex& idx) const { return i.contains(idx.i) && j.contains(idx.j) && k.contains(idx.k); }
    bool valid() const { return i.valid() && j.valid() && k.valid(); }
};

//
// One level of the containment stack
//
struct ContainmentNode {
    int cell_id = 0;
    int universe_id = 0;                        // universe this cell resides in, 0 = global
    std::optional<int> fill_id;                 // universe this cell is filled with
    bool is_lattice = false;
    bool is_infinite_lattice = false;           // simple FILL=N, no declared bounds
    std::optional<LatticeSpec> lattice_spec;
    std::optional<LatticeGeometry> geometry;
    std::optional<LatticeBounds> bounds;

    // The single referenced lattice position, if lattice_spec names exactly one
    std::optional<LatticeIndex> latticeIndex() const;
    bool hasDiscreteSpec() const { return is_lattice && lattice_spec && lattice_spec->isDiscrete(); }
    std::string describe() const;
};

//
// Target cell first, global cell last
//
class ContainmentStack {
public:
    ContainmentStack() = default;

    // Validates every chain invariant, throws BrokenChain on the first violation
    static ContainmentStack build(std::vector<ContainmentNode> nodes);
    static std::vector<std::string> problems(const std::vector<ContainmentNode>& nodes);

    bool empty() const { return nodes_.empty(); }
    size_t size() const { return nodes_.size(); }
    const ContainmentNode& operator[](size_t idx) const { return nodes_[idx]; }
    const ContainmentNode& target() const;
    const std::vector<ContainmentNode>& nodes() const { return nodes_; }
    std::vector<ContainmentNode>::const_iterator begin() const { return nodes_.begin(); }
    std::vector<ContainmentNode>::const_iterator end() const { return nodes_.end(); }

private:
    explicit ContainmentStack(std::vector<ContainmentNode> nodes) : nodes_(std::move(nodes)) {}

    std::vector<ContainmentNode> nodes_;
};

//
// Bottom-up stack assembly: each climb step is checked against the
// universe still waiting for its filling cell, and build() hands back the
// finished stack as one value.
//
class StackBuilder {
public:
    StackBuilder(int target_cell, int universe_id);

    StackBuilder& climb(ContainmentNode parent);

    bool complete() const { return nodes_.back().universe_id == 0; }
    int pendingUniverse() const { return nodes_.back().universe_id; }
    size_t depth() const { return nodes_.size(); }
    const ContainmentNode& top() const { return nodes_.back(); }

    ContainmentStack build() const;

private:
    std::vector<ContainmentNode> nodes_;
};

#endif
