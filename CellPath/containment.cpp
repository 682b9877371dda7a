#include "CellPath.h"

const char* geometry_label(LatticeGeometry g){
    switch(g){
        case LatticeGeometry::Rectangular: return "Rectangular";
        case LatticeGeometry::Hexagonal: return "Hexagonal";
    }
    return "?";
}

std::optional<LatticeGeometry> geometry_from_lat(int lat){
    if(lat == 1) return LatticeGeometry::Rectangular;
    if(lat == 2) return LatticeGeometry::Hexagonal;
    return std::nullopt;
}

// ====== ContainmentNode ======
std::optional<LatticeIndex> ContainmentNode::latticeIndex() const {
    if(!lattice_spec) return std::nullopt;
    return lattice_spec->singleElement();
}

std::string ContainmentNode::describe() const {
    std::string out = "Cell " + std::to_string(cell_id) + " in U=" + std::to_string(universe_id);
    if(lattice_spec) out += " [LAT spec: " + lattice_spec->describe() + "]";
    if(fill_id) out += " (fills U=" + std::to_string(*fill_id) + ")";
    return out;
}

// ====== ContainmentStack ======
std::vector<std::string> ContainmentStack::problems(const std::vector<ContainmentNode>& nodes){
    std::vector<std::string> out;
    if(nodes.empty()){
        out.push_back("containment stack is empty");
        return out;
    }
    if(nodes.front().fill_id){
        out.push_back("target cell " + std::to_string(nodes.front().cell_id) + " fills U=" +
                      std::to_string(*nodes.front().fill_id) + ", only enclosing levels fill a universe");
    }
    for(size_t idx = 0; idx < nodes.size(); ++idx){
        const auto& node = nodes[idx];
        bool last = idx + 1 == nodes.size();
        if(last && node.universe_id != 0){
            out.push_back("outermost cell " + std::to_string(node.cell_id) + " is in U=" +
                          std::to_string(node.universe_id) + ", expected the global universe (U=0)");
        }
        if(!last && node.universe_id == 0){
            out.push_back("cell " + std::to_string(node.cell_id) + " at level " + std::to_string(idx) +
                          " is in the global universe but is not the outermost level");
        }
        if(!last){
            const auto& outer = nodes[idx + 1];
            if(!outer.fill_id || *outer.fill_id != node.universe_id){
                out.push_back("cell " + std::to_string(outer.cell_id) + " must fill U=" +
                              std::to_string(node.universe_id) + " to contain cell " + std::to_string(node.cell_id));
            }
        }
        if(node.lattice_spec && !node.is_lattice){
            out.push_back("cell " + std::to_string(node.cell_id) + " carries a lattice spec but is not a lattice");
        }
    }
    return out;
}

ContainmentStack ContainmentStack::build(std::vector<ContainmentNode> nodes){
    TRACE_FN("levels=", nodes.size());
    auto issues = problems(nodes);
    if(!issues.empty()){
        throw CellPathError(CellPathError::Kind::BrokenChain, issues.front());
    }
    return ContainmentStack(std::move(nodes));
}

const ContainmentNode& ContainmentStack::target() const {
    if(nodes_.empty()){
        throw CellPathError(CellPathError::Kind::BrokenChain, "containment stack is empty");
    }
    return nodes_.front();
}

// ====== StackBuilder ======
StackBuilder::StackBuilder(int target_cell, int universe_id){
    ContainmentNode target;
    target.cell_id = target_cell;
    target.universe_id = universe_id;
    nodes_.push_back(target);
}

StackBuilder& StackBuilder::climb(ContainmentNode parent){
    TRACE_FN("cell=", parent.cell_id, ", pending=", pendingUniverse());
    if(complete()){
        throw CellPathError(CellPathError::Kind::BrokenChain,
            "stack already reaches the global universe at cell " + std::to_string(top().cell_id));
    }
    if(!parent.fill_id || *parent.fill_id != pendingUniverse()){
        throw CellPathError(CellPathError::Kind::BrokenChain,
            "cell " + std::to_string(parent.cell_id) + " must fill U=" + std::to_string(pendingUniverse()));
    }
    if(parent.lattice_spec && !parent.is_lattice){
        throw CellPathError(CellPathError::Kind::BrokenChain,
            "cell " + std::to_string(parent.cell_id) + " carries a lattice spec but is not a lattice");
    }
    nodes_.push_back(std::move(parent));
    return *this;
}

ContainmentStack StackBuilder::build() const {
    return ContainmentStack::build(nodes_);
}
