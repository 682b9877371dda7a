// Prints the cards generated for the common nesting scenarios
#include "CellPath.h"

namespace {

ContainmentNode node(int cell, int universe, std::optional<int> fill = std::nullopt){
    ContainmentNode n;
    n.cell_id = cell;
    n.universe_id = universe;
    n.fill_id = fill;
    return n;
}

ContainmentNode lattice(int cell, int universe, int fill, const LatticeSpec& spec,
                        LatticeGeometry geometry = LatticeGeometry::Rectangular){
    ContainmentNode n = node(cell, universe, fill);
    n.is_lattice = true;
    n.lattice_spec = spec;
    n.geometry = geometry;
    return n;
}

// Fuel pin 101 in U=5, lattice cell 50 in U=100, core cell 1 in U=0
ContainmentStack pin_in_lattice(const LatticeSpec& spec, LatticeGeometry geometry = LatticeGeometry::Rectangular){
    return ContainmentStack::build({node(101, 5), lattice(50, 100, 5, spec, geometry), node(1, 0, 100)});
}

LatticeSpec box(Dimension i, Dimension j, Dimension k){
    return LatticeSpec::contiguous(i, j, k);
}

void heading(const std::string& title){
    std::cout << "\n" << std::string(70, '=') << "\n" << title << "\n" << std::string(70, '=') << "\n";
}

void show(const ContainmentStack& stack){
    for(size_t level = 0; level < stack.size(); ++level){
        std::cout << "  Level " << level << ": " << stack[level].describe() << "\n";
    }
    std::cout << "\n  " << tally_card("F4:N", build_tally_path(stack)) << "\n";
    if(needs_volume_card(stack)){
        std::cout << "  " << volume_card("F4:N", 2.75) << "  $ Volume of Cell " << stack.target().cell_id << " in cm³\n";
    }
}

void example_nested(){
    heading("Simple Nested Universe");
    show(ContainmentStack::build({node(5, 10), node(2, 100, 10), node(1, 0, 100)}));
}

void example_single_element(){
    heading("Single-Level Lattice");
    show(pin_in_lattice(LatticeSpec::single(3, 4, 0)));
}

void example_multilevel(){
    heading("Multi-Level Lattice");
    show(ContainmentStack::build({
        node(1001, 1),
        node(500, 10, 1),
        lattice(200, 100, 10, LatticeSpec::single(5, 5, 0)),
        lattice(50, 0, 100, LatticeSpec::single(2, 3, 0)),
    }));
}

void example_source(){
    heading("Source Definition (SDEF)");
    SourceOptions opts;
    opts.energy = 14.1;
    for(const auto& line : source_cards(pin_in_lattice(LatticeSpec::single(3, 4, 0)), opts).lines()){
        std::cout << "  " << line << "\n";
    }
}

void example_verification(){
    heading("Verification Deck");
    for(const auto& line : verification_deck(pin_in_lattice(LatticeSpec::single(3, 4, 0)))){
        std::cout << line << "\n";
    }
}

void example_ranges(){
    heading("Lattice Range Specification");
    show(pin_in_lattice(box(Dimension::range(2, 4), Dimension::range(3, 5), Dimension::single(0))));
}

void example_k_ranges(){
    heading("K-Range Specification");
    const std::pair<LatticeSpec, const char*> cases[] = {
        { box(Dimension::range(0, 9), Dimension::range(0, 9), Dimension::range(0, 5)), "Full grid, six layers" },
        { box(Dimension::range(0, 9), Dimension::range(0, 9), Dimension::single(0)), "Full i-j grid, single k-layer" },
        { box(Dimension::single(5), Dimension::range(0, 9), Dimension::single(0)), "Single i, full j, single k" },
        { box(Dimension::single(5), Dimension::single(5), Dimension::range(0, 10)), "Single i-j, full k-range" },
        { box(Dimension::range(0, 9), Dimension::single(5), Dimension::range(0, 2)), "Full i, single j, k-range" },
    };
    for(const auto& c : cases){
        auto stack = pin_in_lattice(c.first);
        std::cout << "  " << std::left << std::setw(32) << c.second
                  << c.first.elementCount() << " elements  "
                  << build_tally_path(stack) << "\n";
    }
}

void example_non_contiguous(){
    heading("Non-Contiguous Lattice Selection");
    show(pin_in_lattice(LatticeSpec::discrete({{0, 0, 0}, {9, 9, 0}, {0, 9, 0}, {9, 0, 0}})));
}

void example_infinite(){
    heading("Infinite Lattice (Simple Fill)");
    auto stack = ContainmentStack::build({
        node(101, 5),
        [&]{
            auto n = lattice(50, 100, 5, LatticeSpec::discrete({{0, 0, 0}, {100, 200, 0}, {-50, -75, 0}, {25, -30, 0}}));
            n.is_infinite_lattice = true;
            return n;
        }(),
        node(1, 0, 100),
    });
    show(stack);
}

void example_hexagonal(){
    heading("Hexagonal Lattice (LAT=2)");
    show(pin_in_lattice(LatticeSpec::discrete({{0, 0, 0}, {1, 0, 0}, {0, 1, 0}}), LatticeGeometry::Hexagonal));

    std::cout << "\n  Neighbors of (2,2) and (2,3), odd rows shifted right:\n";
    const Direction dirs[] = { Direction::East, Direction::West, Direction::NorthEast,
                               Direction::NorthWest, Direction::SouthEast, Direction::SouthWest };
    for(int j : {2, 3}){
        std::cout << "    (2," << j << ")";
        for(Direction d : dirs){
            auto n = hex_neighbor(2, j, d);
            std::cout << "  " << direction_label(d) << "=(" << n.first << "," << n.second << ")";
        }
        std::cout << "\n";
    }
}

} // namespace

int main(){
    try{
        example_nested();
        example_single_element();
        example_multilevel();
        example_source();
        example_verification();
        example_ranges();
        example_k_ranges();
        example_non_contiguous();
        example_infinite();
        example_hexagonal();
    } catch(const CellPathError& e){
        std::cerr << "error [" << error_kind_label(e.kind) << "]: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
