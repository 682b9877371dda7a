#ifndef _CellPath_path_builder_h_
#define _CellPath_path_builder_h_

//
// Cell path construction (MCNP "<" repeated-structure syntax)
//
//   token      ::= cellId | cellId "[" dim " " dim " " dim "]"
//   path       ::= token (" < " token)*     innermost first
//   tally path ::= "( " path " )"
//   union      ::= "( " "(" path ")" (" (" path ")")* " )"
//

// Which node drives union generation. Only the first Discrete node is
// honored; discrete_count > 1 is the AmbiguousNonContiguity condition.
struct DiscreteLookup {
    std::optional<size_t> index;
    size_t discrete_count = 0;

    bool found() const { return index.has_value(); }
    bool ambiguous() const { return discrete_count > 1; }
};

DiscreteLookup find_discrete_lattice(const ContainmentStack& stack);

std::string build_single_path(const ContainmentStack& stack,
                              const std::optional<LatticeIndex>& override_element = std::nullopt);
std::string build_union_paths(const ContainmentStack& stack);
std::string build_tally_path(const ContainmentStack& stack, std::optional<int> target_cell = std::nullopt);

// One bare path per discrete element, or the single path when no node is discrete
std::vector<std::string> build_element_paths(const ContainmentStack& stack);

bool needs_volume_card(const ContainmentStack& stack);

#endif
