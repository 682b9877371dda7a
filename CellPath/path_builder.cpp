#include "CellPath.h"

DiscreteLookup find_discrete_lattice(const ContainmentStack& stack){
    DiscreteLookup out;
    for(size_t idx = 0; idx < stack.size(); ++idx){
        if(!stack[idx].hasDiscreteSpec()) continue;
        if(!out.index) out.index = idx;
        ++out.discrete_count;
    }
    if(out.ambiguous()){
        TRACE_MSG("ambiguous non-contiguity: ", out.discrete_count, " discrete nodes, using level ", *out.index);
    }
    return out;
}

std::string build_single_path(const ContainmentStack& stack, const std::optional<LatticeIndex>& override_element){
    TRACE_FN("levels=", stack.size());
    std::vector<std::string> parts;
    parts.reserve(stack.size());
    for(size_t idx = 0; idx < stack.size(); ++idx){
        const auto& node = stack[idx];
        std::string token = std::to_string(node.cell_id);
        if(node.is_lattice && node.lattice_spec){
            const auto& spec = *node.lattice_spec;
            if(spec.isDiscrete()){
                // every discrete level takes the element driving this path
                if(override_element) token += LatticeSpec::singleToken(*override_element);
            } else {
                token += spec.toRangeToken();
            }
        }
        parts.push_back(token);
    }
    return join_strings(parts, " < ");
}

std::vector<std::string> build_element_paths(const ContainmentStack& stack){
    auto lookup = find_discrete_lattice(stack);
    if(!lookup.found()) return { build_single_path(stack) };
    std::vector<std::string> paths;
    for(const auto& element : stack[*lookup.index].lattice_spec->enumerablePositions()){
        paths.push_back(build_single_path(stack, element));
    }
    return paths;
}

std::string build_union_paths(const ContainmentStack& stack){
    auto lookup = find_discrete_lattice(stack);
    if(!lookup.found()){
        return build_single_path(stack);
    }
    std::vector<std::string> wrapped;
    for(const auto& path : build_element_paths(stack)){
        wrapped.push_back("(" + path + ")");
    }
    return "( " + join_strings(wrapped, " ") + " )";
}

std::string build_tally_path(const ContainmentStack& stack, std::optional<int> target_cell){
    if(stack.empty()){
        if(!target_cell){
            throw CellPathError(CellPathError::Kind::BrokenChain, "no target cell for an empty containment stack");
        }
        return "( " + std::to_string(*target_cell) + " )";
    }
    if(find_discrete_lattice(stack).found()){
        return build_union_paths(stack);
    }
    return "( " + build_single_path(stack) + " )";
}

bool needs_volume_card(const ContainmentStack& stack){
    for(size_t idx = 1; idx < stack.size(); ++idx){
        if(stack[idx].is_lattice) return true;
    }
    return false;
}
