#include "CellPath.h"

std::string tally_card(const std::string& tally_type, const std::string& tally_path){
    return upper_copy(trim_copy(tally_type)) + " " + tally_path;
}

std::string tally_number(const std::string& tally_type){
    std::string tag = upper_copy(trim_copy(tally_type));
    size_t pos = 0;
    while(pos < tag.size() && !std::isdigit(static_cast<unsigned char>(tag[pos]))) ++pos;
    size_t end = pos;
    while(end < tag.size() && std::isdigit(static_cast<unsigned char>(tag[end]))) ++end;
    if(pos == end){
        throw CellPathError(CellPathError::Kind::BadInput, "tally type '" + tally_type + "' has no tally number");
    }
    return tag.substr(pos, end - pos);
}

std::string volume_card(const std::string& tally_type, double volume){
    return "SD" + tally_number(tally_type) + " " + format_number(volume);
}

SourceCards source_cards(const ContainmentStack& stack, const SourceOptions& options){
    TRACE_FN("distribution=", options.distribution);
    SourceCards cards;
    std::string d = std::to_string(options.distribution);

    cards.sdef = "SDEF CEL=d" + d;
    if(options.position){
        const auto& p = *options.position;
        cards.sdef += " POS=" + format_number(p[0]) + " " + format_number(p[1]) + " " + format_number(p[2]);
    }
    if(options.energy){
        cards.sdef += " ERG=" + format_number(*options.energy);
    }

    if(find_discrete_lattice(stack).found()){
        // one source location per element, equally weighted
        auto paths = build_element_paths(stack);
        cards.si = "SI" + d + " L";
        for(const auto& path : paths) cards.si += " (" + path + ")";
        cards.sp = "SP" + d;
        for(size_t n = 0; n < paths.size(); ++n) cards.sp += " 1";
        cards.locations = paths.size();
    } else {
        cards.si = "SI" + d + " L " + build_tally_path(stack);
        cards.sp = "SP" + d + " 1";
    }
    return cards;
}

std::vector<std::string> verification_deck(const ContainmentStack& stack){
    std::string path = build_tally_path(stack);
    return {
        "C --- Paste this into an MCNP input for verification ---",
        "C --- Run with 50 particles and check PRINT 110 output ---",
        "SDEF CEL=d1 ERG=1.0",
        "SI1 L " + path,
        "SP1 1",
        "C",
        "NPS 50",
        "PRINT 110",
        "C",
        "C Set all materials to VOID for testing:",
        "C M0   $ Void",
    };
}
