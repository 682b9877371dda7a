#include "CellPath.h"

int64_t parse_cell_limit(const std::string& s, const char* ctx){
    size_t v = parse_size_arg(s, ctx);
    if(v == 0){
        throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be positive");
    }
    if(v > static_cast<size_t>(std::numeric_limits<int64_t>::max())){
        throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " out of range");
    }
    return static_cast<int64_t>(v);
}

namespace {

void read_threshold(const char* var, int64_t& target, std::ostream& notes){
    const char* env = std::getenv(var);
    if(!env || !*env) return;
    try{
        target = parse_cell_limit(env, var);
    } catch(const CellPathError& e){
        notes << "note: " << e.what() << ", keeping " << target << "\n";
    }
}

bool env_flag(const char* var){
    const char* env = std::getenv(var);
    if(!env || !*env) return false;
    std::string v = lower_copy(trim_copy(env));
    return v != "0" && v != "no" && v != "false" && v != "off";
}

} // namespace

void load_config_from_env(WizardConfig& config, std::ostream& notes){
    TRACE_FN();
    read_threshold("CELLPATH_MAX_LAYER_CELLS", config.max_layer_cells, notes);
    read_threshold("CELLPATH_MAX_TOTAL_CELLS", config.max_total_cells, notes);
    if(env_flag("CELLPATH_NO_VISUAL")) config.visual_selector = false;
}
