#ifndef _CellPath_config_h_
#define _CellPath_config_h_

// Runtime configuration: defaults, then environment, then command line
struct WizardConfig {
    static constexpr int64_t kDefaultMaxLayerCells = 400;    // 20x20
    static constexpr int64_t kDefaultMaxTotalCells = 2000;

    int64_t max_layer_cells = kDefaultMaxLayerCells;
    int64_t max_total_cells = kDefaultMaxTotalCells;
    bool visual_selector = true;
    bool quiet = false;
    std::string script_path;
};

// Positive cell-count threshold; zero, junk or values past INT64_MAX throw BadInput
int64_t parse_cell_limit(const std::string& s, const char* ctx);

// CELLPATH_MAX_LAYER_CELLS, CELLPATH_MAX_TOTAL_CELLS, CELLPATH_NO_VISUAL.
// Malformed values are reported as notes and leave the setting unchanged.
void load_config_from_env(WizardConfig& config, std::ostream& notes);

#endif
