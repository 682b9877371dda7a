#include "CellPath.h"
#include "ui_backend.h"

namespace {

std::optional<LatticeSpec> launch_terminal_selector(LatticeGeometry geometry, const LatticeBounds& bounds, bool unbounded){
    if(!terminal_available()){
        throw std::runtime_error("visual selector needs an interactive terminal");
    }
    return run_grid_selector(geometry, bounds, unbounded);
}

} // namespace

int main(int argc, char** argv){
    TRACE_FN();
    i18n::init();

    auto usage = [&](const std::string& msg){
        std::cerr << msg << "\n";
        return 1;
    };

    const std::string usage_text = std::string("usage: ") + argv[0] +
        " [--max-layer-cells N] [--max-total-cells N] [--no-visual] [--quiet] [--script <file> | script]";

    WizardConfig config;
    load_config_from_env(config, std::cout);

    try{
        for(int i = 1; i < argc; ++i){
            std::string arg = argv[i];
            if(arg == "--help" || arg == "-h"){
                std::cout << usage_text << "\n";
                return 0;
            }
            if(arg == "--max-layer-cells"){
                if(i + 1 >= argc) return usage("--max-layer-cells requires a cell count");
                config.max_layer_cells = parse_cell_limit(argv[++i], "--max-layer-cells");
                continue;
            }
            if(arg == "--max-total-cells"){
                if(i + 1 >= argc) return usage("--max-total-cells requires a cell count");
                config.max_total_cells = parse_cell_limit(argv[++i], "--max-total-cells");
                continue;
            }
            if(arg == "--no-visual"){
                config.visual_selector = false;
                continue;
            }
            if(arg == "--quiet" || arg == "-q"){
                config.quiet = true;
                continue;
            }
            if(arg == "--script"){
                if(i + 1 >= argc) return usage("--script requires a file path");
                config.script_path = argv[++i];
                config.quiet = true;  // scripted runs answer in English
                continue;
            }
            if(config.script_path.empty() && !arg.empty() && arg[0] != '-'){
                config.script_path = arg;
                config.quiet = true;
                continue;
            }
            return usage(usage_text);
        }
    } catch(const CellPathError& e){
        return usage(e.what());
    }

    if(config.quiet){
        i18n::set_english_only();
    }

    std::unique_ptr<std::ifstream> scriptStream;
    std::istream* input = &std::cin;
    if(!config.script_path.empty()){
        scriptStream = std::make_unique<std::ifstream>(config.script_path);
        if(!*scriptStream){
            std::cerr << "failed to open script '" << config.script_path << "'\n";
            return 1;
        }
        input = scriptStream.get();
        // answers come from a file, so there is nobody to drive the grid
        config.visual_selector = false;
    }

    Prompter prompter(*input, std::cout);
    Wizard wizard(prompter, config, launch_terminal_selector);
    try{
        wizard.run();
    } catch(const CellPathError& e){
        if(e.kind == CellPathError::Kind::InputClosed){
            std::cout << "\n\n" << i18n::get(i18n::MsgId::CANCELLED) << "\n";
            return 1;
        }
        std::cerr << "error [" << error_kind_label(e.kind) << "]: " << e.what() << "\n";
        return 1;
    } catch(const std::exception& e){
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << i18n::get(i18n::MsgId::GOODBYE) << "\n";
    return 0;
}
