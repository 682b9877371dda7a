// Opens the visual lattice selector on its own and prints the result
#include "CellPath.h"
#include "ui_backend.h"

int main(int argc, char** argv){
    i18n::init();
    LatticeGeometry geometry = LatticeGeometry::Rectangular;
    LatticeBounds bounds{{0, 9}, {0, 9}, {0, 2}};

    try{
        for(int i = 1; i < argc; ++i){
            std::string arg = argv[i];
            if(arg == "--hex"){
                geometry = LatticeGeometry::Hexagonal;
                continue;
            }
            if(arg == "--size"){
                if(i + 1 >= argc){
                    std::cerr << "--size requires a cell count\n";
                    return 1;
                }
                int n = static_cast<int>(parse_size_arg(argv[++i], "--size"));
                if(n == 0){
                    std::cerr << "--size must be positive\n";
                    return 1;
                }
                bounds.i = {0, n - 1};
                bounds.j = {0, n - 1};
                continue;
            }
            std::cerr << "usage: " << argv[0] << " [--hex] [--size N]\n";
            return 1;
        }

        if(!terminal_available()){
            std::cerr << "demo_grid_selector needs an interactive terminal\n";
            return 1;
        }
        auto spec = run_grid_selector(geometry, bounds, false);
        if(!spec){
            std::cout << i18n::get(i18n::MsgId::CANCELLED) << "\n";
            return 0;
        }
        std::cout << "Selected: " << spec->describe() << " (" << spec->elementCount() << " positions)\n";
        for(const auto& e : spec->enumerablePositions()){
            std::cout << "  " << LatticeSpec::singleToken(e) << "\n";
        }
    } catch(const CellPathError& e){
        std::cerr << "error [" << error_kind_label(e.kind) << "]: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
