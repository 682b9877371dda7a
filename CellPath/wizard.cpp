#include "CellPath.h"

namespace {

std::string rule(char c = '='){
    return std::string(70, c);
}

void banner(std::ostream& out, const std::string& title){
    out << "\n" << rule() << "\n" << title << "\n" << rule() << "\n";
}

void card_block(std::ostream& out, const std::string& title, const std::vector<std::string>& lines){
    out << "\n" << rule('-') << "\n" << title << "\n" << rule('-') << "\n";
    for(const auto& line : lines) out << line << "\n";
    out << rule('-') << "\n";
}

} // namespace

// ====== Prompter ======
std::string Prompter::askLine(const std::string& prompt){
    out_ << prompt << ": ";
    out_.flush();
    std::string line;
    if(!std::getline(in_, line)){
        throw CellPathError(CellPathError::Kind::InputClosed, i18n::get(i18n::MsgId::INPUT_CLOSED));
    }
    TRACE_MSG("answer '", line, "' to '", prompt, "'");
    return trim_copy(line);
}

int Prompter::askInt(const std::string& prompt, std::optional<int> def){
    std::string full = def ? prompt + " [default: " + std::to_string(*def) + "]" : prompt;
    while(true){
        std::string answer = askLine(full);
        if(answer.empty() && def) return *def;
        try{
            long long v = parse_int_arg(answer, "answer");
            if(v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()){
                throw CellPathError(CellPathError::Kind::BadInput, "answer out of range");
            }
            return static_cast<int>(v);
        } catch(const CellPathError&){
            out_ << i18n::get(i18n::MsgId::INVALID_INT) << "\n";
        }
    }
}

double Prompter::askFloat(const std::string& prompt){
    while(true){
        std::string answer = askLine(prompt);
        try{
            return parse_double_arg(answer, "answer");
        } catch(const CellPathError&){
            out_ << i18n::get(i18n::MsgId::INVALID_FLOAT) << "\n";
        }
    }
}

bool Prompter::askYesNo(const std::string& prompt){
    while(true){
        std::string answer = lower_copy(askLine(prompt + " (y/n)"));
        if(answer == "y" || answer == "yes") return true;
        if(answer == "n" || answer == "no") return false;
        out_ << i18n::get(i18n::MsgId::INVALID_YES_NO) << "\n";
    }
}

int Prompter::askChoice(const std::string& prompt, const std::vector<int>& allowed){
    while(true){
        int v = askInt(prompt);
        if(std::find(allowed.begin(), allowed.end(), v) != allowed.end()) return v;
        out_ << i18n::get(i18n::MsgId::INVALID_CHOICE) << "\n";
    }
}

Dimension Prompter::askDimension(const std::string& prompt){
    while(true){
        std::string answer = askLine(prompt);
        try{
            return parse_dimension(answer);
        } catch(const CellPathError& e){
            if(e.kind == CellPathError::Kind::InvalidRange) out_ << "  Minimum must be <= maximum\n";
            else out_ << "  Invalid input. Enter a number or range (min:max)\n";
        }
    }
}

// ====== Wizard ======
Wizard::Wizard(Prompter& prompter, const WizardConfig& config, SelectorLauncher launcher)
    : prompt_(prompter), config_(config), launcher_(std::move(launcher)) {}

WizardSession Wizard::run(){
    TRACE_FN();
    auto& out = prompt_.out();
    out << rule() << "\n" << i18n::get(i18n::MsgId::WELCOME) << "\n" << rule() << "\n";
    out << "\nThis wizard will help you generate proper universe specifications\n"
           "for MCNP tallies (F-cards) and source definitions (SDEF).\n\n";

    WizardSession session;
    session.mode = chooseMode();
    session.stack = buildStack(session);

    if(session.mode == WizardMode::Tally || session.mode == WizardMode::Both) generateTally(session);
    if(session.mode == WizardMode::Source || session.mode == WizardMode::Both) generateSource(session);

    offerVerification(session);
    return session;
}

WizardMode Wizard::chooseMode(){
    auto& out = prompt_.out();
    out << "What do you need to generate?\n"
           "  1. Tally specification (F4, F7, etc.)\n"
           "  2. Source definition (SDEF)\n"
           "  3. Both\n";
    switch(prompt_.askChoice("\nEnter choice (1/2/3)", {1, 2, 3})){
        case 1: return WizardMode::Tally;
        case 2: return WizardMode::Source;
        default: return WizardMode::Both;
    }
}

ContainmentStack Wizard::buildStack(WizardSession& session){
    TRACE_FN();
    auto& out = prompt_.out();
    banner(out, "Building Universe Stack (Bottom-Up)");

    session.target_cell = prompt_.askInt("\n[TARGET CELL]\nWhat is the specific cell ID you want to tally/source?");
    std::string target = std::to_string(session.target_cell);

    int universe = 0;
    if(prompt_.askYesNo("\nIs Cell " + target + " inside a universe (not Universe 0)?")){
        universe = prompt_.askInt("What universe number is Cell " + target + " in?");
    }
    StackBuilder builder(session.target_cell, universe);
    if(builder.complete()){
        out << "\n✓ Cell " << target << " is in the global universe (U=0)\n";
        return builder.build();
    }

    while(!builder.complete()){
        TRACE_LOOP("stack.climb", "pending=", builder.pendingUniverse());
        builder.climb(askParent(builder.pendingUniverse()));
    }
    ContainmentStack stack = builder.build();

    banner(out, "Universe Stack Complete:");
    for(size_t level = 0; level < stack.size(); ++level){
        out << "  Level " << level << ": " << stack[level].describe() << "\n";
    }
    out << "\n";
    return stack;
}

ContainmentNode Wizard::askParent(int universe){
    auto& out = prompt_.out();
    std::string u = std::to_string(universe);
    out << "\n[PARENT CELL for U=" << u << "]\n";

    ContainmentNode node;
    node.cell_id = prompt_.askInt("What cell FILLS universe " + u + "?");
    node.fill_id = universe;
    std::string cell = std::to_string(node.cell_id);

    node.is_lattice = prompt_.askYesNo("\nIs Cell " + cell + " a lattice (LAT=1 or LAT=2)?");
    if(node.is_lattice) askLattice(node);

    node.universe_id = 0;
    if(prompt_.askYesNo("\nIs Cell " + cell + " inside a universe (not Universe 0)?")){
        while(true){
            node.universe_id = prompt_.askInt("What universe number is Cell " + cell + " in?");
            if(node.universe_id != universe) break;
            out << "Cell " << cell << " cannot sit in the universe it fills (U=" << u << ").\n";
        }
    }
    return node;
}

void Wizard::askLattice(ContainmentNode& node){
    auto& out = prompt_.out();
    std::string cell = std::to_string(node.cell_id);
    out << "\n[LATTICE SPECIFICATION for Cell " << cell << "]\n";

    out << "\nLattice type:\n"
           "  1 = Rectangular (LAT=1)\n"
           "  2 = Hexagonal (LAT=2)\n";
    auto geometry = *geometry_from_lat(prompt_.askChoice("Enter lattice type (1 or 2)", {1, 2}));
    node.geometry = geometry;

    out << "\nFILL card type:\n"
           "  1 = Simple fill (FILL=N) - lattice extends infinitely\n"
           "  2 = Fully specified (FILL= i_min:i_max j_min:j_max k_min:k_max ...) - bounded\n"
           "\nCheck your MCNP input:\n"
           "  Simple example: '50 1 -1.0 -1 LAT=2 FILL=5 U=100'\n"
           "  Bounded example: '50 1 -1.0 -1 LAT=2 FILL= -5:5 -4:4 0:2 10 999r U=100'\n";
    int fill_type = prompt_.askChoice("Enter FILL type (1 or 2)", {1, 2});

    if(fill_type == 1){
        node.is_infinite_lattice = true;
        out << "\n⚠ INFINITE LATTICE detected (simple fill).\n"
               "   Your lattice extends infinitely - you can reference ANY indices!\n"
               "   Example: [0 0 0], [9999 -500 0], etc.\n";
        if(visualAvailable() && prompt_.askYesNo("\nUse visual selector? (requires defining a viewing window)")){
            out << "\n[VIEWING WINDOW for Visual Selector]\n"
                   "These are NOT actual lattice bounds (lattice is infinite).\n"
                   "Just specify what range you want to SEE in the visual selector.\n"
                   "\nRecommended: Keep small (<20x20) for usable display.\n";
            node.bounds = askBounds("Viewing ");
            node.lattice_spec = selectVisually(geometry, *node.bounds, true);
        } else {
            node.lattice_spec = manualEntry(true);
        }
        return;
    }

    node.is_infinite_lattice = false;
    out << "\nLattice dimensions (from your FILL card):\n"
           "Example: If FILL card says -5:5 -4:4 0:2, enter those values\n";
    node.bounds = askBounds("");

    bool visual = false;
    if(visualAvailable()){
        out << "\nHow would you like to specify which lattice elements to tally?\n"
               "  1 = Visual selector (interactive grid)\n"
               "  2 = Manual entry (type indices/ranges)\n";
        visual = prompt_.askChoice("Enter choice (1 or 2)", {1, 2}) == 1;
    }
    node.lattice_spec = visual ? selectVisually(geometry, *node.bounds, false) : manualEntry(false);
}

LatticeBounds Wizard::askBounds(const std::string& label){
    auto axis = [&](const char* name){
        while(true){
            AxisRange r;
            r.min = prompt_.askInt("  " + label + name + " minimum");
            r.max = prompt_.askInt("  " + label + name + " maximum");
            if(r.valid()) return r;
            prompt_.out() << "  Minimum must be <= maximum\n";
        }
    };
    LatticeBounds b;
    b.i = axis("i");
    b.j = axis("j");
    b.k = axis("k");
    return b;
}

LatticeSpec Wizard::selectVisually(LatticeGeometry geometry, const LatticeBounds& bounds, bool infinite){
    TRACE_FN("cells=", bounds.totalCells());
    auto& out = prompt_.out();

    auto size = check_selector_size(bounds, config_);
    if(!size.ok()){
        out << "\n⚠ WARNING: ";
        auto warnings = size.warnings();
        for(size_t n = 0; n < warnings.size(); ++n){
            out << (n == 0 ? "" : "   ") << warnings[n] << "\n";
        }
        if(!prompt_.askYesNo("Continue with visual selector anyway?")){
            out << "Falling back to manual entry.\n";
            return manualEntry(infinite);
        }
    }

    out << "\nLaunching visual lattice selector...\n";
    if(infinite) out << "(Viewing window mode - lattice is actually infinite)\n";

    std::optional<LatticeSpec> spec;
    try{
        spec = launcher_(geometry, bounds, infinite);
    } catch(const std::exception& e){
        out << "\nError in visual selector: " << e.what() << "\n";
        out << "Falling back to manual entry.\n";
        return manualEntry(infinite);
    }
    if(!spec){
        out << "Visual selection cancelled. Falling back to manual entry.\n";
        return manualEntry(infinite);
    }
    out << "Selected lattice elements: " << spec->describe() << " (" << spec->elementCount() << " positions)\n";
    return *spec;
}

LatticeSpec Wizard::manualEntry(bool infinite){
    auto& out = prompt_.out();
    out << "\nManual lattice element specification:\n";
    if(infinite){
        out << "⚠ Note: This is an INFINITE lattice (simple fill).\n"
               "   You can enter ANY indices (positive, negative, or zero).\n"
               "   The lattice extends infinitely in all directions.\n";
    }
    out << "For each dimension, enter either:\n"
           "  - A single index (e.g., 5)\n"
           "  - A range as 'min:max' (e.g., 0:9)\n\n";
    Dimension i = prompt_.askDimension("  i index or range (e.g., 5 or 0:9)");
    Dimension j = prompt_.askDimension("  j index or range (e.g., 5 or 0:9)");
    Dimension k = prompt_.askDimension("  k index or range (e.g., 0 or 0:2)");
    return LatticeSpec::contiguous(i, j, k);
}

void Wizard::generateTally(WizardSession& session){
    TRACE_FN();
    auto& out = prompt_.out();
    banner(out, "TALLY SPECIFICATION");

    while(true){
        session.tally_type = upper_copy(prompt_.askLine("\nEnter tally type (e.g., F4:N, F7:N, F4:P)"));
        try{
            tally_number(session.tally_type);
            break;
        } catch(const CellPathError& e){
            out << e.what() << "\n";
        }
    }

    auto lookup = find_discrete_lattice(session.stack);
    if(lookup.ambiguous()){
        out << "note: " << lookup.discrete_count << " lattice levels have non-contiguous selections; paths follow the elements of cell "
            << session.stack[*lookup.index].cell_id << " at every level\n";
    }

    std::string card = tally_card(session.tally_type, build_tally_path(session.stack, session.target_cell));
    session.cards.push_back(card);
    card_block(out, "GENERATED TALLY CARD:", {card});

    if(!needs_volume_card(session.stack)) return;

    std::string target = std::to_string(session.target_cell);
    std::string sd = "SD" + tally_number(session.tally_type);
    out << "\n⚠ WARNING: This tally requires a Segment Divisor (SD) card!\n"
        << "   Target Cell " << target << " is inside a lattice.\n"
        << "   MCNP cannot auto-calculate volumes for lattice elements.\n"
        << "   You must specify the volume of Cell " << target << " in cm³.\n";

    if(prompt_.askYesNo("\nDo you know the volume of Cell " + target + " (in cm³)?")){
        double volume = 0.0;
        while(true){
            volume = prompt_.askFloat("Enter volume of Cell " + target + " (cm³)");
            if(volume > 0.0) break;
            out << "Volume must be positive.\n";
        }
        session.target_volume = volume;
        std::string sd_card = volume_card(session.tally_type, volume);
        session.cards.push_back(sd_card);
        card_block(out, "REQUIRED SD CARD:", {sd_card});
        out << "\nThis specifies that Cell " << target << " has a volume of " << format_number(volume) << " cm³\n"
            << "in each lattice element where it appears.\n";
    } else {
        out << "\n⚠ You MUST add an SD card manually with the correct volume!\n"
            << "   Format: " << sd << " <volume_of_cell_" << target << "_in_cm3>\n"
            << "   Example: " << sd << " 2.75  $ Volume of Cell " << target << " in cm³\n";
    }
}

void Wizard::generateSource(WizardSession& session){
    TRACE_FN();
    auto& out = prompt_.out();
    banner(out, "SOURCE DEFINITION (SDEF) SPECIFICATION");
    out << "\nUsing the robust Distribution method (SI/SP cards)...\n";

    SourceOptions options;
    options.distribution = prompt_.askInt("\nEnter distribution number to use (e.g., 1 for d1)", 1);

    if(prompt_.askYesNo("\nDo you want to specify a position (POS)?")){
        out << "\n⚠ NOTE: You must specify coordinates in the TARGET cell's local frame.\n";
        std::array<double, 3> pos{};
        pos[0] = prompt_.askFloat("  X coordinate");
        pos[1] = prompt_.askFloat("  Y coordinate");
        pos[2] = prompt_.askFloat("  Z coordinate");
        options.position = pos;
    }
    if(prompt_.askYesNo("\nDo you want to specify energy (ERG)?")){
        options.energy = prompt_.askFloat("  Energy (MeV)");
    }

    SourceCards cards = source_cards(session.stack, options);
    if(cards.locations > 1){
        out << "\n⚠ NON-CONTIGUOUS selection detected!\n"
            << "   Generating " << cards.locations << " separate source locations with equal probability.\n";
    }
    for(const auto& line : cards.lines()) session.cards.push_back(line);
    card_block(out, "GENERATED SOURCE DEFINITION:", cards.lines());
}

void Wizard::offerVerification(WizardSession& session){
    auto& out = prompt_.out();
    banner(out, "VERIFICATION");
    if(!prompt_.askYesNo("\nWould you like to generate a verification deck snippet?")){
        out << "\n✓ Wizard complete!\n";
        return;
    }
    session.verification = verification_deck(session.stack);
    card_block(out, "VERIFICATION DECK SNIPPET", session.verification);
    out << "\n✓ Instructions:\n"
           "  1. Add this to a copy of your input deck\n"
           "  2. Set all materials to void (M0 or remove material cards)\n"
           "  3. Run MCNP\n"
           "  4. Check output file for 'source particle' lines\n"
           "  5. Verify particles start in the correct cell/lattice position\n"
           "  6. If particles are 'lost' or in Cell 0, check your specification\n";
}
