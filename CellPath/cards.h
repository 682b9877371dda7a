#ifndef _CellPath_cards_h_
#define _CellPath_cards_h_

//
// MCNP card fragments built around a cell path
//

std::string tally_card(const std::string& tally_type, const std::string& tally_path);

// "F4:N" -> "4", "f14:p" -> "14"; throws BadInput without a tally number
std::string tally_number(const std::string& tally_type);

// Segment divisor card carrying the target cell volume (cm^3)
std::string volume_card(const std::string& tally_type, double volume);

struct SourceOptions {
    int distribution = 1;
    std::optional<std::array<double, 3>> position;   // target cell's local frame
    std::optional<double> energy;                     // MeV
};

struct SourceCards {
    std::string sdef;
    std::string si;
    std::string sp;
    size_t locations = 1;

    std::vector<std::string> lines() const { return { sdef, si, sp }; }
};

SourceCards source_cards(const ContainmentStack& stack, const SourceOptions& options);

std::vector<std::string> verification_deck(const ContainmentStack& stack);

#endif
