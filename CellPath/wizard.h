#ifndef _CellPath_wizard_h_
#define _CellPath_wizard_h_

//
// Line-by-line operator dialogue
//

// Reprompts on invalid answers; end of input throws InputClosed
class Prompter {
public:
    Prompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    std::string askLine(const std::string& prompt);
    int askInt(const std::string& prompt, std::optional<int> def = std::nullopt);
    double askFloat(const std::string& prompt);
    bool askYesNo(const std::string& prompt);
    int askChoice(const std::string& prompt, const std::vector<int>& allowed);
    Dimension askDimension(const std::string& prompt);

    std::ostream& out() { return out_; }

private:
    std::istream& in_;
    std::ostream& out_;
};

enum class WizardMode { Tally, Source, Both };

using SelectorLauncher = std::function<std::optional<LatticeSpec>(LatticeGeometry, const LatticeBounds&, bool)>;

// Everything one wizard run decides, passed explicitly between steps
struct WizardSession {
    WizardMode mode = WizardMode::Tally;
    int target_cell = 0;
    ContainmentStack stack;
    std::string tally_type;
    std::optional<double> target_volume;
    std::vector<std::string> cards;          // generated card lines in output order
    std::vector<std::string> verification;   // verification deck snippet, if requested
};

class Wizard {
public:
    // An empty launcher disables the visual selector
    Wizard(Prompter& prompter, const WizardConfig& config, SelectorLauncher launcher = {});

    WizardSession run();

    WizardMode chooseMode();
    ContainmentStack buildStack(WizardSession& session);
    void generateTally(WizardSession& session);
    void generateSource(WizardSession& session);
    void offerVerification(WizardSession& session);

private:
    ContainmentNode askParent(int universe);
    void askLattice(ContainmentNode& node);
    LatticeBounds askBounds(const std::string& label);
    LatticeSpec selectVisually(LatticeGeometry geometry, const LatticeBounds& bounds, bool infinite);
    LatticeSpec manualEntry(bool infinite);
    bool visualAvailable() const { return config_.visual_selector && static_cast<bool>(launcher_); }

    Prompter& prompt_;
    WizardConfig config_;
    SelectorLauncher launcher_;
};

#endif
