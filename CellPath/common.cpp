#include "CellPath.h"

#ifdef CELLPATH_TRACE
#include <mutex>

namespace cellpath_trace {
    namespace {
        std::mutex& trace_mutex(){ static std::mutex m; return m; }
        std::ofstream& trace_stream(){
            static std::ofstream s([]{
                const char* env = std::getenv("CELLPATH_TRACE_FILE");
                return std::string(env && *env ? env : "cellpath_trace.log");
            }(), std::ios::app);
            return s;
        }
        void write_line(const std::string& line){
            auto& os = trace_stream();
            os << line << '\n';
            os.flush();
        }
    }

    void log_line(const std::string& line){
        std::lock_guard<std::mutex> lock(trace_mutex());
        write_line(line);
    }

    Scope::Scope(const char* fn, const std::string& details) : name(fn ? fn : "?"){
        if(!name.empty()){
            std::string msg = std::string("enter ") + name;
            if(!details.empty()) msg += " | " + details;
            log_line(msg);
        }
    }

    Scope::~Scope(){
        if(!name.empty()){
            log_line(std::string("exit ") + name);
        }
    }

    void log_loop(const char* tag, const std::string& details){
        std::lock_guard<std::mutex> lock(trace_mutex());
        std::string msg = std::string("loop ") + (tag ? tag : "?");
        if(!details.empty()) msg += " | " + details;
        write_line(msg);
    }
}
#endif

//
// Internationalization implementation
//
namespace i18n {
    namespace {
        enum class Lang { EN, FI };
        Lang current_lang = Lang::EN;

        struct MsgTable {
            const char* en;
#ifdef CELLPATH_I18N_ENABLED
            const char* fi;
#endif
        };

        const MsgTable messages[] = {
            // WELCOME
            { "MCNP Universe & Lattice Specification Wizard"
#ifdef CELLPATH_I18N_ENABLED
            , "MCNP-universumi- ja hilamäärittelyvelho"
#endif
            },
            // GOODBYE
            { "Thank you for using the MCNP Universe & Lattice Wizard!"
#ifdef CELLPATH_I18N_ENABLED
            , "Kiitos, että käytit MCNP-universumi- ja hilavelhoa!"
#endif
            },
            // CANCELLED
            { "Wizard cancelled by user."
#ifdef CELLPATH_I18N_ENABLED
            , "Käyttäjä keskeytti velhon."
#endif
            },
            // INVALID_INT
            { "Invalid input. Please enter an integer."
#ifdef CELLPATH_I18N_ENABLED
            , "Virheellinen syöte. Anna kokonaisluku."
#endif
            },
            // INVALID_FLOAT
            { "Invalid input. Please enter a number."
#ifdef CELLPATH_I18N_ENABLED
            , "Virheellinen syöte. Anna luku."
#endif
            },
            // INVALID_YES_NO
            { "Invalid input. Please enter 'y' or 'n'."
#ifdef CELLPATH_I18N_ENABLED
            , "Virheellinen syöte. Vastaa 'y' tai 'n'."
#endif
            },
            // INVALID_CHOICE
            { "Invalid choice. Please pick one of the listed options."
#ifdef CELLPATH_I18N_ENABLED
            , "Virheellinen valinta. Valitse jokin luetelluista vaihtoehdoista."
#endif
            },
            // INPUT_CLOSED
            { "input closed before the wizard finished"
#ifdef CELLPATH_I18N_ENABLED
            , "syöte loppui ennen kuin velho valmistui"
#endif
            },
            // NO_CELLS_SELECTED
            { "ERROR: No cells selected! Press any key..."
#ifdef CELLPATH_I18N_ENABLED
            , "VIRHE: Yhtään solua ei ole valittu! Paina jotain näppäintä..."
#endif
            },
            // TERMINAL_TOO_SMALL
            { "ERROR: Terminal window too small! Please resize."
#ifdef CELLPATH_I18N_ENABLED
            , "VIRHE: Pääteikkuna on liian pieni! Suurenna ikkunaa."
#endif
            },
        };

#ifdef CELLPATH_I18N_ENABLED
        Lang detect_language() {
            const char* lang_env = std::getenv("LANG");
            if(!lang_env) lang_env = std::getenv("LC_MESSAGES");
            if(!lang_env) lang_env = std::getenv("LC_ALL");

            if(lang_env) {
                std::string lang_str(lang_env);
                if(lang_str.find("fi_") == 0 || lang_str.find("fi.") == 0 ||
                   lang_str.find("finnish") != std::string::npos ||
                   lang_str.find("Finnish") != std::string::npos) {
                    return Lang::FI;
                }
            }
            return Lang::EN;
        }
#endif
    }

    void init() {
#ifdef CELLPATH_I18N_ENABLED
        current_lang = detect_language();
#else
        current_lang = Lang::EN;
#endif
    }

    void set_english_only() {
        current_lang = Lang::EN;
    }

    const char* get(MsgId id) {
        size_t idx = static_cast<size_t>(id);
        if(idx >= sizeof(messages) / sizeof(messages[0])) {
            return "??? missing translation ???";
        }
#ifdef CELLPATH_I18N_ENABLED
        if(current_lang == Lang::FI) {
            return messages[idx].fi;
        }
#endif
        return messages[idx].en;
    }
}


const char* error_kind_label(CellPathError::Kind kind){
    switch(kind){
        case CellPathError::Kind::InvalidRange: return "invalid range";
        case CellPathError::Kind::EmptySelection: return "empty selection";
        case CellPathError::Kind::AmbiguousNonContiguity: return "ambiguous non-contiguity";
        case CellPathError::Kind::BrokenChain: return "broken containment chain";
        case CellPathError::Kind::NotContiguous: return "not contiguous";
        case CellPathError::Kind::SelectorClosed: return "selector closed";
        case CellPathError::Kind::BadInput: return "bad input";
        case CellPathError::Kind::InputClosed: return "input closed";
    }
    return "?";
}
