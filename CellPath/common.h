#ifndef _CellPath_common_h_
#define _CellPath_common_h_


// Tracing (optional debug feature)
#ifdef CELLPATH_TRACE
namespace cellpath_trace {
    void log_line(const std::string& line);

    inline std::string concat(){ return {}; }

    template<typename... Args>
    std::string concat(Args&&... args){
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    struct Scope {
        std::string name;
        Scope(const char* fn, const std::string& details);
        ~Scope();
    };

    void log_loop(const char* tag, const std::string& details);
}

#define CELLPATH_TRACE_CAT(a,b) CELLPATH_TRACE_CAT_1(a,b)
#define CELLPATH_TRACE_CAT_1(a,b) a##b
#define TRACE_FN(...) cellpath_trace::Scope CELLPATH_TRACE_CAT(_trace_scope_, __LINE__)(__func__, cellpath_trace::concat(__VA_ARGS__))
#define TRACE_MSG(...) cellpath_trace::log_line(cellpath_trace::concat(__VA_ARGS__))
#define TRACE_LOOP(tag, ...) cellpath_trace::log_loop(tag, cellpath_trace::concat(__VA_ARGS__))
#else
#define TRACE_FN(...)
#define TRACE_MSG(...)
#define TRACE_LOOP(...)
#endif

// i18n (internationalization)
namespace i18n {
    enum class MsgId {
        WELCOME, GOODBYE, CANCELLED,
        INVALID_INT, INVALID_FLOAT, INVALID_YES_NO,
        INVALID_CHOICE, INPUT_CLOSED,
        NO_CELLS_SELECTED, TERMINAL_TOO_SMALL
    };

    const char* get(MsgId id);
    void init();
    void set_english_only();
}

// Errors raised by the core. All of them are recoverable: the dialogue
// reprompts or falls back to manual entry.
struct CellPathError : std::runtime_error {
    enum class Kind {
        InvalidRange,
        EmptySelection,
        AmbiguousNonContiguity,
        BrokenChain,
        NotContiguous,
        SelectorClosed,
        BadInput,
        InputClosed
    };

    Kind kind;

    CellPathError(Kind k, const std::string& msg) : std::runtime_error(msg), kind(k) {}
};

const char* error_kind_label(CellPathError::Kind kind);

#endif
