#ifndef _CellPath_ui_backend_h_
#define _CellPath_ui_backend_h_

// UI backend abstraction layer
// Only translation units that draw include this header.

#ifndef CELLPATH_UI_NCURSES
#define CELLPATH_UI_NCURSES
#endif

// Keep clear()/move()/erase() as real functions so they do not collide
// with std::move and container members
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>
#include <clocale>
#include <unistd.h>

#define UI_WINDOW WINDOW*
#define UI_NULL NULL

inline bool terminal_available() {
    return ::isatty(STDIN_FILENO) == 1 && ::isatty(STDOUT_FILENO) == 1;
}

inline void ui_init() {
    std::setlocale(LC_ALL, "");
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
    if (has_colors()) {
        start_color();
        init_pair(1, COLOR_CYAN, COLOR_BLACK);    // Title bar
        init_pair(2, COLOR_YELLOW, COLOR_BLACK);  // Selected cells
    }
}

inline void ui_end() {
    curs_set(1);
    endwin();
}

inline void ui_refresh() {
    refresh();
}

inline int ui_getch() {
    return getch();
}

inline void ui_clear() {
    clear();
}

inline void ui_print(int y, int x, const std::string& text, attr_t attr = A_NORMAL) {
    attron(attr);
    mvaddstr(y, x, text.c_str());
    attroff(attr);
}

inline int ui_rows() {
    return getmaxy(stdscr);
}

inline int ui_cols() {
    return getmaxx(stdscr);
}

// Restores the terminal even when the selector loop throws
struct UiSession {
    UiSession() { ui_init(); }
    ~UiSession() { ui_end(); }
    UiSession(const UiSession&) = delete;
    UiSession& operator=(const UiSession&) = delete;
};

#endif // _CellPath_ui_backend_h_
