// TerminalSession.cpp – Raw-mode key loop and ANSI full-screen repaint.

#include "TerminalSession.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace tiki::app {

// ─────────────────────────────────────────────────────────────────────────────
//  Terminal plumbing
// ─────────────────────────────────────────────────────────────────────────────

bool terminalAvailable() noexcept {
    return ::isatty(STDIN_FILENO) == 1 && ::isatty(STDOUT_FILENO) == 1;
}

RawTerminalMode::RawTerminalMode() {
    if (::isatty(STDIN_FILENO) != 1) return;
    if (tcgetattr(STDIN_FILENO, &original_) != 0) return;
    termios raw = original_;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
    raw.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
    raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
    raw.c_cc[VMIN]  = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0)
        active_ = true;
}

RawTerminalMode::~RawTerminalMode() {
    if (active_)
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
}

namespace {

struct ScreenSize {
    size_t rows{24};
    size_t cols{80};
};

ScreenSize screenSize() {
    ScreenSize sz;
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
        sz.rows = ws.ws_row;
        sz.cols = ws.ws_col;
    }
    return sz;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        out.push_back(line);
    return out;
}

// Raw mode disables output post-processing, so every line ends in CR LF.
constexpr const char* kEol = "\x1b[K\r\n";

constexpr const char* kHelpText =
    "Tiki Navigator Help\n"
    "\n"
    "Navigation:\n"
    "  Up/Down, k/j   move selection\n"
    "  Home/End       first/last visible concept\n"
    "  Enter          show concept details\n"
    "  e, Space       expand/collapse selected concept\n"
    "\n"
    "Search & Jump:\n"
    "  /              search concepts by title or id\n"
    "  g              jump to a concept id (e.g. *1**2)\n"
    "  r              refresh display\n"
    "\n"
    "General:\n"
    "  q              quit\n"
    "  ?              show this help";

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
//  TerminalSession
// ─────────────────────────────────────────────────────────────────────────────

TerminalSession::TerminalSession(Navigator& nav, std::string title)
    : nav_(nav), title_(std::move(title)), panel_("Select a concept to view details") {}

TerminalSession::KeyEvent TerminalSession::readKey() const {
    char c = 0;
    if (::read(STDIN_FILENO, &c, 1) != 1)
        return {Key::Eof, 0};

    switch (c) {
    case '\r':
    case '\n':   return {Key::Enter, c};
    case 127:
    case '\b':   return {Key::Backspace, c};
    case 4:      return {Key::Eof, c};        // Ctrl-D
    case '\x1b': break;
    default:     return {Key::Char, c};
    }

    // ESC [ A/B/H/F  or  ESC [ 1~ / 4~
    char seq[3] = {0, 0, 0};
    if (::read(STDIN_FILENO, &seq[0], 1) != 1 || seq[0] != '[')
        return {Key::Escape, 0};
    if (::read(STDIN_FILENO, &seq[1], 1) != 1)
        return {Key::Escape, 0};
    switch (seq[1]) {
    case 'A': return {Key::Up, 0};
    case 'B': return {Key::Down, 0};
    case 'H': return {Key::Home, 0};
    case 'F': return {Key::End, 0};
    case '1':
    case '4':
        if (::read(STDIN_FILENO, &seq[2], 1) == 1 && seq[2] == '~')
            return {seq[1] == '1' ? Key::Home : Key::End, 0};
        return {Key::Other, 0};
    default:
        return {Key::Other, 0};
    }
}

std::optional<std::string> TerminalSession::prompt(const std::string& label) {
    const ScreenSize sz = screenSize();
    std::string buffer;
    while (true) {
        std::cout << "\x1b[" << sz.rows << ";1H" << label << buffer << "\x1b[K" << std::flush;
        KeyEvent ev = readKey();
        switch (ev.key) {
        case Key::Enter:     return buffer;
        case Key::Escape:
        case Key::Eof:       return std::nullopt;
        case Key::Backspace: if (!buffer.empty()) buffer.pop_back(); break;
        case Key::Char:
            if (static_cast<unsigned char>(ev.ch) >= 0x20) buffer += ev.ch;
            break;
        default: break;
        }
    }
}

void TerminalSession::redraw() const {
    const ScreenSize sz      = screenSize();
    const StyledRenderer& r  = nav_.renderer();
    const auto tree          = nav_.render();
    const auto panel         = splitLines(panel_);

    // Rows: heading, blank, tree…, rule, panel…, status, footer.
    const size_t panel_rows = std::min(panel.size(), sz.rows / 3);
    const size_t fixed      = 5 + panel_rows;
    const size_t tree_rows  = sz.rows > fixed ? sz.rows - fixed : 1;

    // Keep the selection inside the visible window.
    const size_t sel   = nav_.selectedIndex();
    size_t       first = sel >= tree_rows ? sel - tree_rows + 1 : 0;
    first = std::min(first, tree.size() > tree_rows ? tree.size() - tree_rows : size_t{0});

    std::string frame = "\x1b[H";
    frame += r.paint("1", title_) + kEol;
    frame += kEol;
    for (size_t i = first; i < tree.size() && i < first + tree_rows; ++i)
        frame += tree[i] + kEol;
    frame += r.paint(r.style().guide, std::string(std::min<size_t>(sz.cols, 60), '-')) + kEol;
    for (size_t i = 0; i < panel_rows; ++i)
        frame += (i == 0 ? r.paint("1", panel[i]) : r.paint(r.style().description, panel[i])) + kEol;
    frame += status_ + kEol;
    frame += r.paint("2", "q quit  / search  g jump  e toggle  enter details  ? help");
    frame += "\x1b[J";

    std::cout << frame << std::flush;
}

void TerminalSession::showDetails() {
    panel_ = nav_.details();
}

void TerminalSession::showHelp() {
    panel_ = kHelpText;
}

int TerminalSession::run() {
    RawTerminalMode raw;
    if (!raw.ok()) {
        std::cerr << "[tiki] error: cannot switch the terminal to raw mode\n";
        return 1;
    }

    std::cout << "\x1b[?1049h\x1b[?25l";   // alternate screen, hide cursor
    bool running = true;
    while (running) {
        redraw();
        const KeyEvent ev = readKey();
        status_.clear();

        switch (ev.key) {
        case Key::Up:    nav_.moveUp();    showDetails(); break;
        case Key::Down:  nav_.moveDown();  showDetails(); break;
        case Key::Home:  nav_.moveFirst(); showDetails(); break;
        case Key::End:   nav_.moveLast();  showDetails(); break;
        case Key::Enter: showDetails(); break;
        case Key::Eof:   running = false; break;
        case Key::Char:
            switch (ev.ch) {
            case 'k': nav_.moveUp();   showDetails(); break;
            case 'j': nav_.moveDown(); showDetails(); break;
            case 'e':
            case ' ':
                status_ = nav_.onToggleExpand() ? "Expanded" : "Collapsed";
                break;
            case '/': {
                std::cout << "\x1b[?25h";
                auto query = prompt("Search: ");
                std::cout << "\x1b[?25l";
                if (!query) break;
                SearchResult res = nav_.onSearch(*query);
                status_ = res.message;
                if (!res.empty()) showDetails();
                break;
            }
            case 'g': {
                std::cout << "\x1b[?25h";
                auto id = prompt("Jump to id: ");
                std::cout << "\x1b[?25l";
                if (!id) break;
                if (nav_.jumpToId(*id)) showDetails();
                else status_ = "No concept with id '" + *id + "'";
                break;
            }
            case 'r': status_ = "Refreshed"; break;
            case '?': showHelp(); break;
            case 'q': running = false; break;
            default: break;
            }
            break;
        default:
            break;
        }
    }
    std::cout << "\x1b[?25h\x1b[?1049l" << std::flush;
    return 0;
}

} // namespace tiki::app
