#pragma once
// TerminalSession.hpp – Interactive full-screen browser driving a Navigator
// over a raw-mode POSIX terminal.
//
// Keys:
//   ↑/k ↓/j      move selection        Home/End   first/last visible
//   e, space     expand/collapse       enter      show details
//   /            search                g          jump to id
//   r            refresh               ?          help
//   q            quit

#include "TikiLang/Navigator.hpp"

#include <termios.h>

#include <optional>
#include <string>

namespace tiki::app {

// Puts stdin into non-canonical, no-echo mode for its lifetime.
class RawTerminalMode {
public:
    RawTerminalMode();
    ~RawTerminalMode();

    RawTerminalMode(const RawTerminalMode&)            = delete;
    RawTerminalMode& operator=(const RawTerminalMode&) = delete;

    [[nodiscard]] bool ok() const noexcept { return active_; }

private:
    termios original_{};
    bool    active_{false};
};

// True when both stdin and stdout are attached to a terminal.
[[nodiscard]] bool terminalAvailable() noexcept;

class TerminalSession {
public:
    TerminalSession(Navigator& nav, std::string title);

    // Runs until the user quits or input ends. Returns a process exit code.
    int run();

private:
    enum class Key { Up, Down, Home, End, Enter, Char, Escape, Backspace, Eof, Other };
    struct KeyEvent {
        Key  key{Key::Other};
        char ch{0};
    };

    [[nodiscard]] KeyEvent readKey() const;

    // Single-line input on the bottom row; nullopt when cancelled with Esc.
    std::optional<std::string> prompt(const std::string& label);

    void redraw() const;
    void showDetails();
    void showHelp();

    Navigator&  nav_;
    std::string title_;
    std::string panel_;    // text under the tree: details or help
    std::string status_;   // one-line feedback under the tree
};

} // namespace tiki::app
