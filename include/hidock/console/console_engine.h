#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "hidock/console/console_commands.h"
#include "hidock/console/console_transport.h"

namespace hidock::console {

// Line-oriented shell over a command registry.
class ConsoleEngine {
public:
    ConsoleEngine(const ConsoleCommandRegistry& registry,
                  IConsoleTransport& io,
                  std::string prompt = "hidock> ");

    // Blocking loop until a command asks to quit or input closes.
    void run_loop();

    // One cooperative iteration. Returns false to stop the console.
    bool step(int timeout_ms);

    // Runs one command line. Returns false when the console should stop.
    bool handle_line(std::string_view line);

private:
    // Minimal line editor: backspace, Ctrl-U and up/down history.
    bool read_line_edit(std::string& out_line, int timeout_ms);
    void redraw();

    const ConsoleCommandRegistry& _registry;
    IConsoleTransport&            _io;
    std::string                   _prompt;

    std::string              _edit;
    std::string              _esc;
    char                     _pendingEol{0};
    bool                     _promptShown{false};

    std::vector<std::string> _history;
    std::size_t              _historyMax{32};
    std::size_t              _historyIndex{0};
};

} // namespace hidock::console
