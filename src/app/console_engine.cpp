#include "hidock/console/console_engine.h"

#include "hidock/console/console_parse.h"

namespace hidock::console {

ConsoleEngine::ConsoleEngine(const ConsoleCommandRegistry& registry,
                             IConsoleTransport& io,
                             std::string prompt)
    : _registry(registry)
    , _io(io)
    , _prompt(std::move(prompt))
{}

void ConsoleEngine::run_loop()
{
    while (step(200)) {
        if (_io.closed()) {
            break;
        }
    }
}

bool ConsoleEngine::step(int timeout_ms)
{
    std::string line;
    if (!read_line_edit(line, timeout_ms)) {
        return true; // no input / timeout
    }
    return handle_line(line);
}

bool ConsoleEngine::handle_line(std::string_view line)
{
    const auto argv = split_ws(line);
    if (argv.empty()) {
        return true;
    }

    const auto handled = _registry.dispatch(argv);
    if (!handled) {
        _io.write("unknown command: ");
        _io.write_line(argv[0]);
        _io.write_line("type 'help' for a list");
        return true;
    }
    return *handled;
}

void ConsoleEngine::redraw()
{
    // ANSI: clear line, cursor to column 1.
    _io.write("\x1b[2K\x1b[1G");
    _io.write(_prompt);
    _io.write(_edit);
}

bool ConsoleEngine::read_line_edit(std::string& out_line, int timeout_ms)
{
    out_line.clear();

    if (!_promptShown) {
        _io.write(_prompt);
        _io.write(_edit);
        _promptShown = true;
        _historyIndex = _history.size();
    }

    std::uint8_t b = 0;
    int wait = timeout_ms;
    while (_io.read_byte(b, wait)) {
        // After the first byte, drain what is already there without blocking.
        wait = 0;

        if (_pendingEol != 0) {
            const bool pair = (_pendingEol == '\r' && b == '\n') || (_pendingEol == '\n' && b == '\r');
            _pendingEol = 0;
            if (pair) {
                continue;
            }
        }

        if (!_esc.empty() || b == 0x1b) {
            _esc.push_back(static_cast<char>(b));
            const char last = _esc.back();
            if (_esc.size() >= 3 && ((last >= 'A' && last <= 'Z') || last == '~')) {
                if (_esc == "\x1b[A" && _historyIndex > 0) {
                    _edit = _history[--_historyIndex];
                    redraw();
                } else if (_esc == "\x1b[B" && _historyIndex < _history.size()) {
                    ++_historyIndex;
                    _edit = _historyIndex < _history.size() ? _history[_historyIndex] : std::string();
                    redraw();
                }
                _esc.clear();
            } else if (_esc.size() > 8) {
                _esc.clear();
            }
            continue;
        }

        if (b == '\r' || b == '\n') {
            _pendingEol = static_cast<char>(b);
            _io.write("\r\n");
            out_line = std::string(trim_ws(_edit));
            if (!out_line.empty() && (_history.empty() || _history.back() != out_line)) {
                _history.push_back(out_line);
                if (_history.size() > _historyMax) {
                    _history.erase(_history.begin());
                }
            }
            _edit.clear();
            _promptShown = false;
            return true;
        }

        if (b == 0x08 || b == 0x7f) {
            if (!_edit.empty()) {
                _edit.pop_back();
                redraw();
            }
            continue;
        }

        // Ctrl-U: kill line
        if (b == 0x15) {
            _edit.clear();
            redraw();
            continue;
        }

        if (b >= 0x20 && b < 0x7f) {
            _edit.push_back(static_cast<char>(b));
            _io.write(std::string_view(reinterpret_cast<const char*>(&b), 1));
        }
    }
    return false;
}

} // namespace hidock::console
