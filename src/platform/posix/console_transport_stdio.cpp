#include "hidock/console/console_transport.h"

#include <iostream>
#include <string>

#include <termios.h>
#include <poll.h>
#include <unistd.h>

namespace hidock::console {

namespace {

class StdioConsoleTransport final : public IConsoleTransport {
public:
    StdioConsoleTransport()
    {
        if (::isatty(STDIN_FILENO)) {
            if (::tcgetattr(STDIN_FILENO, &_orig) == 0) {
                termios t = _orig;
                // Minimal raw-ish mode for interactive editing.
                t.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON));
                t.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
                t.c_oflag |= OPOST;
                t.c_cc[VMIN] = 0;
                t.c_cc[VTIME] = 0;
                if (::tcsetattr(STDIN_FILENO, TCSANOW, &t) == 0) {
                    _hasTermios = true;
                }
            }
        }
    }

    ~StdioConsoleTransport() override
    {
        if (_hasTermios) {
            (void)::tcsetattr(STDIN_FILENO, TCSANOW, &_orig);
        }
    }

    bool read_byte(std::uint8_t& out, int timeout_ms) override
    {
        if (_closed) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret <= 0) {
            return false;
        }
        if ((pfd.revents & (POLLIN | POLLHUP)) == 0) {
            return false;
        }

        unsigned char ch = 0;
        const ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if (n == 0) {
            _closed = true;
            return false;
        }
        if (n != 1) {
            return false;
        }
        out = static_cast<std::uint8_t>(ch);
        return true;
    }

    void write(std::string_view s) override
    {
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.flush();
    }

    void write_line(std::string_view s) override
    {
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.put('\n');
        std::cout.flush();
    }

    bool closed() const override { return _closed; }

private:
    bool    _hasTermios{false};
    bool    _closed{false};
    termios _orig{};
};

} // namespace

std::unique_ptr<IConsoleTransport> create_stdio_console_transport()
{
    return std::make_unique<StdioConsoleTransport>();
}

} // namespace hidock::console
