#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace hidock::console {

class IConsoleTransport {
public:
    virtual ~IConsoleTransport() = default;

    // Reads a single input byte.
    // Returns false on timeout or when input is unavailable.
    virtual bool read_byte(std::uint8_t& out, int timeout_ms) = 0;

    // Buffers bytes until '\n' or '\r'. Used by tests and simple transports.
    virtual bool read_line(std::string& out, int timeout_ms)
    {
        out.clear();

        std::uint8_t ch = 0;
        if (!read_byte(ch, timeout_ms)) {
            return false;
        }

        for (;;) {
            if (ch == '\r' || ch == '\n') {
                return true;
            }
            out.push_back(static_cast<char>(ch));

            if (!read_byte(ch, 0)) {
                return false;
            }
        }
    }

    virtual void write(std::string_view s) = 0;

    virtual void write_line(std::string_view s) = 0;

    // True once input is closed for good (EOF on stdin).
    virtual bool closed() const { return false; }
};

// stdin/stdout with a raw-ish terminal when stdin is a tty.
std::unique_ptr<IConsoleTransport> create_stdio_console_transport();

} // namespace hidock::console
