#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace hidock::io {

enum class IOStatus : std::uint8_t {
    Ok = 0,
    NotConnected,
    ConnectionFailed,
    Timeout,          // transport receive produced nothing in time
    CommandTimeout,   // no matching response before the command deadline
    MalformedHeader,
    TransferFailed,
    InvalidResponse,
    InvalidArgument,
    Unsupported,
    CommandFailed,    // device answered with a non-zero status byte
    Blocked,
    Cancelled,
    IOError,
};

const char* to_string(IOStatus s);

struct IOResult {
    IOStatus    status{IOStatus::Ok};
    std::string message;

    bool ok() const noexcept { return status == IOStatus::Ok; }

    static IOResult success() { return IOResult{}; }
    static IOResult failure(IOStatus s, std::string msg = {})
    {
        return IOResult{s, std::move(msg)};
    }
};

// Value-or-error return used by every controller call.
template <typename T>
struct Result {
    IOResult error{};
    T        value{};

    bool ok() const noexcept { return error.ok(); }

    static Result success(T v)
    {
        Result r;
        r.value = std::move(v);
        return r;
    }
    static Result failure(IOResult e)
    {
        Result r;
        r.error = std::move(e);
        return r;
    }
};

struct TransferResult {
    IOResult    error{};
    std::size_t bytesTransferred{0};

    bool ok() const noexcept { return error.ok(); }
};

} // namespace hidock::io
