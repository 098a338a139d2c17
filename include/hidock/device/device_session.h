#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "hidock/core/logging.h"
#include "hidock/device/capabilities.h"
#include "hidock/device/device_info.h"
#include "hidock/io/io_status.h"
#include "hidock/io/protocol/frame.h"
#include "hidock/io/transport/transport.h"

namespace hidock::device {

enum class SessionState : std::uint8_t {
    Disconnected = 0,
    Connecting,
    Connected,
};

const char* to_string(SessionState s);

struct SessionOptions {
    io::Millis commandTimeout{5000};
    io::Millis pingTimeout{1000};
};

enum class StreamControl : std::uint8_t {
    Continue,
    Done,
    Abort,   // handler rejected the frame; stream() returns TransferFailed
};

// Receives every frame matching the streamed command, in arrival order.
using FrameHandler = std::function<StreamControl(const io::protocol::Message&)>;

struct StreamOptions {
    io::Millis chunkTimeout{5000};
    io::Millis overallTimeout{0};                // 0 = no overall deadline
    const std::atomic<bool>* cancel{nullptr};    // checked before every receive
};

// One connection to one recorder.
//
// Owns the sequence counter and the receive buffer. Every exchange
// (sequence assignment, send, wait) runs under one mutex, so concurrent
// callers are serialised. Responses are matched by (id, sequence); any
// other frame seen while waiting is logged and dropped.
class DeviceSession {
public:
    DeviceSession(io::ITransport& transport,
                  log::Logger logger = {},
                  SessionOptions options = {});
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Opens the transport and runs the device-info handshake.
    io::IOResult connect();

    // Tears down the transport and resets sequence and identity. Idempotent.
    void disconnect();

    // Sends `cmd` (its sequence is assigned here) and waits for the response.
    io::IOResult send(io::protocol::Command& cmd, io::protocol::Message& response);
    io::IOResult send(io::protocol::Command& cmd,
                      io::protocol::Message& response,
                      io::Millis timeout);

    // Sends `cmd` and feeds every matching frame to `handler` until it
    // returns Done. Used for multi-frame replies (file list, transfers).
    io::IOResult stream(io::protocol::Command& cmd,
                        const FrameHandler& handler,
                        const StreamOptions& options);

    // Keep-alive probe. Skipped (returns Ok) when another exchange holds
    // the session.
    io::IOResult try_ping();

    bool          is_connected() const { return _state.load() == SessionState::Connected; }
    SessionState  state() const { return _state.load(); }
    DeviceModel   model() const;
    std::uint32_t version_number() const;
    std::string   version_code() const;
    std::string   serial_number() const;
    DeviceInfo    info() const;
    Capabilities  capabilities() const;
    std::uint32_t next_sequence() const { return _nextSequence.load(); }

    const SessionOptions& options() const { return _options; }
    const log::Logger& logger() const { return _log; }

private:
    using Clock = std::chrono::steady_clock;

    io::IOResult exchange_locked(io::protocol::Command& cmd,
                                 io::protocol::Message& response,
                                 io::Millis timeout);
    io::IOResult transmit_locked(io::protocol::Command& cmd);

    // Pops the next complete frame from _rxBuffer.
    // Ok + true when a frame was produced, Ok + false when more bytes are needed.
    io::IOResult next_buffered_locked(io::protocol::Message& out, bool& produced);

    // One transport.receive bounded by `deadline`, appended to _rxBuffer.
    io::IOResult fill_locked(Clock::time_point deadline);

    void reset_locked();

    // Transport reported the device gone underneath us.
    void mark_lost_locked();

    io::ITransport& _transport;
    log::Logger     _log;
    SessionOptions  _options;

    mutable std::mutex _ioMutex;      // one exchange at a time
    mutable std::mutex _infoMutex;    // identity fields

    std::atomic<SessionState>  _state{SessionState::Disconnected};
    std::atomic<std::uint32_t> _nextSequence{1};
    DeviceInfo                 _info;
    io::protocol::ByteBuffer   _rxBuffer;
};

} // namespace hidock::device
