#include "hidock/device/device_session.h"
#include "hidock/io/protocol/command_ids.h"
#include "hidock/io/protocol/frame_codec.h"

#include <algorithm>

namespace hidock::device {

using io::IOResult;
using io::IOStatus;
using io::protocol::Command;
using io::protocol::CommandId;
using io::protocol::DecodeStatus;
using io::protocol::Message;

const char* to_string(SessionState s)
{
    switch (s) {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Connecting:   return "connecting";
    case SessionState::Connected:    return "connected";
    }
    return "unknown";
}

DeviceSession::DeviceSession(io::ITransport& transport,
                             log::Logger logger,
                             SessionOptions options)
    : _transport(transport)
    , _log(logger.with_tag("session"))
    , _options(options)
{
}

DeviceSession::~DeviceSession()
{
    disconnect();
}

IOResult DeviceSession::connect()
{
    std::lock_guard<std::mutex> lock(_ioMutex);

    if (_state.load() == SessionState::Connected) {
        return IOResult::success();
    }

    IOResult r = _transport.connect();
    if (!r.ok()) {
        HD_LOGE(_log, "transport connect failed: %s", r.message.c_str());
        return IOResult::failure(IOStatus::ConnectionFailed, r.message);
    }

    reset_locked();
    _state.store(SessionState::Connecting);

    Command cmd(CommandId::QueryDeviceInfo);
    Message resp;
    r = exchange_locked(cmd, resp, _options.commandTimeout);

    DeviceInfo info;
    info.model = _transport.model();
    if (r.ok() && !parse_device_info(resp.body, info)) {
        r = IOResult::failure(IOStatus::InvalidResponse, "device info body too short");
    }

    if (!r.ok()) {
        HD_LOGE(_log, "handshake failed: %s %s", io::to_string(r.status), r.message.c_str());
        _transport.disconnect();
        reset_locked();
        _state.store(SessionState::Disconnected);
        return r;
    }

    {
        std::lock_guard<std::mutex> infoLock(_infoMutex);
        _info = info;
    }
    _state.store(SessionState::Connected);

    HD_LOGI(_log, "connected: model=%s version=%s (0x%08X) serial=%s",
            model_name(info.model),
            info.versionCode.c_str(),
            (unsigned)info.versionNumber,
            info.serialNumber.c_str());
    return IOResult::success();
}

void DeviceSession::disconnect()
{
    std::lock_guard<std::mutex> lock(_ioMutex);

    if (_state.load() == SessionState::Disconnected && !_transport.is_connected()) {
        return;
    }

    _transport.disconnect();
    reset_locked();
    _state.store(SessionState::Disconnected);
    HD_LOGI(_log, "disconnected");
}

IOResult DeviceSession::send(Command& cmd, Message& response)
{
    return send(cmd, response, _options.commandTimeout);
}

IOResult DeviceSession::send(Command& cmd, Message& response, io::Millis timeout)
{
    std::lock_guard<std::mutex> lock(_ioMutex);
    return exchange_locked(cmd, response, timeout);
}

IOResult DeviceSession::stream(Command& cmd,
                               const FrameHandler& handler,
                               const StreamOptions& options)
{
    std::lock_guard<std::mutex> lock(_ioMutex);

    IOResult r = transmit_locked(cmd);
    if (!r.ok()) {
        return r;
    }

    const auto start = Clock::now();
    const auto overallDeadline = options.overallTimeout.count() > 0
        ? start + options.overallTimeout
        : Clock::time_point::max();
    auto chunkDeadline = start + options.chunkTimeout;

    for (;;) {
        if (options.cancel && options.cancel->load()) {
            HD_LOGI(_log, "%s seq=%u cancelled",
                    io::protocol::command_name(cmd.id), (unsigned)cmd.sequence);
            return IOResult::failure(IOStatus::Cancelled, "cancelled by caller");
        }

        Message msg;
        bool produced = false;
        r = next_buffered_locked(msg, produced);
        if (!r.ok()) {
            return r;
        }

        if (produced) {
            if (msg.id != cmd.id || msg.sequence != cmd.sequence) {
                HD_LOGW(_log, "dropped unmatched frame id=%u seq=%u (waiting for id=%u seq=%u)",
                        (unsigned)msg.id, (unsigned)msg.sequence,
                        (unsigned)cmd.id, (unsigned)cmd.sequence);
                continue;
            }

            switch (handler(msg)) {
            case StreamControl::Done:
                return IOResult::success();
            case StreamControl::Abort:
                return IOResult::failure(IOStatus::TransferFailed, "stream aborted");
            case StreamControl::Continue:
                break;
            }
            chunkDeadline = Clock::now() + options.chunkTimeout;
            continue;
        }

        r = fill_locked(std::min(chunkDeadline, overallDeadline));
        if (!r.ok()) {
            if (r.status == IOStatus::CommandTimeout) {
                HD_LOGW(_log, "%s seq=%u timed out while streaming",
                        io::protocol::command_name(cmd.id), (unsigned)cmd.sequence);
            }
            return r;
        }
    }
}

IOResult DeviceSession::try_ping()
{
    std::unique_lock<std::mutex> lock(_ioMutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return IOResult::success();
    }
    if (_state.load() != SessionState::Connected) {
        return IOResult::failure(IOStatus::NotConnected);
    }

    Command cmd(CommandId::QueryDeviceInfo);
    Message resp;
    return exchange_locked(cmd, resp, _options.pingTimeout);
}

DeviceModel DeviceSession::model() const
{
    std::lock_guard<std::mutex> lock(_infoMutex);
    return _info.model;
}

std::uint32_t DeviceSession::version_number() const
{
    std::lock_guard<std::mutex> lock(_infoMutex);
    return _info.versionNumber;
}

std::string DeviceSession::version_code() const
{
    std::lock_guard<std::mutex> lock(_infoMutex);
    return _info.versionCode;
}

std::string DeviceSession::serial_number() const
{
    std::lock_guard<std::mutex> lock(_infoMutex);
    return _info.serialNumber;
}

DeviceInfo DeviceSession::info() const
{
    std::lock_guard<std::mutex> lock(_infoMutex);
    return _info;
}

Capabilities DeviceSession::capabilities() const
{
    std::lock_guard<std::mutex> lock(_infoMutex);
    return Capabilities{_info.model, _info.versionNumber};
}

// ---------- private ----------

IOResult DeviceSession::exchange_locked(Command& cmd, Message& response, io::Millis timeout)
{
    IOResult r = transmit_locked(cmd);
    if (!r.ok()) {
        return r;
    }

    const auto deadline = Clock::now() + timeout;

    for (;;) {
        Message msg;
        bool produced = false;
        r = next_buffered_locked(msg, produced);
        if (!r.ok()) {
            return r;
        }

        if (produced) {
            if (msg.id == cmd.id && msg.sequence == cmd.sequence) {
                HD_LOGV(_log, "recv %s seq=%u len=%zu",
                        io::protocol::command_name(msg.id),
                        (unsigned)msg.sequence, msg.body.size());
                response = std::move(msg);
                return IOResult::success();
            }
            HD_LOGW(_log, "dropped unmatched frame id=%u seq=%u (waiting for id=%u seq=%u)",
                    (unsigned)msg.id, (unsigned)msg.sequence,
                    (unsigned)cmd.id, (unsigned)cmd.sequence);
            continue;
        }

        r = fill_locked(deadline);
        if (!r.ok()) {
            if (r.status == IOStatus::CommandTimeout) {
                HD_LOGW(_log, "%s seq=%u timed out",
                        io::protocol::command_name(cmd.id), (unsigned)cmd.sequence);
            }
            return r;
        }
    }
}

IOResult DeviceSession::transmit_locked(Command& cmd)
{
    if (_state.load() == SessionState::Disconnected || !_transport.is_connected()) {
        return IOResult::failure(IOStatus::NotConnected);
    }
    if (cmd.body.size() > io::protocol::kMaxBodyLength) {
        return IOResult::failure(IOStatus::InvalidArgument, "command body too large");
    }

    cmd.sequence = _nextSequence.fetch_add(1);
    const io::protocol::ByteBuffer bytes = io::protocol::encode(cmd);

    HD_LOGD(_log, "send %s seq=%u len=%zu",
            io::protocol::command_name(cmd.id), (unsigned)cmd.sequence, cmd.body.size());

    IOResult r = _transport.send(bytes);
    if (r.status == IOStatus::NotConnected) {
        mark_lost_locked();
    }
    return r;
}

IOResult DeviceSession::next_buffered_locked(Message& out, bool& produced)
{
    produced = false;
    if (_rxBuffer.empty()) {
        return IOResult::success();
    }

    std::size_t used = 0;
    switch (io::protocol::decode(_rxBuffer, out, used)) {
    case DecodeStatus::Ok:
        _rxBuffer.erase(_rxBuffer.begin(), _rxBuffer.begin() + static_cast<std::ptrdiff_t>(used));
        produced = true;
        return IOResult::success();
    case DecodeStatus::Incomplete:
        return IOResult::success();
    case DecodeStatus::Malformed:
        break;
    }

    HD_LOGE(_log, "malformed frame header (%02X %02X), discarding %zu buffered bytes",
            (unsigned)_rxBuffer[0], (unsigned)_rxBuffer[1], _rxBuffer.size());
    _rxBuffer.clear();
    return IOResult::failure(IOStatus::MalformedHeader, "bad frame magic");
}

IOResult DeviceSession::fill_locked(Clock::time_point deadline)
{
    const auto now = Clock::now();
    if (now >= deadline) {
        return IOResult::failure(IOStatus::CommandTimeout);
    }

    auto remaining = std::chrono::duration_cast<io::Millis>(deadline - now);
    if (remaining.count() == 0) {
        remaining = io::Millis(1);
    }

    io::protocol::ByteBuffer chunk;
    IOResult r = _transport.receive(chunk, remaining);
    if (r.status == IOStatus::Timeout) {
        // The caller's loop re-checks the deadline.
        return IOResult::success();
    }
    if (r.status == IOStatus::NotConnected) {
        mark_lost_locked();
    }
    if (!r.ok()) {
        return r;
    }

    _rxBuffer.insert(_rxBuffer.end(), chunk.begin(), chunk.end());
    return IOResult::success();
}

void DeviceSession::mark_lost_locked()
{
    HD_LOGW(_log, "device went away");
    reset_locked();
    _state.store(SessionState::Disconnected);
}

void DeviceSession::reset_locked()
{
    _nextSequence.store(1);
    _rxBuffer.clear();

    std::lock_guard<std::mutex> infoLock(_infoMutex);
    _info = DeviceInfo{};
}

} // namespace hidock::device
