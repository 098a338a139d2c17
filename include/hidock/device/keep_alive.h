#pragma once

#include <condition_variable>
#include <mutex>
#include <thread>

#include "hidock/core/logging.h"
#include "hidock/device/device_session.h"

namespace hidock::device {

// Periodically pings a connected session so the device does not drop the
// USB link. A ping never waits for an exchange in progress; it is skipped.
class KeepAlive {
public:
    KeepAlive(DeviceSession& session, io::Millis interval);
    ~KeepAlive();

    KeepAlive(const KeepAlive&) = delete;
    KeepAlive& operator=(const KeepAlive&) = delete;

    void start();
    void stop();

    bool running() const;

private:
    void run();

    DeviceSession&          _session;
    io::Millis              _interval;
    log::Logger             _log;

    mutable std::mutex      _mutex;
    std::condition_variable _cv;
    bool                    _stopRequested{false};
    std::thread             _thread;
};

} // namespace hidock::device
