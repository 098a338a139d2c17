#include "hidock/device/keep_alive.h"

namespace hidock::device {

KeepAlive::KeepAlive(DeviceSession& session, io::Millis interval)
    : _session(session)
    , _interval(interval)
    , _log(session.logger().with_tag("keepalive"))
{
}

KeepAlive::~KeepAlive()
{
    stop();
}

void KeepAlive::start()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_thread.joinable()) {
        return;
    }
    _stopRequested = false;
    _thread = std::thread([this] { run(); });
}

void KeepAlive::stop()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_thread.joinable()) {
            return;
        }
        _stopRequested = true;
    }
    _cv.notify_all();
    _thread.join();
}

bool KeepAlive::running() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _thread.joinable() && !_stopRequested;
}

void KeepAlive::run()
{
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_stopRequested) {
        if (_cv.wait_for(lock, _interval, [this] { return _stopRequested; })) {
            break;
        }

        lock.unlock();
        if (_session.is_connected()) {
            const io::IOResult r = _session.try_ping();
            if (!r.ok()) {
                HD_LOGW(_log, "ping failed: %s", io::to_string(r.status));
            }
        }
        lock.lock();
    }
}

} // namespace hidock::device
