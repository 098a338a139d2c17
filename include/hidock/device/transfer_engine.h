#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "hidock/core/logging.h"
#include "hidock/device/device_session.h"
#include "hidock/io/io_status.h"
#include "hidock/io/protocol/frame.h"

namespace hidock::device {

// (bytesSoFar, total). Values only grow; the last call on success has
// bytesSoFar == total.
using ProgressFn = std::function<void(std::size_t, std::size_t)>;

// A download has no overall deadline: it runs as long as chunks keep
// arriving within chunkTimeout of each other.
struct TransferOptions {
    io::Millis  chunkTimeout{5000};
    std::size_t uploadChunkSize{512};
};

// Multi-frame file transfers over a DeviceSession.
class TransferEngine {
public:
    explicit TransferEngine(DeviceSession& session, TransferOptions options = {})
        : _session(session)
        , _options(options)
        , _log(session.logger().with_tag("transfer"))
    {}

    // Issues transfer-file for `filename` and collects exactly
    // `expectedSize` bytes. `out` is only filled on success.
    io::TransferResult download(const std::string& filename,
                                std::size_t expectedSize,
                                io::protocol::ByteBuffer& out,
                                const ProgressFn& onProgress = {},
                                const std::atomic<bool>* cancel = nullptr);

    // Sends `data` in chunkSize pieces, one `commandId` command per piece.
    // A non-zero first response byte fails the upload.
    io::TransferResult upload(io::protocol::CommandId commandId,
                              const io::protocol::ByteBuffer& data,
                              const ProgressFn& onProgress = {},
                              const std::atomic<bool>* cancel = nullptr,
                              io::Millis chunkResponseTimeout = io::Millis(60000));

    const TransferOptions& options() const { return _options; }

private:
    DeviceSession&  _session;
    TransferOptions _options;
    log::Logger     _log;
};

} // namespace hidock::device
