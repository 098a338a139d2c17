#include "hidock/device/transfer_engine.h"
#include "hidock/io/protocol/command_ids.h"

#include <algorithm>

namespace hidock::device {

using io::IOResult;
using io::IOStatus;
using io::TransferResult;
using io::protocol::ByteBuffer;
using io::protocol::Command;
using io::protocol::CommandId;
using io::protocol::Message;

TransferResult TransferEngine::download(const std::string& filename,
                                        std::size_t expectedSize,
                                        ByteBuffer& out,
                                        const ProgressFn& onProgress,
                                        const std::atomic<bool>* cancel)
{
    TransferResult result;
    out.clear();

    if (expectedSize == 0) {
        return result;
    }

    ByteBuffer acc;
    acc.reserve(expectedSize);

    Command cmd(CommandId::TransferFile, ByteBuffer(filename.begin(), filename.end()));

    StreamOptions so;
    so.chunkTimeout = _options.chunkTimeout;
    so.cancel = cancel;

    bool overflow = false;
    IOResult r = _session.stream(cmd, [&](const Message& msg) {
        if (acc.size() + msg.body.size() > expectedSize) {
            overflow = true;
            return StreamControl::Abort;
        }
        acc.insert(acc.end(), msg.body.begin(), msg.body.end());
        if (onProgress) {
            onProgress(acc.size(), expectedSize);
        }
        return acc.size() == expectedSize ? StreamControl::Done : StreamControl::Continue;
    }, so);

    result.bytesTransferred = acc.size();

    if (overflow) {
        HD_LOGE(_log, "download %s overflow at %zu of %zu bytes",
                filename.c_str(), acc.size(), expectedSize);
        result.error = IOResult::failure(IOStatus::TransferFailed,
            "device sent more than " + std::to_string(expectedSize) +
            " bytes (had " + std::to_string(acc.size()) + ")");
        return result;
    }
    if (!r.ok()) {
        HD_LOGW(_log, "download %s failed after %zu of %zu bytes: %s",
                filename.c_str(), acc.size(), expectedSize, io::to_string(r.status));
        result.error = r;
        return result;
    }

    HD_LOGI(_log, "downloaded %s (%zu bytes)", filename.c_str(), acc.size());
    out = std::move(acc);
    return result;
}

TransferResult TransferEngine::upload(CommandId commandId,
                                      const ByteBuffer& data,
                                      const ProgressFn& onProgress,
                                      const std::atomic<bool>* cancel,
                                      io::Millis chunkResponseTimeout)
{
    TransferResult result;
    const std::size_t chunkSize = std::max<std::size_t>(1, _options.uploadChunkSize);
    const std::size_t total = data.size();

    std::size_t offset = 0;
    while (offset < total) {
        if (cancel && cancel->load()) {
            result.error = IOResult::failure(IOStatus::Cancelled, "cancelled by caller");
            return result;
        }

        const std::size_t n = std::min(chunkSize, total - offset);
        const auto first = data.begin() + static_cast<std::ptrdiff_t>(offset);
        Command cmd(commandId, ByteBuffer(first, first + static_cast<std::ptrdiff_t>(n)));
        Message resp;

        IOResult r = _session.send(cmd, resp, chunkResponseTimeout);
        if (!r.ok()) {
            result.error = r;
            return result;
        }
        if (!resp.body.empty() && resp.body[0] != 0) {
            HD_LOGE(_log, "%s rejected chunk at %zu (status %u)",
                    io::protocol::command_name(commandId), offset, (unsigned)resp.body[0]);
            result.error = IOResult::failure(IOStatus::TransferFailed,
                "device rejected chunk at offset " + std::to_string(offset));
            return result;
        }

        offset += n;
        result.bytesTransferred = offset;
        if (onProgress) {
            onProgress(offset, total);
        }
    }

    HD_LOGI(_log, "uploaded %zu bytes via %s", total, io::protocol::command_name(commandId));
    return result;
}

} // namespace hidock::device
