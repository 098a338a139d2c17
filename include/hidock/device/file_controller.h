#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hidock/core/logging.h"
#include "hidock/device/device_session.h"
#include "hidock/device/device_types.h"
#include "hidock/device/transfer_engine.h"
#include "hidock/io/io_status.h"

namespace hidock::device {

struct FileListOptions {
    io::Millis chunkTimeout{5000};
    io::Millis overallTimeout{30000};
};

// Result of parsing the concatenated file-list bodies seen so far.
struct FileListParse {
    std::vector<FileEntry>       files;
    std::optional<std::uint32_t> total;     // from the FF FF header, if present
    std::size_t                  consumed{0};
};

// Parses as many complete entries as `data` holds. Trailing partial
// entries are left unconsumed. The FF FF header is only recognised when
// `atStart` is set, i.e. `data` begins at the first byte of the list.
FileListParse parse_file_list(const io::protocol::ByteBuffer& data, bool atStart = true);

// Fills date, time, mode and duration from the raw name/version/size.
void describe_recording(FileEntry& entry);

class FileController {
public:
    FileController(DeviceSession& session,
                   TransferEngine& transfers,
                   FileListOptions listOptions = {})
        : _session(session)
        , _transfers(transfers)
        , _listOptions(listOptions)
        , _log(session.logger().with_tag("files"))
    {}

    io::Result<std::uint32_t> count();

    io::Result<std::vector<FileEntry>> list();

    io::TransferResult download(const std::string& name,
                                std::size_t size,
                                io::protocol::ByteBuffer& out,
                                const ProgressFn& onProgress = {},
                                const std::atomic<bool>* cancel = nullptr);

    // Downloads and checks the MD5 of the data against entry.signature.
    io::TransferResult download_verified(const FileEntry& entry,
                                         io::protocol::ByteBuffer& out,
                                         const ProgressFn& onProgress = {},
                                         const std::atomic<bool>* cancel = nullptr);

    io::IOResult remove(const std::string& name);

    // Name of the file currently being recorded, nullopt when idle.
    io::Result<std::optional<std::string>> recording_file();

private:
    DeviceSession&  _session;
    TransferEngine& _transfers;
    FileListOptions _listOptions;
    log::Logger     _log;
};

} // namespace hidock::device
