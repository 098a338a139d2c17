#include "hidock/device/file_controller.h"
#include "hidock/crypto/md5.h"
#include "hidock/io/protocol/byte_codec.h"
#include "hidock/io/protocol/command_ids.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <stdexcept>

namespace hidock::device {

using io::IOResult;
using io::IOStatus;
using io::Result;
using io::protocol::ByteBuffer;
using io::protocol::Command;
using io::protocol::CommandId;
using io::protocol::Message;

// ---------- file list parsing ----------

FileListParse parse_file_list(const ByteBuffer& data, bool atStart)
{
    FileListParse out;
    io::bytecodec::Reader r(data);

    if (atStart && data.size() >= 6 && data[0] == 0xFF && data[1] == 0xFF) {
        std::uint32_t total = 0;
        r.skip(2);
        r.read_u32be(total);
        out.total = total;
        out.consumed = r.pos();
    }

    for (;;) {
        std::uint8_t version = 0;
        std::uint32_t nameLen = 0;
        const std::uint8_t* name = nullptr;
        std::uint32_t size = 0;
        const std::uint8_t* sig = nullptr;

        if (!r.read_u8(version) ||
            !r.read_u24be(nameLen) ||
            !r.read_bytes(name, nameLen) ||
            !r.read_u32be(size) ||
            !r.skip(6) ||
            !r.read_bytes(sig, 16)) {
            break;
        }
        out.consumed = r.pos();

        FileEntry e;
        for (std::uint32_t i = 0; i < nameLen; ++i) {
            if (name[i] != 0) {
                e.name.push_back(static_cast<char>(name[i]));
            }
        }
        if (e.name.empty()) {
            continue;
        }
        e.version = version;
        e.length = size;
        e.signature = crypto::to_hex(sig, 16);
        describe_recording(e);
        out.files.push_back(std::move(e));
    }

    return out;
}

static double duration_for(std::uint8_t version, std::uint32_t size)
{
    const double s = static_cast<double>(size);
    const double pcm = size > 44 ? static_cast<double>(size - 44) : 0.0;
    switch (version) {
    case 1: return s / 32.0 / 1000.0;
    case 2: return pcm / 48.0 / 2.0 / 1000.0;
    case 3: return pcm / 48.0 / 2.0 / 2.0 / 1000.0;
    case 5: return s / 12.0 / 1000.0;
    case 6: return s / 16.0 / 1000.0;
    case 7: return s / 10.0 / 1000.0;
    default: return s / 32.0 / 1000.0;
    }
}

static RecordingMode mode_for(const std::string& name)
{
    static const std::regex kSuffix(R"(-(\w+)\d+\.\w+$)");
    std::smatch m;
    if (!std::regex_search(name, m, kSuffix)) {
        return RecordingMode::Room;
    }

    std::string tag = m.str(0);
    std::transform(tag.begin(), tag.end(), tag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (tag.find("WHSP") != std::string::npos || tag.find("WIP") != std::string::npos) {
        return RecordingMode::Whisper;
    }
    if (tag.find("CALL") != std::string::npos) {
        return RecordingMode::Call;
    }
    return RecordingMode::Room;
}

void describe_recording(FileEntry& e)
{
    static const std::regex kNumeric(R"(^(\d{4})(\d{2})(\d{2})(\d{2})(\d{2})(\d{2})REC)");
    static const std::regex kMonthName(R"(^(\d{2,4})([A-Za-z]{3})(\d{2})-(\d{2})(\d{2})(\d{2})-)");

    e.createDate.clear();
    e.createTime.clear();

    std::smatch m;
    if (std::regex_search(e.name, m, kNumeric)) {
        e.createDate = m.str(1) + "/" + m.str(2) + "/" + m.str(3);
        e.createTime = m.str(4) + ":" + m.str(5) + ":" + m.str(6);
    } else if (std::regex_search(e.name, m, kMonthName)) {
        const std::string year = m.str(1);
        if (year.size() == 4 || year.size() == 2) {
            e.createDate = (year.size() == 2 ? "20" + year : year) + "-" + m.str(2) + "-" + m.str(3);
            e.createTime = m.str(4) + ":" + m.str(5) + ":" + m.str(6);
        }
    }

    e.mode = mode_for(e.name);
    e.durationSec = duration_for(e.version, e.length);
}

// ---------- FileController ----------

Result<std::uint32_t> FileController::count()
{
    Command cmd(CommandId::QueryFileCount);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return Result<std::uint32_t>::failure(r);
    }

    io::bytecodec::Reader rd(resp.body);
    std::uint32_t n = 0;
    if (!rd.read_u32be(n)) {
        return Result<std::uint32_t>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "file count body too short"));
    }
    return Result<std::uint32_t>::success(n);
}

Result<std::vector<FileEntry>> FileController::list()
{
    using ListResult = Result<std::vector<FileEntry>>;

    std::optional<std::uint32_t> expected;
    if (_session.capabilities().file_list_needs_count()) {
        auto c = count();
        if (!c.ok()) {
            return ListResult::failure(c.error);
        }
        if (c.value == 0) {
            return ListResult::success({});
        }
        expected = c.value;
    }

    // Only the unparsed tail is kept; complete entries move to `parsed`.
    ByteBuffer pending;
    bool atStart = true;
    FileListParse parsed;
    bool sawFrame = false;

    StreamOptions so;
    so.chunkTimeout = _listOptions.chunkTimeout;
    so.overallTimeout = _listOptions.overallTimeout;

    Command cmd(CommandId::QueryFileList);
    IOResult r = _session.stream(cmd, [&](const Message& msg) {
        sawFrame = true;
        pending.insert(pending.end(), msg.body.begin(), msg.body.end());

        FileListParse step = parse_file_list(pending, atStart);
        if (step.total) {
            parsed.total = step.total;
        }
        parsed.files.insert(parsed.files.end(),
                            std::make_move_iterator(step.files.begin()),
                            std::make_move_iterator(step.files.end()));
        if (step.consumed > 0) {
            atStart = false;
            parsed.consumed += step.consumed;
            pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(step.consumed));
        }

        const auto total = parsed.total ? parsed.total : expected;
        if (!total) {
            return StreamControl::Done;
        }
        return parsed.files.size() >= *total ? StreamControl::Done : StreamControl::Continue;
    }, so);

    if (!r.ok()) {
        if (r.status == IOStatus::CommandTimeout && sawFrame) {
            HD_LOGW(_log, "file list incomplete, returning %zu entries", parsed.files.size());
            return ListResult::success(std::move(parsed.files));
        }
        return ListResult::failure(r);
    }

    HD_LOGD(_log, "listed %zu files", parsed.files.size());
    return ListResult::success(std::move(parsed.files));
}

io::TransferResult FileController::download(const std::string& name,
                                            std::size_t size,
                                            ByteBuffer& out,
                                            const ProgressFn& onProgress,
                                            const std::atomic<bool>* cancel)
{
    return _transfers.download(name, size, out, onProgress, cancel);
}

io::TransferResult FileController::download_verified(const FileEntry& entry,
                                                     ByteBuffer& out,
                                                     const ProgressFn& onProgress,
                                                     const std::atomic<bool>* cancel)
{
    ByteBuffer data;
    io::TransferResult res = _transfers.download(entry.name, entry.length, data, onProgress, cancel);
    if (!res.ok()) {
        return res;
    }

    const bool unsigned_entry = std::all_of(entry.signature.begin(), entry.signature.end(),
                                            [](char c) { return c == '0'; });
    if (!unsigned_entry) {
        std::string actual;
        try {
            actual = crypto::md5_hex(data.data(), data.size());
        } catch (const std::runtime_error& ex) {
            res.error = IOResult::failure(IOStatus::IOError, ex.what());
            return res;
        }
        if (!crypto::hex_equal(actual, entry.signature)) {
            HD_LOGE(_log, "%s checksum mismatch: expected %s got %s",
                    entry.name.c_str(), entry.signature.c_str(), actual.c_str());
            res.error = IOResult::failure(IOStatus::TransferFailed, "checksum mismatch");
            return res;
        }
    }

    out = std::move(data);
    return res;
}

IOResult FileController::remove(const std::string& name)
{
    Command cmd(CommandId::DeleteFile, ByteBuffer(name.begin(), name.end()));
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return r;
    }
    if (!resp.body.empty() && resp.body[0] != 0) {
        HD_LOGW(_log, "delete %s refused (status %u)", name.c_str(), (unsigned)resp.body[0]);
        return IOResult::failure(IOStatus::CommandFailed, "delete failed");
    }
    HD_LOGI(_log, "deleted %s", name.c_str());
    return IOResult::success();
}

Result<std::optional<std::string>> FileController::recording_file()
{
    using RecResult = Result<std::optional<std::string>>;

    Command cmd(CommandId::GetRecordingFile);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return RecResult::failure(r);
    }
    if (resp.body.empty()) {
        return RecResult::success(std::nullopt);
    }
    return RecResult::success(std::string(resp.body.begin(), resp.body.end()));
}

} // namespace hidock::device
