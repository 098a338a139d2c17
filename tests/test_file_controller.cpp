#include "doctest.h"

#include "mock_transport.h"

#include "hidock/device/device_session.h"
#include "hidock/device/file_controller.h"
#include "hidock/device/transfer_engine.h"

#include <initializer_list>
#include <string>

using namespace hidock;
using namespace hidock::tests;
using device::FileController;
using device::FileEntry;
using device::RecordingMode;

namespace {

void put_u32(ByteBuffer& b, std::uint32_t v)
{
    b.push_back(static_cast<std::uint8_t>(v >> 24));
    b.push_back(static_cast<std::uint8_t>(v >> 16));
    b.push_back(static_cast<std::uint8_t>(v >> 8));
    b.push_back(static_cast<std::uint8_t>(v));
}

ByteBuffer list_header(std::uint32_t total)
{
    ByteBuffer b{0xFF, 0xFF};
    put_u32(b, total);
    return b;
}

ByteBuffer list_entry(std::uint8_t version, const std::string& name, std::uint32_t size,
                      std::uint8_t sigByte = 0xAB)
{
    ByteBuffer b{version,
                 static_cast<std::uint8_t>(name.size() >> 16),
                 static_cast<std::uint8_t>(name.size() >> 8),
                 static_cast<std::uint8_t>(name.size())};
    b.insert(b.end(), name.begin(), name.end());
    put_u32(b, size);
    b.insert(b.end(), 6, 0);
    b.insert(b.end(), 16, sigByte);
    return b;
}

ByteBuffer concat(std::initializer_list<ByteBuffer> parts)
{
    ByteBuffer out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

struct Rig {
    MockTransport          transport;
    device::DeviceSession  session{transport, {}, device::SessionOptions{io::Millis(100), io::Millis(50)}};
    device::TransferEngine transfers{session, device::TransferOptions{io::Millis(100), 512}};
    FileController         files{session, transfers, device::FileListOptions{io::Millis(100), io::Millis(1000)}};

    explicit Rig(std::uint32_t version = 0x00060102)
    {
        transport.infoBody = device_info_body(version, "SN");
        REQUIRE(session.connect().ok());
    }
};

} // namespace

TEST_CASE("parse_file_list: header, entries and derived fields")
{
    const ByteBuffer data = concat({
        list_header(2),
        list_entry(1, "20250102030405REC01.wav", 32000),
        list_entry(2, "2025Jan02-030405-Wip01.hda", 44 + 96000),
    });

    const auto parsed = device::parse_file_list(data);
    REQUIRE(parsed.total.has_value());
    CHECK(*parsed.total == 2);
    CHECK(parsed.consumed == data.size());
    REQUIRE(parsed.files.size() == 2);

    const FileEntry& a = parsed.files[0];
    CHECK(a.name == "20250102030405REC01.wav");
    CHECK(a.createDate == "2025/01/02");
    CHECK(a.createTime == "03:04:05");
    CHECK(a.durationSec == doctest::Approx(1.0));
    CHECK(a.mode == RecordingMode::Room);
    CHECK(a.signature == "abababababababababababababababab");

    const FileEntry& b = parsed.files[1];
    CHECK(b.createDate == "2025-Jan-02");
    CHECK(b.createTime == "03:04:05");
    CHECK(b.mode == RecordingMode::Whisper);
    CHECK(b.durationSec == doctest::Approx(1.0));
}

TEST_CASE("parse_file_list: partial trailing entry is left unconsumed")
{
    const ByteBuffer whole = list_entry(1, "A.wav", 10);
    const ByteBuffer data = concat({whole, ByteBuffer(whole.begin(), whole.begin() + 7)});

    const auto parsed = device::parse_file_list(data);
    CHECK_FALSE(parsed.total.has_value());
    CHECK(parsed.files.size() == 1);
    CHECK(parsed.consumed == whole.size());
}

TEST_CASE("parse_file_list: entries whose name is all zero bytes are skipped")
{
    const ByteBuffer data = concat({
        list_entry(1, std::string(4, '\0'), 10),
        list_entry(1, "B.wav", 10),
    });
    const auto parsed = device::parse_file_list(data);
    REQUIRE(parsed.files.size() == 1);
    CHECK(parsed.files[0].name == "B.wav");
}

TEST_CASE("describe_recording: two-digit year and call mode")
{
    FileEntry e;
    e.name = "25Feb03-101112-Call02.hda";
    e.version = 5;
    e.length = 12000;
    device::describe_recording(e);

    CHECK(e.createDate == "2025-Feb-03");
    CHECK(e.createTime == "10:11:12");
    CHECK(e.mode == RecordingMode::Call);
    CHECK(e.durationSec == doctest::Approx(1.0));
}

TEST_CASE("describe_recording: unknown name keeps empty date")
{
    FileEntry e;
    e.name = "notes.txt";
    e.length = 10;
    e.version = 2;
    device::describe_recording(e);
    CHECK(e.createDate.empty());
    CHECK(e.durationSec == doctest::Approx(0.0));
}

TEST_CASE("FileController: list spread over several frames")
{
    Rig rig;
    const ByteBuffer all = concat({
        list_header(2),
        list_entry(1, "20250102030405REC01.wav", 100),
        list_entry(1, "20250102030406REC02.wav", 200),
    });
    rig.transport.on(CommandId::QueryFileList, [all](const Message& m, MockTransport& t) {
        t.reply(m, ByteBuffer(all.begin(), all.begin() + 20));
        t.reply(m, ByteBuffer(all.begin() + 20, all.end()));
    });

    const auto r = rig.files.list();
    REQUIRE(r.ok());
    REQUIRE(r.value.size() == 2);
    CHECK(r.value[1].length == 200);
    CHECK(rig.transport.sent_with(CommandId::QueryFileCount).empty());
}

TEST_CASE("FileController: list delivered one byte per frame")
{
    Rig rig;
    const ByteBuffer all = concat({
        list_header(3),
        list_entry(1, "20250102030405REC01.wav", 100),
        list_entry(2, "2025Jan02-030405-Wip01.hda", 44 + 96000, 0x01),
        list_entry(1, "20250102030407REC03.wav", 300),
    });
    rig.transport.on(CommandId::QueryFileList, [all](const Message& m, MockTransport& t) {
        for (auto b : all) {
            t.reply(m, ByteBuffer{b});
        }
    });

    const auto r = rig.files.list();
    REQUIRE(r.ok());
    REQUIRE(r.value.size() == 3);
    CHECK(r.value[0].name == "20250102030405REC01.wav");
    CHECK(r.value[1].name == "2025Jan02-030405-Wip01.hda");
    CHECK(r.value[1].signature == "01010101010101010101010101010101");
    CHECK(r.value[2].length == 300);

    const auto whole = device::parse_file_list(all);
    REQUIRE(whole.files.size() == r.value.size());
    for (std::size_t i = 0; i < whole.files.size(); ++i) {
        CHECK(whole.files[i].name == r.value[i].name);
        CHECK(whole.files[i].length == r.value[i].length);
        CHECK(whole.files[i].signature == r.value[i].signature);
    }
}

TEST_CASE("parse_file_list: header is only read at the start of the list")
{
    const ByteBuffer data = list_header(5);
    CHECK(device::parse_file_list(data).total == 5u);

    const auto later = device::parse_file_list(data, false);
    CHECK_FALSE(later.total.has_value());
    CHECK(later.files.empty());
    CHECK(later.consumed == 0);
}

TEST_CASE("FileController: old firmware asks for the count first")
{
    SUBCASE("count of zero skips the list request")
    {
        Rig rig(0x00050010);
        rig.transport.on(CommandId::QueryFileCount, [](const Message& m, MockTransport& t) {
            t.reply(m, {0, 0, 0, 0});
        });

        const auto r = rig.files.list();
        REQUIRE(r.ok());
        CHECK(r.value.empty());
        CHECK(rig.transport.sent_with(CommandId::QueryFileList).empty());
    }

    SUBCASE("count bounds a header-less list")
    {
        Rig rig(0x00050010);
        rig.transport.on(CommandId::QueryFileCount, [](const Message& m, MockTransport& t) {
            t.reply(m, {0, 0, 0, 2});
        });
        rig.transport.on(CommandId::QueryFileList, [](const Message& m, MockTransport& t) {
            t.reply(m, list_entry(1, "A.wav", 1));
            t.reply(m, list_entry(1, "B.wav", 2));
        });

        const auto r = rig.files.list();
        REQUIRE(r.ok());
        CHECK(r.value.size() == 2);
    }
}

TEST_CASE("FileController: timeout mid-list returns what arrived")
{
    Rig rig;
    rig.transport.on(CommandId::QueryFileList, [](const Message& m, MockTransport& t) {
        t.reply(m, concat({list_header(3), list_entry(1, "A.wav", 1)}));
    });

    const auto r = rig.files.list();
    REQUIRE(r.ok());
    CHECK(r.value.size() == 1);
}

TEST_CASE("FileController: list with no reply at all is a timeout")
{
    Rig rig;
    const auto r = rig.files.list();
    CHECK(r.error.status == IOStatus::CommandTimeout);
}

TEST_CASE("FileController: count")
{
    Rig rig;
    rig.transport.on(CommandId::QueryFileCount, [](const Message& m, MockTransport& t) {
        t.reply(m, {0, 0, 1, 2});
    });
    const auto r = rig.files.count();
    REQUIRE(r.ok());
    CHECK(r.value == 258);
}

TEST_CASE("FileController: verified download")
{
    Rig rig;
    rig.transport.on(CommandId::TransferFile, [](const Message& m, MockTransport& t) {
        t.reply(m, {'a', 'b', 'c'});
    });

    FileEntry e;
    e.name = "abc.wav";
    e.length = 3;

    SUBCASE("matching signature")
    {
        e.signature = "900150983CD24FB0D6963F7D28E17F72";
        ByteBuffer out;
        const auto r = rig.files.download_verified(e, out);
        REQUIRE(r.ok());
        CHECK(out == ByteBuffer{'a', 'b', 'c'});
    }

    SUBCASE("mismatching signature")
    {
        e.signature = std::string(31, '1') + "2";
        ByteBuffer out;
        const auto r = rig.files.download_verified(e, out);
        CHECK(r.error.status == IOStatus::TransferFailed);
        CHECK(out.empty());
    }

    SUBCASE("all-zero signature is not checked")
    {
        e.signature = std::string(32, '0');
        ByteBuffer out;
        CHECK(rig.files.download_verified(e, out).ok());
    }
}

TEST_CASE("FileController: delete and recording file")
{
    Rig rig;
    int deleteStatus = 0;
    rig.transport.on(CommandId::DeleteFile, [&deleteStatus](const Message& m, MockTransport& t) {
        t.reply(m, {static_cast<std::uint8_t>(deleteStatus)});
    });

    CHECK(rig.files.remove("A.wav").ok());
    deleteStatus = 1;
    CHECK(rig.files.remove("A.wav").status == IOStatus::CommandFailed);

    std::string recording;
    rig.transport.on(CommandId::GetRecordingFile, [&recording](const Message& m, MockTransport& t) {
        t.reply(m, ByteBuffer(recording.begin(), recording.end()));
    });

    auto idle = rig.files.recording_file();
    REQUIRE(idle.ok());
    CHECK_FALSE(idle.value.has_value());

    recording = "20250101000000REC99.wav";
    auto busy = rig.files.recording_file();
    REQUIRE(busy.ok());
    REQUIRE(busy.value.has_value());
    CHECK(*busy.value == recording);
}
