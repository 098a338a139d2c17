#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hidock::io::bytecodec {

// Bounds-checked big-endian reader over a byte span.
class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size)
        : _begin(data), _p(data), _end(data + size) {}

    explicit Reader(const std::vector<std::uint8_t>& buf)
        : Reader(buf.data(), buf.size()) {}

    bool read_u8(std::uint8_t& out) {
        if (remaining() < 1) return false;
        out = *_p++;
        return true;
    }

    bool read_i8(std::int8_t& out) {
        std::uint8_t v = 0;
        if (!read_u8(v)) return false;
        out = static_cast<std::int8_t>(v);
        return true;
    }

    bool read_u16be(std::uint16_t& out) {
        if (remaining() < 2) return false;
        out = static_cast<std::uint16_t>((_p[0] << 8) | _p[1]);
        _p += 2;
        return true;
    }

    bool read_u24be(std::uint32_t& out) {
        if (remaining() < 3) return false;
        out = ((std::uint32_t)_p[0] << 16)
            | ((std::uint32_t)_p[1] << 8)
            | (std::uint32_t)_p[2];
        _p += 3;
        return true;
    }

    bool read_u32be(std::uint32_t& out) {
        if (remaining() < 4) return false;
        out = ((std::uint32_t)_p[0] << 24)
            | ((std::uint32_t)_p[1] << 16)
            | ((std::uint32_t)_p[2] << 8)
            | (std::uint32_t)_p[3];
        _p += 4;
        return true;
    }

    bool read_bytes(const std::uint8_t*& ptr, std::size_t n) {
        if (remaining() < n) return false;
        ptr = _p;
        _p += n;
        return true;
    }

    bool read_sv(std::string_view& out, std::size_t n) {
        const std::uint8_t* ptr = nullptr;
        if (!read_bytes(ptr, n)) return false;
        out = std::string_view(reinterpret_cast<const char*>(ptr), n);
        return true;
    }

    // Read u16-length-prefixed string into a view (no allocation).
    bool read_lp_u16_string(std::string_view& out) {
        std::uint16_t n = 0;
        if (!read_u16be(n)) return false;
        return read_sv(out, n);
    }

    bool skip(std::size_t n) {
        if (remaining() < n) return false;
        _p += n;
        return true;
    }

    std::size_t remaining() const { return (std::size_t)(_end - _p); }
    std::size_t pos() const { return (std::size_t)(_p - _begin); }

private:
    const std::uint8_t* _begin{};
    const std::uint8_t* _p{};
    const std::uint8_t* _end{};
};

// -----------------------------
// Writer helpers
// (works with std::string and std::vector<uint8_t>)
// -----------------------------
namespace detail {
inline void push_byte(std::string& out, std::uint8_t b) {
    out.push_back(static_cast<char>(b));
}
inline void push_byte(std::vector<std::uint8_t>& out, std::uint8_t b) {
    out.push_back(b);
}
} // namespace detail

template <typename Buf>
inline void write_u8(Buf& out, std::uint8_t v) {
    detail::push_byte(out, v);
}

template <typename Buf>
inline void write_u16be(Buf& out, std::uint16_t v) {
    detail::push_byte(out, (std::uint8_t)((v >> 8) & 0xFF));
    detail::push_byte(out, (std::uint8_t)(v & 0xFF));
}

template <typename Buf>
inline void write_u24be(Buf& out, std::uint32_t v) {
    detail::push_byte(out, (std::uint8_t)((v >> 16) & 0xFF));
    detail::push_byte(out, (std::uint8_t)((v >> 8) & 0xFF));
    detail::push_byte(out, (std::uint8_t)(v & 0xFF));
}

template <typename Buf>
inline void write_u32be(Buf& out, std::uint32_t v) {
    detail::push_byte(out, (std::uint8_t)((v >> 24) & 0xFF));
    detail::push_byte(out, (std::uint8_t)((v >> 16) & 0xFF));
    detail::push_byte(out, (std::uint8_t)((v >> 8) & 0xFF));
    detail::push_byte(out, (std::uint8_t)(v & 0xFF));
}

template <typename Buf>
inline void write_bytes(Buf& out, const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) detail::push_byte(out, p[i]);
}

template <typename Buf>
inline void write_sv(Buf& out, std::string_view s) {
    write_bytes(out, s.data(), s.size());
}

} // namespace hidock::io::bytecodec
