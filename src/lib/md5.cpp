#include "hidock/crypto/md5.h"

#include <cctype>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace hidock::crypto {

Md5Digest md5(const std::uint8_t* data, std::size_t len)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    Md5Digest out{};
    unsigned int outLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &outLen) != 1 ||
        outLen != out.size()) {
        throw std::runtime_error("md5 digest failed");
    }
    return out;
}

std::string to_hex(const std::uint8_t* data, std::size_t len)
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

std::string md5_hex(const std::uint8_t* data, std::size_t len)
{
    const Md5Digest d = md5(data, len);
    return to_hex(d.data(), d.size());
}

bool hex_equal(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace hidock::crypto
