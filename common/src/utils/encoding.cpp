#include "utils/encoding.hpp"
#include "mbedtls/base64.h"
#include "mbedtls/sha256.h"
#include <cctype>
#include <cstdio>

namespace parley {

bool base64_decode(const std::string& encoded, std::vector<uint8_t>& out) {
    out.clear();
    if (encoded.empty()) return true;

    size_t required = 0;
    const unsigned char* src = reinterpret_cast<const unsigned char*>(encoded.data());
    int ret = mbedtls_base64_decode(nullptr, 0, &required, src, encoded.size());
    if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
        return false;
    }

    out.resize(required);
    size_t written = 0;
    ret = mbedtls_base64_decode(out.data(), out.size(), &written, src, encoded.size());
    if (ret != 0) {
        out.clear();
        return false;
    }
    out.resize(written);
    return true;
}

std::string base64_encode(const uint8_t* data, size_t length) {
    if (!data || length == 0) return std::string();

    size_t required = 0;
    mbedtls_base64_encode(nullptr, 0, &required, data, length);

    std::string out(required, '\0');
    size_t written = 0;
    if (mbedtls_base64_encode(reinterpret_cast<unsigned char*>(&out[0]), out.size(),
                              &written, data, length) != 0) {
        return std::string();
    }
    out.resize(written);
    return out;
}

std::string sha256_hex(const uint8_t* data, size_t length) {
    unsigned char digest[32];
    mbedtls_sha256(data, length, digest, 0);

    char hex[65];
    for (size_t i = 0; i < sizeof(digest); i++) {
        std::snprintf(hex + 2 * i, 3, "%02x", digest[i]);
    }
    return std::string(hex, 64);
}

static void put_le32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

static void put_le16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

std::vector<uint8_t> make_wav(const std::vector<uint8_t>& pcm16,
                              uint32_t sample_rate, uint8_t channels) {
    std::vector<uint8_t> out;
    out.reserve(44 + pcm16.size());

    uint32_t data_size = static_cast<uint32_t>(pcm16.size());
    uint16_t block_align = static_cast<uint16_t>(channels * 2);

    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    put_le32(out, 36 + data_size);
    out.insert(out.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    put_le32(out, 16);
    put_le16(out, 1);  // PCM
    put_le16(out, channels);
    put_le32(out, sample_rate);
    put_le32(out, sample_rate * block_align);
    put_le16(out, block_align);
    put_le16(out, 16);
    out.insert(out.end(), {'d', 'a', 't', 'a'});
    put_le32(out, data_size);
    out.insert(out.end(), pcm16.begin(), pcm16.end());

    return out;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(begin, end - begin);
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace parley
