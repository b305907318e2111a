#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace parley {

// Base64 helpers (mbedtls); decode returns false on malformed input
bool base64_decode(const std::string& encoded, std::vector<uint8_t>& out);
std::string base64_encode(const uint8_t* data, size_t length);

// Lowercase hex SHA-256 of a byte buffer
std::string sha256_hex(const uint8_t* data, size_t length);

// Canonical 44-byte WAV header followed by the PCM16 payload
std::vector<uint8_t> make_wav(const std::vector<uint8_t>& pcm16,
                              uint32_t sample_rate, uint8_t channels);

// Whitespace trimming
std::string trim(const std::string& text);
bool is_blank(const std::string& text);

} // namespace parley
