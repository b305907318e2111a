#pragma once

#include "core/types.hpp"
#include "protocol/protocol_frame.hpp"
#include <string>

namespace parley {

/**
 * JSON text encoding of protocol frames (cJSON).
 *
 * Inbound AUDIO_DATA payloads are accepted as a base64 string, an array of
 * int16 samples, or {"data": base64, "energy": float}.
 */
class FrameCodec {
public:
    // INVALID_FRAME with a readable error on malformed input.
    // Missing or unknown type is left for validation.
    static ErrorCode decode(const std::string& text, ProtocolFrame& out, std::string& error);

    static std::string encode(const ProtocolFrame& frame);
};

} // namespace parley
