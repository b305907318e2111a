#include "protocol/frame_codec.hpp"
#include "utils/encoding.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cstdint>

static const char* TAG = "FrameCodec";

namespace parley {

namespace {

std::string get_string(const cJSON* object, const char* key) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    return (cJSON_IsString(item) && item->valuestring) ? item->valuestring : std::string();
}

bool decode_audio(const cJSON* payload, FramePayload& out, std::string& error) {
    const cJSON* data = payload;
    if (cJSON_IsObject(payload)) {
        data = cJSON_GetObjectItemCaseSensitive(payload, "data");
        const cJSON* energy = cJSON_GetObjectItemCaseSensitive(payload, "energy");
        if (cJSON_IsNumber(energy)) {
            out.energy = static_cast<float>(energy->valuedouble);
        }
    }

    if (cJSON_IsString(data)) {
        if (!base64_decode(data->valuestring, out.audio)) {
            error = "Audio data is not valid base64";
            return false;
        }
        return true;
    }

    if (cJSON_IsArray(data)) {
        out.audio.reserve(static_cast<size_t>(cJSON_GetArraySize(data)) * 2);
        const cJSON* sample = nullptr;
        cJSON_ArrayForEach(sample, data) {
            if (!cJSON_IsNumber(sample)) {
                error = "Audio samples must be numbers";
                return false;
            }
            int value = sample->valueint;
            if (value < -32768) value = -32768;
            if (value > 32767) value = 32767;
            uint16_t bits = static_cast<uint16_t>(static_cast<int16_t>(value));
            out.audio.push_back(static_cast<uint8_t>(bits & 0xFF));
            out.audio.push_back(static_cast<uint8_t>(bits >> 8));
        }
        return true;
    }

    if (data == nullptr || cJSON_IsNull(data)) {
        return true;
    }

    error = "Audio data has an unsupported encoding";
    return false;
}

void decode_session_start(const cJSON* payload, FramePayload& out) {
    if (!cJSON_IsObject(payload)) return;

    out.language = get_string(payload, "language");
    out.auto_detect = cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(payload, "autoDetect"));

    // Out-of-range values saturate so the validator can reject them
    const cJSON* rate = cJSON_GetObjectItemCaseSensitive(payload, "sampleRate");
    if (cJSON_IsNumber(rate) && rate->valuedouble > 0) {
        out.sample_rate = rate->valuedouble >= static_cast<double>(UINT32_MAX)
                              ? UINT32_MAX
                              : static_cast<uint32_t>(rate->valuedouble);
    }
    const cJSON* channels = cJSON_GetObjectItemCaseSensitive(payload, "channels");
    if (cJSON_IsNumber(channels) && channels->valuedouble > 0) {
        out.channels = channels->valuedouble >= 255.0 ? 255
                                                      : static_cast<uint8_t>(channels->valueint);
    }
}

void decode_metadata(const cJSON* metadata, std::map<std::string, std::string>& out) {
    if (!cJSON_IsObject(metadata)) return;

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, metadata) {
        if (!item->string) continue;
        if (cJSON_IsString(item)) {
            out[item->string] = item->valuestring;
        } else {
            char* printed = cJSON_PrintUnformatted(item);
            if (printed) {
                out[item->string] = printed;
                cJSON_free(printed);
            }
        }
    }
}

cJSON* encode_payload(const ProtocolFrame& frame) {
    const FramePayload& p = frame.payload;
    cJSON* payload = nullptr;

    switch (frame.type) {
        case FrameType::AUDIO_DATA:
            payload = cJSON_CreateObject();
            cJSON_AddStringToObject(payload, "data",
                                    base64_encode(p.audio.data(), p.audio.size()).c_str());
            if (p.energy >= 0.0f) cJSON_AddNumberToObject(payload, "energy", p.energy);
            break;

        case FrameType::SESSION_START:
        case FrameType::SESSION_READY:
            payload = cJSON_CreateObject();
            cJSON_AddStringToObject(payload, "language", p.language.c_str());
            cJSON_AddBoolToObject(payload, "autoDetect", p.auto_detect);
            cJSON_AddNumberToObject(payload, "sampleRate", p.sample_rate);
            cJSON_AddNumberToObject(payload, "channels", p.channels);
            break;

        case FrameType::SESSION_CLOSED:
            payload = cJSON_CreateObject();
            cJSON_AddStringToObject(payload, "reason", p.message.c_str());
            break;

        case FrameType::TRANSCRIPT_PARTIAL:
        case FrameType::TRANSCRIPT_FINAL:
            payload = cJSON_CreateObject();
            cJSON_AddStringToObject(payload, "text", p.text.c_str());
            cJSON_AddNumberToObject(payload, "confidence", p.confidence);
            cJSON_AddBoolToObject(payload, "isFinal", p.is_final);
            cJSON_AddStringToObject(payload, "language", p.language.c_str());
            break;

        case FrameType::ASSISTANT_DELTA:
            payload = cJSON_CreateString(p.text.c_str());
            break;

        case FrameType::ASSISTANT_DONE:
            payload = cJSON_CreateObject();
            cJSON_AddStringToObject(payload, "content", p.text.c_str());
            cJSON_AddStringToObject(payload, "model", p.model.c_str());
            cJSON_AddNumberToObject(payload, "tokensUsed", p.tokens_used);
            cJSON_AddNumberToObject(payload, "processingTimeMs", p.processing_time_ms);
            cJSON_AddStringToObject(payload, "messageId", p.message_id.c_str());
            break;

        case FrameType::VAD_STATE:
            payload = cJSON_CreateObject();
            cJSON_AddStringToObject(payload, "silenceType", p.silence_type.c_str());
            cJSON_AddNumberToObject(payload, "silenceMs", p.silence_ms);
            cJSON_AddNumberToObject(payload, "speechMs", p.speech_ms);
            break;

        case FrameType::ERROR:
            payload = cJSON_CreateObject();
            cJSON_AddStringToObject(payload, "message", p.message.c_str());
            cJSON_AddStringToObject(payload, "code", p.code.c_str());
            if (!p.message_id.empty()) {
                cJSON_AddStringToObject(payload, "messageId", p.message_id.c_str());
            }
            break;

        case FrameType::SESSION_END:
        case FrameType::HEARTBEAT:
        case FrameType::PONG:
        case FrameType::UNKNOWN:
            break;
    }
    return payload;
}

} // namespace

ErrorCode FrameCodec::decode(const std::string& text, ProtocolFrame& out, std::string& error) {
    out = ProtocolFrame();

    cJSON* root = cJSON_ParseWithLength(text.data(), text.size());
    if (!root) {
        error = "Frame is not valid JSON";
        return ErrorCode::INVALID_FRAME;
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        error = "Frame must be a JSON object";
        return ErrorCode::INVALID_FRAME;
    }

    out.type_name = get_string(root, "type");
    out.type = frame_type_from_wire(out.type_name);
    out.session_id = get_string(root, "sessionId");

    const cJSON* timestamp = cJSON_GetObjectItemCaseSensitive(root, "timestamp");
    if (cJSON_IsNumber(timestamp) && timestamp->valuedouble > 0) {
        out.timestamp_ms = static_cast<uint64_t>(timestamp->valuedouble);
    }

    decode_metadata(cJSON_GetObjectItemCaseSensitive(root, "metadata"), out.metadata);

    const cJSON* payload = cJSON_GetObjectItemCaseSensitive(root, "payload");
    out.has_payload = payload != nullptr && !cJSON_IsNull(payload);

    bool ok = true;
    if (out.type == FrameType::AUDIO_DATA) {
        ok = decode_audio(payload, out.payload, error);
        if (ok && cJSON_IsObject(payload)) {
            const cJSON* data = cJSON_GetObjectItemCaseSensitive(payload, "data");
            out.has_payload = data != nullptr && !cJSON_IsNull(data);
        }
    } else if (out.type == FrameType::SESSION_START) {
        decode_session_start(payload, out.payload);
    }

    cJSON_Delete(root);

    if (!ok) {
        ESP_LOGD(TAG, "Rejected %s payload: %s", out.type_name.c_str(), error.c_str());
        return ErrorCode::INVALID_FRAME;
    }
    return ErrorCode::SUCCESS;
}

std::string FrameCodec::encode(const ProtocolFrame& frame) {
    cJSON* root = cJSON_CreateObject();

    const char* type = frame.type == FrameType::UNKNOWN ? frame.type_name.c_str()
                                                        : wire_name(frame.type);
    cJSON_AddStringToObject(root, "type", type);
    cJSON_AddStringToObject(root, "sessionId", frame.session_id.c_str());
    cJSON_AddNumberToObject(root, "timestamp", static_cast<double>(frame.timestamp_ms));

    cJSON* payload = frame.has_payload ? encode_payload(frame) : nullptr;
    if (payload) {
        cJSON_AddItemToObject(root, "payload", payload);
    }

    if (!frame.metadata.empty()) {
        cJSON* metadata = cJSON_AddObjectToObject(root, "metadata");
        for (const auto& entry : frame.metadata) {
            cJSON_AddStringToObject(metadata, entry.first.c_str(), entry.second.c_str());
        }
    }

    char* str = cJSON_PrintUnformatted(root);
    std::string text = str ? str : "";
    cJSON_free(str);
    cJSON_Delete(root);
    return text;
}

} // namespace parley
