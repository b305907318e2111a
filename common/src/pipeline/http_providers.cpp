#include "pipeline/http_providers.hpp"
#include "utils/encoding.hpp"
#include "esp_http_client.h"
#include "esp_log.h"
#include "cJSON.h"
#include <algorithm>
#include <memory>

static const char* TAG = "HttpProviders";

namespace parley {

namespace {

struct HttpRequest {
    std::string url;
    std::string content_type;
    std::string accept;
    std::string api_key;
    const uint8_t* body = nullptr;
    size_t body_length = 0;
    uint32_t timeout_ms = 30000;
    size_t max_response_bytes = 64 * 1024;
};

using ChunkHandler = std::function<void(const char* data, size_t length)>;

// Blocking POST; response bytes are handed to on_chunk as they arrive
esp_err_t http_post(const HttpRequest& request, const ChunkHandler& on_chunk,
                    int& status, std::string& error) {
    esp_http_client_config_t cfg = {};
    cfg.url = request.url.c_str();
    cfg.method = HTTP_METHOD_POST;
    cfg.timeout_ms = static_cast<int>(request.timeout_ms);

    esp_http_client_handle_t client = esp_http_client_init(&cfg);
    if (!client) {
        error = "http client init failed";
        return ESP_ERR_NO_MEM;
    }

    esp_http_client_set_header(client, "Content-Type", request.content_type.c_str());
    if (!request.accept.empty()) {
        esp_http_client_set_header(client, "Accept", request.accept.c_str());
    }
    if (!request.api_key.empty()) {
        std::string auth = "Bearer " + request.api_key;
        esp_http_client_set_header(client, "Authorization", auth.c_str());
    }

    esp_err_t err = esp_http_client_open(client, static_cast<int>(request.body_length));
    if (err != ESP_OK) {
        error = std::string("http open failed: ") + esp_err_to_name(err);
        esp_http_client_cleanup(client);
        return err;
    }

    int written = esp_http_client_write(client, reinterpret_cast<const char*>(request.body),
                                        static_cast<int>(request.body_length));
    if (written < 0 || static_cast<size_t>(written) != request.body_length) {
        error = "http write failed";
        esp_http_client_close(client);
        esp_http_client_cleanup(client);
        return ESP_FAIL;
    }

    esp_http_client_fetch_headers(client);
    status = esp_http_client_get_status_code(client);

    char buf[1024];
    size_t total = 0;
    while (true) {
        int r = esp_http_client_read(client, buf, sizeof(buf));
        if (r < 0) {
            error = "http read failed";
            esp_http_client_close(client);
            esp_http_client_cleanup(client);
            return ESP_FAIL;
        }
        if (r == 0) break;

        total += static_cast<size_t>(r);
        if (total > request.max_response_bytes) {
            error = "response exceeds maximum size";
            esp_http_client_close(client);
            esp_http_client_cleanup(client);
            return ESP_ERR_NO_MEM;
        }
        on_chunk(buf, static_cast<size_t>(r));
    }

    esp_http_client_close(client);
    esp_http_client_cleanup(client);
    return ESP_OK;
}

std::string json_string(const cJSON* object, const char* key) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (cJSON_IsString(item) && item->valuestring) {
        return item->valuestring;
    }
    return std::string();
}

double json_number(const cJSON* object, const char* key, double fallback) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    return cJSON_IsNumber(item) ? item->valuedouble : fallback;
}

// Extract the server's error text from a failed reply
std::string error_from_body(int status, const std::string& body) {
    std::string message = "HTTP status " + std::to_string(status);
    cJSON* root = cJSON_Parse(body.c_str());
    if (root) {
        std::string detail = json_string(root, "error");
        if (detail.empty()) detail = json_string(root, "message");
        if (!detail.empty()) message += ": " + detail;
        cJSON_Delete(root);
    }
    return message;
}

} // namespace

bool parse_transcription_body(const std::string& body, TranscriptionResult& out) {
    cJSON* root = cJSON_Parse(body.c_str());
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        out.success = false;
        out.error_message = "malformed transcription response";
        return false;
    }

    const cJSON* text = cJSON_GetObjectItemCaseSensitive(root, "text");
    if (!cJSON_IsString(text)) {
        cJSON_Delete(root);
        out.success = false;
        out.error_message = "transcription response has no text";
        return false;
    }

    out.success = true;
    out.text = text->valuestring;
    out.confidence = static_cast<float>(json_number(root, "confidence", 0.0));
    out.detected_language = json_string(root, "language");
    out.processing_time_ms = static_cast<uint32_t>(json_number(root, "processingTimeMs", 0));

    cJSON_Delete(root);
    return true;
}

std::string build_ai_request_body(const AIRequest& request) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "sessionId", request.session_id.c_str());
    cJSON_AddStringToObject(root, "text", request.text.c_str());
    cJSON_AddStringToObject(root, "language", request.language.c_str());

    cJSON* context = cJSON_AddArrayToObject(root, "context");
    for (const auto& message : request.context) {
        cJSON* entry = cJSON_CreateObject();
        cJSON_AddStringToObject(entry, "role", to_string(message.role));
        cJSON_AddStringToObject(entry, "content", message.content.c_str());
        cJSON_AddItemToArray(context, entry);
    }

    char* str = cJSON_PrintUnformatted(root);
    std::string body = str ? str : "";
    cJSON_free(str);
    cJSON_Delete(root);
    return body;
}

bool parse_ai_body(const std::string& body, AIResponse& out) {
    cJSON* root = cJSON_Parse(body.c_str());
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        out.success = false;
        out.error_message = "malformed AI response";
        return false;
    }

    const cJSON* content = cJSON_GetObjectItemCaseSensitive(root, "content");
    if (!cJSON_IsString(content)) {
        cJSON_Delete(root);
        out.success = false;
        out.error_message = "AI response has no content";
        return false;
    }

    out.success = true;
    out.content = content->valuestring;
    out.model = json_string(root, "model");
    out.tokens_used = static_cast<uint32_t>(json_number(root, "tokensUsed", 0));

    cJSON_Delete(root);
    return true;
}

bool parse_ai_stream_line(const std::string& line, AIStreamLine& out) {
    out = AIStreamLine();
    if (is_blank(line)) return false;

    cJSON* root = cJSON_Parse(line.c_str());
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        return false;
    }

    const cJSON* delta = cJSON_GetObjectItemCaseSensitive(root, "delta");
    if (cJSON_IsString(delta)) {
        out.is_delta = true;
        out.delta = delta->valuestring;
    }

    if (cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(root, "done"))) {
        out.is_done = true;
        out.model = json_string(root, "model");
        out.tokens_used = static_cast<uint32_t>(json_number(root, "tokensUsed", 0));
    }
    out.error = json_string(root, "error");

    cJSON_Delete(root);
    return out.is_delta || out.is_done || !out.error.empty();
}

TranscriptionProvider make_http_transcription(const ProviderConfig& config,
                                              TaskManager& tasks,
                                              const HttpProviderOptions& options) {
    TranscriptionProvider provider;
    provider.name = "http";

    TaskManager* task_manager = &tasks;
    provider.transcribe = [config, options, task_manager](const TranscriptionRequest& request,
                                                          TranscriptionCallback done) {
        auto wav = std::make_shared<std::vector<uint8_t>>(
            make_wav(request.audio, request.sample_rate, request.channels));
        std::string url = config.transcription_url;
        if (!request.language.empty() && !request.auto_detect) {
            url += (url.find('?') == std::string::npos ? "?" : "&");
            url += "language=" + request.language;
        }

        ErrorCode result = task_manager->spawn("stt", [url, config, options, wav, done]() {
            HttpRequest http;
            http.url = url;
            http.content_type = "audio/wav";
            http.accept = "application/json";
            http.api_key = config.api_key;
            http.body = wav->data();
            http.body_length = wav->size();
            http.timeout_ms = options.timeout_ms;
            http.max_response_bytes = options.max_response_bytes;

            std::string body;
            int status = 0;
            std::string error;
            esp_err_t err = http_post(http, [&body](const char* data, size_t length) {
                body.append(data, length);
            }, status, error);

            TranscriptionResult transcription;
            if (err != ESP_OK) {
                transcription.error_message = error;
            } else if (status != 200) {
                transcription.error_message = error_from_body(status, body);
            } else {
                parse_transcription_body(body, transcription);
            }

            if (!transcription.success) {
                ESP_LOGW(TAG, "Transcription request failed: %s", transcription.error_message.c_str());
            }
            done(transcription);
        }, options.stack_size, options.priority);

        if (result != ErrorCode::SUCCESS) {
            TranscriptionResult failure;
            failure.error_message = std::string("could not start request: ") + to_string(result);
            done(failure);
        }
    };

    return provider;
}

AIResponder make_http_ai_responder(const ProviderConfig& config,
                                   TaskManager& tasks,
                                   const HttpProviderOptions& options) {
    AIResponder responder;
    responder.name = "http";

    TaskManager* task_manager = &tasks;
    responder.generate = [config, options, task_manager](const AIRequest& request,
                                                         AIResponseCallback done) {
        auto body = std::make_shared<std::string>(build_ai_request_body(request));

        ErrorCode result = task_manager->spawn("ai", [config, options, body, done]() {
            HttpRequest http;
            http.url = config.ai_url;
            http.content_type = "application/json";
            http.accept = "application/json";
            http.api_key = config.api_key;
            http.body = reinterpret_cast<const uint8_t*>(body->data());
            http.body_length = body->size();
            http.timeout_ms = options.timeout_ms;
            http.max_response_bytes = options.max_response_bytes;

            std::string reply;
            int status = 0;
            std::string error;
            esp_err_t err = http_post(http, [&reply](const char* data, size_t length) {
                reply.append(data, length);
            }, status, error);

            AIResponse response;
            if (err != ESP_OK) {
                response.error_message = error;
            } else if (status != 200) {
                response.error_message = error_from_body(status, reply);
            } else {
                parse_ai_body(reply, response);
            }
            done(response);
        }, options.stack_size, options.priority);

        if (result != ErrorCode::SUCCESS) {
            AIResponse failure;
            failure.error_message = std::string("could not start request: ") + to_string(result);
            done(failure);
        }
    };

    responder.generate_streaming = [config, options, task_manager](const AIRequest& request,
                                                                   AIDeltaCallback on_delta,
                                                                   AIResponseCallback done) {
        auto body = std::make_shared<std::string>(build_ai_request_body(request));

        ErrorCode result = task_manager->spawn("ai", [config, options, body, on_delta, done]() {
            HttpRequest http;
            http.url = config.ai_url;
            http.content_type = "application/json";
            http.accept = "application/x-ndjson";
            http.api_key = config.api_key;
            http.body = reinterpret_cast<const uint8_t*>(body->data());
            http.body_length = body->size();
            http.timeout_ms = options.timeout_ms;
            http.max_response_bytes = options.max_response_bytes;

            AIStreamAssembler stream(on_delta);
            std::string raw;

            int status = 0;
            std::string error;
            esp_err_t err = http_post(http, [&](const char* data, size_t length) {
                if (raw.size() < 1024) raw.append(data, std::min(length, 1024 - raw.size()));
                if (status == 200) stream.feed(data, length);
            }, status, error);

            AIResponse response;
            if (err != ESP_OK) {
                response.error_message = error;
            } else if (status != 200) {
                response.error_message = error_from_body(status, raw);
            } else {
                stream.finish();
                response = stream.response();
            }
            done(response);
        }, options.stack_size, options.priority);

        if (result != ErrorCode::SUCCESS) {
            AIResponse failure;
            failure.error_message = std::string("could not start request: ") + to_string(result);
            done(failure);
        }
    };

    return responder;
}

AIStreamAssembler::AIStreamAssembler(AIDeltaCallback on_delta)
    : on_delta_(on_delta)
    , finished_(false) {
}

void AIStreamAssembler::feed(const char* data, size_t length) {
    if (finished_ || length == 0) return;

    pending_.append(data, length);
    size_t start = 0;
    size_t pos;
    while (!finished_ && (pos = pending_.find('\n', start)) != std::string::npos) {
        consume_line(pending_.substr(start, pos - start));
        start = pos + 1;
    }
    pending_.erase(0, start);
    if (finished_) pending_.clear();
}

void AIStreamAssembler::finish() {
    if (!finished_ && !pending_.empty()) {
        consume_line(pending_);
    }
    pending_.clear();

    if (!finished_) {
        response_.success = false;
        response_.error_message = "stream ended without completion";
        finished_ = true;
    }
}

void AIStreamAssembler::consume_line(const std::string& line) {
    AIStreamLine parsed;
    if (!parse_ai_stream_line(line, parsed)) return;

    if (!parsed.error.empty()) {
        response_.success = false;
        response_.error_message = parsed.error;
        finished_ = true;
        return;
    }
    if (parsed.is_delta && !parsed.delta.empty()) {
        response_.content += parsed.delta;
        if (on_delta_) on_delta_(parsed.delta);
    }
    if (parsed.is_done) {
        response_.success = true;
        response_.model = parsed.model;
        response_.tokens_used = parsed.tokens_used;
        finished_ = true;
    }
}

} // namespace parley
