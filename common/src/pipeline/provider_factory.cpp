#include "pipeline/provider_factory.hpp"
#include "pipeline/http_providers.hpp"
#include "esp_log.h"

static const char* TAG = "ProviderFactory";

namespace parley {

ErrorCode build_providers(const ProviderConfig& config,
                          const TurnConfig& turn_config,
                          TaskManager* tasks,
                          ProviderSet& out) {
    if (config.kind == "mock") {
        out.transcription = make_mock_transcription();
        out.ai = make_mock_ai_responder();
        ESP_LOGI(TAG, "Using mock collaborators");
        return ErrorCode::SUCCESS;
    }

    if (config.kind == "http") {
        if (!tasks) {
            ESP_LOGE(TAG, "HTTP collaborators need a task manager");
            return ErrorCode::INIT_FAILED;
        }
        if (config.transcription_url.empty() || config.ai_url.empty()) {
            ESP_LOGE(TAG, "HTTP collaborators need transcription and AI URLs");
            return ErrorCode::INIT_FAILED;
        }

        // The orchestrator enforces the real deadline; the socket timeout only bounds the task
        HttpProviderOptions stt_options;
        stt_options.timeout_ms = turn_config.transcription_timeout_ms + 1000;
        HttpProviderOptions ai_options;
        ai_options.timeout_ms = turn_config.ai_timeout_ms + 1000;

        out.transcription = make_http_transcription(config, *tasks, stt_options);
        out.ai = make_http_ai_responder(config, *tasks, ai_options);
        ESP_LOGI(TAG, "Using HTTP collaborators: stt=%s ai=%s",
                 config.transcription_url.c_str(), config.ai_url.c_str());
        return ErrorCode::SUCCESS;
    }

    ESP_LOGE(TAG, "Unknown provider kind '%s'", config.kind.c_str());
    return ErrorCode::INIT_FAILED;
}

} // namespace parley
