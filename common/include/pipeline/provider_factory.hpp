#pragma once

#include "core/task_manager.hpp"
#include "core/types.hpp"
#include "pipeline/providers.hpp"

namespace parley {

struct ProviderSet {
    TranscriptionProvider transcription;
    AIResponder ai;
};

// Selects mock or http collaborators from configuration.
// tasks may be null only for the mock kind.
ErrorCode build_providers(const ProviderConfig& config,
                          const TurnConfig& turn_config,
                          TaskManager* tasks,
                          ProviderSet& out);

} // namespace parley
