#pragma once

#include "playback/types.h"

#include <nlohmann/json.hpp>

namespace segue::playback {

// Timing points are written as ticks. Reading also accepts "<point>_ms"
// fields (start_ms, end_ms, fade_in_ms, lead_in_ms, fade_out_ms,
// lead_out_ms); a tick field wins when both are present.
nlohmann::json timingToJson(const PassageTiming& timing);

// Throws EngineError(VALIDATION_INVALID_TIMING) on wrongly typed fields or an
// unknown curve name.
PassageTiming timingFromJson(const nlohmann::json& json);

nlohmann::json entryToJson(const QueueEntry& entry);

// Throws EngineError(VALIDATION_INVALID_TIMING / PERSISTENCE_READ_FAILED).
QueueEntry entryFromJson(const nlohmann::json& json);

}  // namespace segue::playback
