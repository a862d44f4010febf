#include "playback/entry_json.h"

#include "core/error_codes.h"

namespace segue::playback {

namespace {

std::optional<Ticks> readPoint(const nlohmann::json& json, const char* name) {
    if (json.contains(name) && !json[name].is_null()) {
        if (!json[name].is_number_integer()) {
            throw EngineError(ErrorCode::VALIDATION_INVALID_TIMING,
                              std::string("'") + name + "' must be an integer tick count");
        }
        return json[name].get<Ticks>();
    }
    const std::string msName = std::string(name) + "_ms";
    if (json.contains(msName) && !json[msName].is_null()) {
        if (!json[msName].is_number()) {
            throw EngineError(ErrorCode::VALIDATION_INVALID_TIMING,
                              "'" + msName + "' must be a number");
        }
        return timing::secondsToTicks(json[msName].get<double>() / 1000.0);
    }
    return std::nullopt;
}

audio::FadeCurve readCurve(const nlohmann::json& json, const char* name) {
    if (!json.contains(name) || json[name].is_null()) {
        return audio::FadeCurve::Exponential;
    }
    if (!json[name].is_string()) {
        throw EngineError(ErrorCode::VALIDATION_INVALID_TIMING,
                          std::string("'") + name + "' must be a curve name");
    }
    const auto text = json[name].get<std::string>();
    auto curve = audio::parseFadeCurve(text);
    if (!curve) {
        throw EngineError(ErrorCode::VALIDATION_INVALID_TIMING, "Unknown fade curve: " + text);
    }
    return *curve;
}

void writeOptional(nlohmann::json& json, const char* name, const std::optional<Ticks>& value) {
    if (value) {
        json[name] = *value;
    } else {
        json[name] = nullptr;
    }
}

}  // namespace

nlohmann::json timingToJson(const PassageTiming& timing) {
    nlohmann::json json;
    json["start"] = timing.start;
    writeOptional(json, "end", timing.end);
    json["fade_in"] = timing.fadeInPoint;
    json["lead_in"] = timing.leadInPoint;
    writeOptional(json, "fade_out", timing.fadeOutPoint);
    writeOptional(json, "lead_out", timing.leadOutPoint);
    json["fade_in_curve"] = audio::fadeCurveToString(timing.fadeInCurve);
    json["fade_out_curve"] = audio::fadeCurveToString(timing.fadeOutCurve);
    return json;
}

PassageTiming timingFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw EngineError(ErrorCode::VALIDATION_INVALID_TIMING, "timing must be an object");
    }
    PassageTiming timing;
    timing.start = readPoint(json, "start").value_or(0);
    timing.end = readPoint(json, "end");
    timing.fadeInPoint = readPoint(json, "fade_in").value_or(timing.start);
    timing.leadInPoint = readPoint(json, "lead_in").value_or(timing.start);
    timing.fadeOutPoint = readPoint(json, "fade_out");
    timing.leadOutPoint = readPoint(json, "lead_out");
    timing.fadeInCurve = readCurve(json, "fade_in_curve");
    timing.fadeOutCurve = readCurve(json, "fade_out_curve");
    return timing;
}

nlohmann::json entryToJson(const QueueEntry& entry) {
    nlohmann::json json;
    json["queue_entry_id"] = entry.queueEntryId;
    if (entry.passageId) {
        json["passage_id"] = *entry.passageId;
    } else {
        json["passage_id"] = nullptr;
    }
    json["file"] = entry.filePath;
    json["play_order"] = entry.playOrder;
    json["timing"] = timingToJson(entry.timing);
    writeOptional(json, "discovered_end", entry.discoveredEnd);
    return json;
}

QueueEntry entryFromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("queue_entry_id") ||
        !json["queue_entry_id"].is_string() || !json.contains("file") ||
        !json["file"].is_string()) {
        throw EngineError(ErrorCode::PERSISTENCE_READ_FAILED,
                          "queue row needs string 'queue_entry_id' and 'file'");
    }
    QueueEntry entry;
    entry.queueEntryId = json["queue_entry_id"].get<std::string>();
    entry.filePath = json["file"].get<std::string>();
    if (json.contains("passage_id") && json["passage_id"].is_string()) {
        entry.passageId = json["passage_id"].get<std::string>();
    }
    if (json.contains("play_order") && json["play_order"].is_number_integer()) {
        entry.playOrder = json["play_order"].get<std::int64_t>();
    }
    if (json.contains("timing")) {
        entry.timing = timingFromJson(json["timing"]);
    }
    entry.discoveredEnd = readPoint(json, "discovered_end");
    return entry;
}

}  // namespace segue::playback
