#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lt {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

enum class ModelStatus {
    unloaded,
    loading,
    loaded,
    error
};

enum class WhisperTask {
    transcribe,
    translate
};

enum class ProgressPhase {
    in_progress,
    done
};

/// Failure taxonomy shared by the manager, the worker and the service.
enum class ErrorCode {
    ModelNotLoaded,
    AlreadyLoadingOrLoaded,
    ModelUnloaded,
    AudioDecodeError,
    NoTextProduced,
    TranscriptionTimeout,
    WorkerFailure,
    NoAudioSource,
    AlreadyRunning,
    InferenceFailed
};

inline const char* status_to_string(ModelStatus s) {
    switch (s) {
        case ModelStatus::unloaded: return "unloaded";
        case ModelStatus::loading:  return "loading";
        case ModelStatus::loaded:   return "loaded";
        case ModelStatus::error:    return "error";
    }
    return "unknown";
}

inline const char* task_to_string(WhisperTask t) {
    switch (t) {
        case WhisperTask::transcribe: return "transcribe";
        case WhisperTask::translate:  return "translate";
    }
    return "unknown";
}

/// Parse a task name; returns std::nullopt for anything unrecognized.
inline std::optional<WhisperTask> task_from_string(const std::string& s) {
    if (s == "transcribe") return WhisperTask::transcribe;
    if (s == "translate")  return WhisperTask::translate;
    return std::nullopt;
}

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::ModelNotLoaded:         return "ModelNotLoaded";
        case ErrorCode::AlreadyLoadingOrLoaded: return "AlreadyLoadingOrLoaded";
        case ErrorCode::ModelUnloaded:          return "ModelUnloaded";
        case ErrorCode::AudioDecodeError:       return "AudioDecodeError";
        case ErrorCode::NoTextProduced:         return "NoTextProduced";
        case ErrorCode::TranscriptionTimeout:   return "TranscriptionTimeout";
        case ErrorCode::WorkerFailure:          return "WorkerFailure";
        case ErrorCode::NoAudioSource:          return "NoAudioSource";
        case ErrorCode::AlreadyRunning:         return "AlreadyRunning";
        case ErrorCode::InferenceFailed:        return "InferenceFailed";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/// Exception carrying one of the ErrorCode values.
class TranscriptionError : public std::runtime_error {
public:
    TranscriptionError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// What the inference engine is asked to load.
struct ModelConfig {
    std::string                 model_identifier;   // e.g. "small.en" or a ggml file path
    std::optional<WhisperTask>  task;
    std::optional<std::string>  language;           // "auto" or absent = detect
    bool                        quantized = false;
};

inline bool operator==(const ModelConfig& a, const ModelConfig& b) {
    return a.model_identifier == b.model_identifier && a.task == b.task &&
           a.language == b.language && a.quantized == b.quantized;
}

/// Load progress for one model asset.
struct ProgressItem {
    std::string     asset_name;
    float           percent = 0.0f;     // 0 – 100
    uint64_t        bytes_loaded = 0;
    uint64_t        bytes_total = 0;
    ProgressPhase   phase = ProgressPhase::in_progress;
};

/// Snapshot of the model manager.  Listeners receive copies.
struct ModelState {
    ModelStatus                 status = ModelStatus::unloaded;
    std::optional<ModelConfig>  config;
    std::vector<ProgressItem>   progress;       // non-empty only while loading
    std::optional<std::string>  error;
};

/// One transcribed segment together with the audio it came from.
struct TranscriptionChunk {
    uint64_t                correlation_id = 0;
    std::vector<uint8_t>    audio_segment;      // encoded segment bytes (WAV)
    std::string             text;
};

/// Delivered to the service's result callback, success or failure.
struct ChunkResult {
    TranscriptionChunk          chunk;
    std::optional<ErrorCode>    error;
    std::string                 error_message;

    bool ok() const { return !error.has_value(); }
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired by the engine while a model asset is being loaded.
using ProgressCallback = std::function<void(const ProgressItem&)>;

/// Fired during recording with current audio level 0.0 – 1.0.
using MeteringCallback = std::function<void(float)>;

/// Fired by the service once per recorded segment.
using ResultCallback = std::function<void(const ChunkResult&)>;

/// Fired by the manager on every state mutation.
using StateListener = std::function<void(const ModelState&)>;

using Clock = std::chrono::steady_clock;

} // namespace lt
