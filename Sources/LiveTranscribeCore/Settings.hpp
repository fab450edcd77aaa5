#pragma once

#include "Logger.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lt {

/// User-facing configuration for a transcription session.
struct Settings {
    // Model
    std::string                 model_identifier = "base.en";
    std::string                 model_dir = "models";       // where ggml-*.bin files live
    std::optional<WhisperTask>  task;
    std::optional<std::string>  language;                   // "auto" = detect
    bool                        quantized = true;
    int                         n_threads = 4;
    bool                        use_gpu = true;

    // Recording
    int         chunk_duration_ms = 15000;
    int         transcript_retention = 20;      // rolling transcript length
    int         transcription_timeout_ms = 80000;
    int         max_pending_chunks = 8;         // 0 = unbounded

    // Input (CLI only)
    std::string input_format;                   // libavdevice format, empty = file
    std::string input = "default";              // device name or file path
    bool        realtime = false;               // pace file input at 1x

    LogLevel    log_level = LogLevel::info;

    static constexpr int kMinChunkDurationMs = 5000;
    static constexpr int kMaxChunkDurationMs = 60000;

    /// Parse "--flag value" pairs.  Throws std::invalid_argument on unknown
    /// flags, missing values or values that do not parse.
    /// Returns false if --help was requested.
    bool parse_args(int argc, char** argv);

    /// Clamp bounded values into range.  Returns one message per adjustment.
    std::vector<std::string> validate();

    ModelConfig model_config() const;

    static const char* usage();
};

} // namespace lt
