#include "Settings.hpp"

#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace lt {

namespace {

int parse_int(const char* flag, const char* value) {
    char* end = nullptr;
    long v = std::strtol(value, &end, 10);
    if (end == value || *end != '\0') {
        throw std::invalid_argument(std::string("invalid integer for ") + flag + ": '" + value + "'");
    }
    return static_cast<int>(v);
}

bool parse_bool(const char* flag, const char* value) {
    if (std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0)  return true;
    if (std::strcmp(value, "false") == 0 || std::strcmp(value, "0") == 0) return false;
    throw std::invalid_argument(std::string("invalid boolean for ") + flag + ": '" + value + "'");
}

} // namespace

// ---------------------------------------------------------------------------
// parse_args
// ---------------------------------------------------------------------------

bool Settings::parse_args(int argc, char** argv) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            return false;
        }
        if (std::strcmp(arg, "--realtime") == 0) {
            realtime = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("missing value for ") + arg);
        }
        const char* value = argv[++i];

        if (std::strcmp(arg, "--model") == 0) {
            model_identifier = value;
        } else if (std::strcmp(arg, "--model-dir") == 0) {
            model_dir = value;
        } else if (std::strcmp(arg, "--task") == 0) {
            task = task_from_string(value);
            if (!task) throw std::invalid_argument(std::string("unknown task '") + value + "'");
        } else if (std::strcmp(arg, "--language") == 0) {
            language = value;
        } else if (std::strcmp(arg, "--quantized") == 0) {
            quantized = parse_bool(arg, value);
        } else if (std::strcmp(arg, "--threads") == 0) {
            n_threads = parse_int(arg, value);
        } else if (std::strcmp(arg, "--gpu") == 0) {
            use_gpu = parse_bool(arg, value);
        } else if (std::strcmp(arg, "--chunk-ms") == 0) {
            chunk_duration_ms = parse_int(arg, value);
        } else if (std::strcmp(arg, "--retention") == 0) {
            transcript_retention = parse_int(arg, value);
        } else if (std::strcmp(arg, "--timeout-ms") == 0) {
            transcription_timeout_ms = parse_int(arg, value);
        } else if (std::strcmp(arg, "--max-pending") == 0) {
            max_pending_chunks = parse_int(arg, value);
        } else if (std::strcmp(arg, "--input-format") == 0) {
            input_format = value;
        } else if (std::strcmp(arg, "--input") == 0) {
            input = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            log_level = level_from_string(value);
        } else {
            throw std::invalid_argument(std::string("unknown option ") + arg);
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------

std::vector<std::string> Settings::validate() {
    std::vector<std::string> adjustments;

    if (chunk_duration_ms < kMinChunkDurationMs) {
        adjustments.push_back("chunk duration raised from " + std::to_string(chunk_duration_ms) +
                              "ms to " + std::to_string(kMinChunkDurationMs) + "ms");
        chunk_duration_ms = kMinChunkDurationMs;
    } else if (chunk_duration_ms > kMaxChunkDurationMs) {
        adjustments.push_back("chunk duration lowered from " + std::to_string(chunk_duration_ms) +
                              "ms to " + std::to_string(kMaxChunkDurationMs) + "ms");
        chunk_duration_ms = kMaxChunkDurationMs;
    }

    if (transcript_retention < 1) {
        adjustments.push_back("transcript retention raised to 1");
        transcript_retention = 1;
    }
    if (transcription_timeout_ms < 1) {
        adjustments.push_back("transcription timeout reset to 80000ms");
        transcription_timeout_ms = 80000;
    }
    if (max_pending_chunks < 0) {
        adjustments.push_back("max pending chunks reset to 0 (unbounded)");
        max_pending_chunks = 0;
    }
    if (n_threads < 1) {
        adjustments.push_back("thread count raised to 1");
        n_threads = 1;
    }

    return adjustments;
}

// ---------------------------------------------------------------------------
// model_config / usage
// ---------------------------------------------------------------------------

ModelConfig Settings::model_config() const {
    ModelConfig config;
    config.model_identifier = model_identifier;
    config.task = task;
    config.language = language;
    config.quantized = quantized;
    return config;
}

const char* Settings::usage() {
    return
        "Usage: livetranscribe [options]\n"
        "  --model <id|path>        whisper model identifier or ggml file (default base.en)\n"
        "  --model-dir <dir>        directory holding ggml-*.bin files (default models)\n"
        "  --task <transcribe|translate>\n"
        "  --language <code|auto>\n"
        "  --quantized <true|false> load the q8_0 variant (default true)\n"
        "  --threads <n>            inference threads (default 4)\n"
        "  --gpu <true|false>       (default true)\n"
        "  --chunk-ms <ms>          segment duration, 5000-60000 (default 15000)\n"
        "  --retention <n>          rolling transcript length (default 20)\n"
        "  --timeout-ms <ms>        per-segment transcription timeout (default 80000)\n"
        "  --max-pending <n>        in-flight segment ceiling, 0 = unbounded (default 8)\n"
        "  --input-format <fmt>     capture device format, e.g. pulse, alsa, avfoundation\n"
        "  --input <name|path>      device name or media file (default \"default\")\n"
        "  --realtime               pace file input at playback speed\n"
        "  --log-level <debug|info|warning|error>\n";
}

} // namespace lt
