#include "WhisperEngine.hpp"

#include "Logger.hpp"

#include <cstdio>
#include <filesystem>

#include "whisper.h"

namespace lt {

namespace {

constexpr const char* kLogSource = "WhisperEngine";

/// Streams a model file into whisper_init_with_params and reports how much
/// of it has been consumed.
struct ModelFileReader {
    FILE*                       file = nullptr;
    std::string                 asset_name;
    uint64_t                    total = 0;
    uint64_t                    loaded = 0;
    int                         last_percent = -1;
    const ProgressCallback*     progress = nullptr;
    const std::atomic<bool>*    abort = nullptr;

    void report(ProgressPhase phase) {
        if (!progress || !*progress) return;
        ProgressItem item;
        item.asset_name   = asset_name;
        item.bytes_loaded = loaded;
        item.bytes_total  = total;
        item.percent      = total > 0 ? static_cast<float>(100.0 * loaded / total) : 0.0f;
        item.phase        = phase;
        (*progress)(item);
    }
};

size_t reader_read(void* ctx, void* output, size_t read_size) {
    auto* r = static_cast<ModelFileReader*>(ctx);
    if (r->abort && r->abort->load()) return 0;

    size_t n = fread(output, 1, read_size, r->file);
    r->loaded += n;

    int percent = r->total > 0 ? static_cast<int>(100 * r->loaded / r->total) : 0;
    if (percent != r->last_percent) {
        r->last_percent = percent;
        r->report(ProgressPhase::in_progress);
    }
    return n;
}

bool reader_eof(void* ctx) {
    auto* r = static_cast<ModelFileReader*>(ctx);
    return feof(r->file) != 0;
}

void reader_close(void* /*ctx*/) {
    // The file is closed by load() once whisper has finished with it.
}

bool should_abort(void* user_data) {
    return static_cast<std::atomic<bool>*>(user_data)->load();
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperEngine::WhisperEngine(WhisperEngineOptions options)
    : options_(std::move(options)) {}

WhisperEngine::~WhisperEngine() {
    std::lock_guard<std::mutex> lock(mu_);
    free_context();
}

void WhisperEngine::free_context() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// Model resolution
// ---------------------------------------------------------------------------

std::string WhisperEngine::resolve_model_path(const std::string& model_dir,
                                              const std::string& identifier,
                                              bool quantized) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(identifier, ec)) {
        return identifier;
    }

    std::string name = identifier;
    size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    if (name.rfind("whisper-", 0) == 0) {
        name = name.substr(8);
    }
    if (ends_with(name, "-en")) {
        name = name.substr(0, name.size() - 3) + ".en";
    }

    std::string file = "ggml-" + name + (quantized ? "-q8_0" : "") + ".bin";
    return (std::filesystem::path(model_dir) / file).string();
}

bool WhisperEngine::is_english_only(const std::string& identifier) {
    return ends_with(identifier, ".en") || ends_with(identifier, "-en") ||
           identifier.find(".en.") != std::string::npos ||
           identifier.find(".en-") != std::string::npos;
}

// ---------------------------------------------------------------------------
// load
// ---------------------------------------------------------------------------

void WhisperEngine::load(const ModelConfig& config, const ProgressCallback& progress) {
    std::lock_guard<std::mutex> lock(mu_);

    free_context();
    abort_.store(false);

    const std::string path = resolve_model_path(options_.model_dir,
                                                config.model_identifier,
                                                config.quantized);

    ModelFileReader reader;
    reader.file = fopen(path.c_str(), "rb");
    if (!reader.file) {
        throw TranscriptionError(ErrorCode::InferenceFailed,
                                 "Model file not found: " + path);
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    reader.total      = ec ? 0 : static_cast<uint64_t>(size);
    reader.asset_name = std::filesystem::path(path).filename().string();
    reader.progress   = &progress;
    reader.abort      = &abort_;

    Logger::instance().info(kLogSource, "Loading " + path);

    whisper_model_loader loader;
    loader.context = &reader;
    loader.read    = reader_read;
    loader.eof     = reader_eof;
    loader.close   = reader_close;

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options_.use_gpu;

    ctx_ = whisper_init_with_params(&loader, cparams);
    fclose(reader.file);

    if (!ctx_) {
        if (abort_.load()) {
            throw TranscriptionError(ErrorCode::InferenceFailed, "Model load aborted");
        }
        throw TranscriptionError(ErrorCode::InferenceFailed,
                                 "whisper failed to initialize from " + path);
    }

    reader.loaded = reader.total;
    reader.report(ProgressPhase::done);

    config_ = config;
    Logger::instance().info(kLogSource, std::string("Model ready (") +
                            (whisper_is_multilingual(ctx_) ? "multilingual" : "English-only") + ")");
}

// ---------------------------------------------------------------------------
// is_loaded / abort
// ---------------------------------------------------------------------------

bool WhisperEngine::is_loaded() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ctx_ != nullptr;
}

void WhisperEngine::abort() {
    abort_.store(true);
}

// ---------------------------------------------------------------------------
// transcribe
// ---------------------------------------------------------------------------

std::string WhisperEngine::transcribe(const std::vector<float>& samples) {
    std::lock_guard<std::mutex> lock(mu_);

    if (!ctx_) {
        throw TranscriptionError(ErrorCode::InferenceFailed, "No model loaded");
    }
    if (samples.empty()) {
        return "";
    }

    // Configure whisper parameters
    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_progress   = false;
    params.print_realtime   = false;
    params.print_special    = false;
    params.print_timestamps = false;
    params.single_segment   = false;
    params.n_threads        = options_.n_threads;

    std::string language = "en";
    if (whisper_is_multilingual(ctx_) && !is_english_only(config_.model_identifier)) {
        language = config_.language.value_or("auto");
        params.translate = config_.task == WhisperTask::translate;
    }
    params.language = language.c_str();

    params.abort_callback           = should_abort;
    params.abort_callback_user_data = &abort_;

    // Run inference
    int ret = whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size()));
    if (ret != 0) {
        if (abort_.load()) {
            throw TranscriptionError(ErrorCode::InferenceFailed, "Transcription aborted");
        }
        throw TranscriptionError(ErrorCode::InferenceFailed,
                                 "whisper_full failed with code " + std::to_string(ret));
    }

    // Collect segments
    std::string result;
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        if (text) {
            result += text;
        }
    }
    return trim(result);
}

} // namespace lt
