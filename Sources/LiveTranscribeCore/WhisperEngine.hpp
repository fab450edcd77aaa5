#pragma once

#include "InferenceEngine.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace lt {

/// Tuning knobs that are not part of a ModelConfig.
struct WhisperEngineOptions {
    std::string model_dir = "models";
    int         n_threads = 4;
    bool        use_gpu = true;
};

/// InferenceEngine backed by whisper.cpp's C API.
/// Loads a ggml model, then transcribes 16 kHz PCM buffers on demand.
class WhisperEngine : public InferenceEngine {
public:
    explicit WhisperEngine(WhisperEngineOptions options = WhisperEngineOptions());
    ~WhisperEngine() override;

    // Non-copyable.
    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    /// Throws TranscriptionError(InferenceFailed) if the model file cannot be
    /// opened or whisper rejects it.
    void load(const ModelConfig& config, const ProgressCallback& progress) override;

    /// Throws TranscriptionError(InferenceFailed) if no model is loaded or
    /// whisper_full fails.
    std::string transcribe(const std::vector<float>& samples) override;

    bool is_loaded() const override;
    void abort() override;

    /// Map a model identifier to the ggml file it names.
    /// "openai/whisper-small-en" -> "<dir>/ggml-small.en.bin",
    /// quantized adds "-q8_0" before the extension.  An identifier that is
    /// already an existing file is returned unchanged.
    static std::string resolve_model_path(const std::string& model_dir,
                                          const std::string& identifier,
                                          bool quantized);

    /// Whether the identifier names an English-only model.
    static bool is_english_only(const std::string& identifier);

private:
    void free_context();

    WhisperEngineOptions        options_;
    ModelConfig                 config_;
    struct whisper_context*     ctx_ = nullptr;   // opaque whisper.h handle
    std::atomic<bool>           abort_{false};
    mutable std::mutex          mu_;
};

} // namespace lt
