#pragma once

#include "Types.hpp"

#include <string>
#include <vector>

namespace lt {

/// The speech model behind the worker.  Implementations are driven from a
/// single thread; only abort() may be called concurrently.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    /// Load (or reload) the model described by `config`, reporting progress
    /// per asset.  Throws on failure.
    virtual void load(const ModelConfig& config, const ProgressCallback& progress) = 0;

    /// Run inference on 16 kHz mono float32 samples.  Throws on failure.
    virtual std::string transcribe(const std::vector<float>& samples) = 0;

    virtual bool is_loaded() const = 0;

    /// Ask a running load or transcribe to stop as soon as possible.
    virtual void abort() = 0;
};

} // namespace lt
