#pragma once

#include "AudioConverter.hpp"
#include "InferenceWorker.hpp"
#include "Types.hpp"
#include "WhisperEngine.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lt {

/// Owns the inference worker and the model lifecycle:
///
///   unloaded --load--> loading --ready--> loaded
///                         |                 |
///                         +--error--> error-+--(crash)
///
/// and matches transcription results to callers by correlation id.  Every
/// pending transcription settles exactly once: by result, worker error,
/// timeout, unload or worker failure, whichever happens first.
///
/// Listeners and settlement callbacks are invoked without the manager lock
/// held, on whichever thread caused the change.
class ModelManager {
public:
    using ResolveCallback = std::function<void(const std::string& text)>;
    using RejectCallback  = std::function<void(const TranscriptionError& error)>;

    static constexpr std::chrono::milliseconds kDefaultTimeout{80000};

    explicit ModelManager(WorkerFactory factory,
                          std::chrono::milliseconds timeout = kDefaultTimeout);
    ~ModelManager();

    // Non-copyable.
    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    /// Process-wide manager running whisper.cpp on a worker thread.
    static ModelManager& instance();

    /// Factory producing ThreadedInferenceWorker + WhisperEngine.
    static WorkerFactory whisper_worker_factory(const WhisperEngineOptions& options);

    /// Replace the factory used the next time a worker is spawned.
    void set_worker_factory(WorkerFactory factory);
    void set_timeout(std::chrono::milliseconds timeout);

    // ---- Lifecycle ----

    /// Begin loading.  Returns once the configure command has been posted.
    /// Throws TranscriptionError(AlreadyLoadingOrLoaded) when loading or loaded.
    void load(const ModelConfig& config);

    /// Reject everything pending with ModelUnloaded, stop the worker and
    /// return to unloaded.  No-op when already unloaded.
    void unload();

    // ---- Transcription ----

    /// Decode `audio` and send it to the worker under `correlation_id`.
    /// Exactly one of `resolve` / `reject` is called, possibly before this
    /// returns (ModelNotLoaded, AudioDecodeError).
    /// Throws std::invalid_argument if `correlation_id` is already pending.
    void transcribe(const std::vector<uint8_t>& audio, uint64_t correlation_id,
                    ResolveCallback resolve, RejectCallback reject);

    /// Future-returning form of the above.  The future holds a
    /// TranscriptionError on failure.
    std::future<std::string> transcribe(const std::vector<uint8_t>& audio,
                                        uint64_t correlation_id);

    // ---- State ----

    ModelState state() const;

    /// Listener is called with a snapshot after every state change.
    /// Returns a function that removes it.
    std::function<void()> subscribe(StateListener listener);

    bool is_ready() const;
    bool is_loading() const;
    bool has_error() const;
    std::optional<std::string> error() const;
    std::optional<ModelConfig> current_config() const;
    size_t pending_count() const;

    /// Block until the state is no longer loading.  Returns false on timeout.
    bool wait_until_settled(std::chrono::milliseconds timeout) const;

private:
    struct Pending {
        ResolveCallback     resolve;
        RejectCallback      reject;
        Clock::time_point   submitted_at;
        Clock::time_point   deadline;
    };

    EventHandler make_handler(uint64_t generation);
    void on_worker_event(uint64_t generation, const WorkerEvent& event);

    /// Caller holds mu_.  Remove `id` from the pending map.  Returns
    /// std::nullopt (and logs) if it already settled.
    std::optional<Pending> take_pending_locked(uint64_t id);

    /// Caller holds mu_.  Updates state_, wakes settle waiters and returns
    /// the snapshot to publish.
    ModelState set_state_locked(ModelState next);

    void notify(const ModelState& snapshot);

    /// Timeout thread entry point.
    void timeout_loop();

    WorkerFactory                       factory_;
    std::chrono::milliseconds           timeout_;
    AudioConverter                      converter_;

    mutable std::mutex                  mu_;
    mutable std::condition_variable     settled_cv_;
    ModelState                          state_;
    std::unique_ptr<InferenceWorker>    worker_;
    uint64_t                            generation_ = 0;
    std::map<uint64_t, Pending>         pending_;
    std::map<uint64_t, StateListener>   listeners_;
    uint64_t                            next_listener_id_ = 1;

    std::condition_variable             timeout_cv_;
    bool                                shutdown_ = false;
    std::thread                         timeout_thread_;
};

} // namespace lt
