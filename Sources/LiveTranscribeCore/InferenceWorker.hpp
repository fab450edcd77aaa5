#pragma once

#include "InferenceEngine.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lt {

// ---------------------------------------------------------------------------
// Protocol
// ---------------------------------------------------------------------------

enum class CommandKind {
    configure,
    transcribe
};

/// Manager -> worker.  Commands are fire-and-forget.
struct WorkerCommand {
    CommandKind         kind = CommandKind::configure;
    ModelConfig         config;             // configure
    std::vector<float>  samples;            // transcribe, 16 kHz mono
    uint64_t            correlation_id = 0; // transcribe

    static WorkerCommand make_configure(const ModelConfig& config);
    static WorkerCommand make_transcribe(std::vector<float> samples, uint64_t correlation_id);
};

enum class EventKind {
    progress,
    ready,
    error,
    transcription_complete,
    terminated              // the worker died and will emit nothing else
};

/// Worker -> manager.
struct WorkerEvent {
    EventKind               kind = EventKind::ready;
    ProgressItem            progress;
    std::string             text;
    std::string             message;
    ErrorCode               code = ErrorCode::InferenceFailed;
    std::optional<uint64_t> correlation_id;     // set on transcribe results

    static WorkerEvent make_progress(const ProgressItem& item);
    static WorkerEvent make_ready();
    static WorkerEvent make_error(ErrorCode code, const std::string& message,
                                  std::optional<uint64_t> correlation_id = std::nullopt);
    static WorkerEvent make_complete(uint64_t correlation_id, const std::string& text);
    static WorkerEvent make_terminated(const std::string& message);
};

const char* event_kind_to_string(EventKind kind);

using EventHandler = std::function<void(const WorkerEvent&)>;

// ---------------------------------------------------------------------------
// InferenceWorker
// ---------------------------------------------------------------------------

/// An isolated execution context that owns one inference engine.
/// Events may be delivered on any thread, including the worker's own.
class InferenceWorker {
public:
    virtual ~InferenceWorker() = default;

    virtual void post(WorkerCommand command) = 0;

    /// Stop the worker.  Queued commands are dropped and no further events
    /// are emitted once this returns.
    virtual void terminate() = 0;

    virtual bool is_alive() const = 0;
};

using WorkerFactory = std::function<std::unique_ptr<InferenceWorker>(EventHandler)>;

// ---------------------------------------------------------------------------
// ThreadedInferenceWorker
// ---------------------------------------------------------------------------

/// Runs an InferenceEngine on a dedicated thread.  Commands are processed
/// strictly in order, one at a time.
class ThreadedInferenceWorker : public InferenceWorker {
public:
    ThreadedInferenceWorker(std::unique_ptr<InferenceEngine> engine, EventHandler on_event);
    ~ThreadedInferenceWorker() override;

    // Non-copyable.
    ThreadedInferenceWorker(const ThreadedInferenceWorker&) = delete;
    ThreadedInferenceWorker& operator=(const ThreadedInferenceWorker&) = delete;

    void post(WorkerCommand command) override;
    void terminate() override;
    bool is_alive() const override;

private:
    /// Everything the worker thread touches.  Shared so a worker that is
    /// terminated from its own thread can detach safely.
    struct State {
        std::unique_ptr<InferenceEngine>    engine;
        EventHandler                        on_event;
        bool                                configured = false;    // worker thread only

        std::deque<WorkerCommand>           queue;
        std::mutex                          mu;
        std::condition_variable             cv;
        std::atomic<bool>                   stop{false};
        std::atomic<bool>                   alive{true};
    };

    /// Background thread entry point.
    static void run(std::shared_ptr<State> state);

    /// Both return false when the engine raised something that is not a
    /// std::exception.
    static bool handle_configure(State& state, const WorkerCommand& command);
    static bool handle_transcribe(State& state, const WorkerCommand& command);

    /// Forward an event unless the worker is being torn down.  Exceptions
    /// from the handler are logged and dropped.
    static void emit(State& state, const WorkerEvent& event);

    std::shared_ptr<State>  state_;
    std::thread             thread_;
};

} // namespace lt
