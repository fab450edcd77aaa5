#include "InferenceWorker.hpp"

#include "Logger.hpp"

#include <exception>

namespace lt {

namespace {

constexpr const char* kLogSource = "InferenceWorker";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

// ---------------------------------------------------------------------------
// Protocol helpers
// ---------------------------------------------------------------------------

WorkerCommand WorkerCommand::make_configure(const ModelConfig& config) {
    WorkerCommand cmd;
    cmd.kind = CommandKind::configure;
    cmd.config = config;
    return cmd;
}

WorkerCommand WorkerCommand::make_transcribe(std::vector<float> samples, uint64_t correlation_id) {
    WorkerCommand cmd;
    cmd.kind = CommandKind::transcribe;
    cmd.samples = std::move(samples);
    cmd.correlation_id = correlation_id;
    return cmd;
}

WorkerEvent WorkerEvent::make_progress(const ProgressItem& item) {
    WorkerEvent ev;
    ev.kind = EventKind::progress;
    ev.progress = item;
    return ev;
}

WorkerEvent WorkerEvent::make_ready() {
    WorkerEvent ev;
    ev.kind = EventKind::ready;
    return ev;
}

WorkerEvent WorkerEvent::make_error(ErrorCode code, const std::string& message,
                                    std::optional<uint64_t> correlation_id) {
    WorkerEvent ev;
    ev.kind = EventKind::error;
    ev.code = code;
    ev.message = message;
    ev.correlation_id = correlation_id;
    return ev;
}

WorkerEvent WorkerEvent::make_complete(uint64_t correlation_id, const std::string& text) {
    WorkerEvent ev;
    ev.kind = EventKind::transcription_complete;
    ev.correlation_id = correlation_id;
    ev.text = text;
    return ev;
}

WorkerEvent WorkerEvent::make_terminated(const std::string& message) {
    WorkerEvent ev;
    ev.kind = EventKind::terminated;
    ev.code = ErrorCode::WorkerFailure;
    ev.message = message;
    return ev;
}

const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::progress:               return "progress";
        case EventKind::ready:                  return "ready";
        case EventKind::error:                  return "error";
        case EventKind::transcription_complete: return "transcription_complete";
        case EventKind::terminated:             return "terminated";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ThreadedInferenceWorker::ThreadedInferenceWorker(std::unique_ptr<InferenceEngine> engine,
                                                 EventHandler on_event)
    : state_(std::make_shared<State>()) {
    state_->engine = std::move(engine);
    state_->on_event = std::move(on_event);
    thread_ = std::thread(&ThreadedInferenceWorker::run, state_);
}

ThreadedInferenceWorker::~ThreadedInferenceWorker() {
    terminate();
}

// ---------------------------------------------------------------------------
// post / terminate / is_alive
// ---------------------------------------------------------------------------

void ThreadedInferenceWorker::post(WorkerCommand command) {
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        if (state_->stop.load() || !state_->alive.load()) {
            Logger::instance().warn(kLogSource, "Dropping command posted to a stopped worker");
            return;
        }
        state_->queue.push_back(std::move(command));
    }
    state_->cv.notify_one();
}

void ThreadedInferenceWorker::terminate() {
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->stop.store(true);
        state_->queue.clear();
    }
    if (state_->engine) state_->engine->abort();
    state_->cv.notify_all();

    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

bool ThreadedInferenceWorker::is_alive() const {
    return state_->alive.load() && !state_->stop.load();
}

// ---------------------------------------------------------------------------
// run  (worker thread)
// ---------------------------------------------------------------------------

void ThreadedInferenceWorker::run(std::shared_ptr<State> state) {
    while (true) {
        WorkerCommand command;
        {
            std::unique_lock<std::mutex> lock(state->mu);
            state->cv.wait(lock, [&state] { return state->stop.load() || !state->queue.empty(); });
            if (state->stop.load()) break;
            command = std::move(state->queue.front());
            state->queue.pop_front();
        }

        const bool healthy = command.kind == CommandKind::configure
            ? handle_configure(*state, command)
            : handle_transcribe(*state, command);
        if (!healthy) {
            // Engine state is unknown after this; the worker gives up.
            state->alive.store(false);
            Logger::instance().error(kLogSource, "Engine raised a non-standard exception, worker exiting");
            emit(*state, WorkerEvent::make_terminated("inference engine crashed"));
            return;
        }
    }
    state->alive.store(false);
}

bool ThreadedInferenceWorker::handle_configure(State& state, const WorkerCommand& command) {
    state.configured = false;
    try {
        state.engine->load(command.config, [&state](const ProgressItem& item) {
            emit(state, WorkerEvent::make_progress(item));
        });
    } catch (const std::exception& e) {
        Logger::instance().error(kLogSource, std::string("Model load failed: ") + e.what());
        emit(state, WorkerEvent::make_error(ErrorCode::InferenceFailed, e.what()));
        return true;
    } catch (...) {
        return false;
    }
    state.configured = true;
    emit(state, WorkerEvent::make_ready());
    return true;
}

bool ThreadedInferenceWorker::handle_transcribe(State& state, const WorkerCommand& command) {
    const uint64_t id = command.correlation_id;
    if (!state.configured) {
        emit(state, WorkerEvent::make_error(ErrorCode::ModelNotLoaded, "Pipeline not initialized", id));
        return true;
    }

    std::string text;
    try {
        text = trim(state.engine->transcribe(command.samples));
    } catch (const TranscriptionError& e) {
        emit(state, WorkerEvent::make_error(e.code(), e.what(), id));
        return true;
    } catch (const std::exception& e) {
        emit(state, WorkerEvent::make_error(ErrorCode::InferenceFailed, e.what(), id));
        return true;
    } catch (...) {
        return false;
    }

    if (text.empty()) {
        emit(state, WorkerEvent::make_error(ErrorCode::NoTextProduced, "No text transcribed", id));
        return true;
    }
    emit(state, WorkerEvent::make_complete(id, text));
    return true;
}

void ThreadedInferenceWorker::emit(State& state, const WorkerEvent& event) {
    if (state.stop.load() || !state.on_event) return;
    try {
        state.on_event(event);
    } catch (const std::exception& e) {
        Logger::instance().error(kLogSource, std::string("Event handler threw: ") + e.what());
    }
}

} // namespace lt
