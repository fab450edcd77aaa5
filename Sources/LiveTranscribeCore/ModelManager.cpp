#include "ModelManager.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace lt {

namespace {

constexpr const char* kLogSource = "ModelManager";

void upsert_progress(std::vector<ProgressItem>& items, const ProgressItem& item) {
    auto it = std::find_if(items.begin(), items.end(), [&](const ProgressItem& p) {
        return p.asset_name == item.asset_name;
    });
    if (it != items.end()) {
        *it = item;
    } else {
        items.push_back(item);
    }
}

/// Run a consumer callback, logging whatever std::exception it raises.
template <typename Fn>
void invoke_guarded(const char* what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        Logger::instance().error(kLogSource, std::string(what) + " threw: " + e.what());
    }
}

void settle(const ModelManager::RejectCallback& reject, const TranscriptionError& error) {
    invoke_guarded("Reject callback", [&] { reject(error); });
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ModelManager::ModelManager(WorkerFactory factory, std::chrono::milliseconds timeout)
    : factory_(std::move(factory)), timeout_(timeout) {
    timeout_thread_ = std::thread(&ModelManager::timeout_loop, this);
}

ModelManager::~ModelManager() {
    std::unique_ptr<InferenceWorker> worker;
    {
        std::lock_guard<std::mutex> lock(mu_);
        shutdown_ = true;
        ++generation_;
        worker = std::move(worker_);
    }
    timeout_cv_.notify_all();
    if (timeout_thread_.joinable()) timeout_thread_.join();
    if (worker) worker->terminate();
}

ModelManager& ModelManager::instance() {
    static ModelManager manager(whisper_worker_factory(WhisperEngineOptions()));
    return manager;
}

WorkerFactory ModelManager::whisper_worker_factory(const WhisperEngineOptions& options) {
    return [options](EventHandler on_event) -> std::unique_ptr<InferenceWorker> {
        return std::make_unique<ThreadedInferenceWorker>(
            std::make_unique<WhisperEngine>(options), std::move(on_event));
    };
}

void ModelManager::set_worker_factory(WorkerFactory factory) {
    std::lock_guard<std::mutex> lock(mu_);
    factory_ = std::move(factory);
}

void ModelManager::set_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mu_);
    timeout_ = timeout;
}

// ---------------------------------------------------------------------------
// load / unload
// ---------------------------------------------------------------------------

void ModelManager::load(const ModelConfig& config) {
    std::unique_ptr<InferenceWorker> retired;
    ModelState snapshot;
    {
        std::lock_guard<std::mutex> lock(mu_);

        if (state_.status == ModelStatus::loading || state_.status == ModelStatus::loaded) {
            throw TranscriptionError(ErrorCode::AlreadyLoadingOrLoaded,
                                     std::string("Model is already ") + status_to_string(state_.status));
        }

        ModelState next;
        next.status = ModelStatus::loading;
        next.config = config;

        if (!worker_ || !worker_->is_alive()) {
            retired = std::move(worker_);
            ++generation_;
            worker_ = factory_(make_handler(generation_));
            Logger::instance().debug(kLogSource, "Spawned worker generation " + std::to_string(generation_));
        }

        Logger::instance().info(kLogSource, "Loading model '" + config.model_identifier + "' for " +
                                task_to_string(config.task.value_or(WhisperTask::transcribe)));
        snapshot = set_state_locked(std::move(next));
        worker_->post(WorkerCommand::make_configure(config));
    }

    if (retired) retired->terminate();
    notify(snapshot);
}

void ModelManager::unload() {
    std::unique_ptr<InferenceWorker> retired;
    std::map<uint64_t, Pending> abandoned;
    ModelState snapshot;
    {
        std::lock_guard<std::mutex> lock(mu_);

        if (state_.status == ModelStatus::unloaded) {
            Logger::instance().warn(kLogSource, "unload() called with no model loaded");
            return;
        }

        abandoned.swap(pending_);
        retired = std::move(worker_);
        ++generation_;
        snapshot = set_state_locked(ModelState());
    }

    for (auto& entry : abandoned) {
        settle(entry.second.reject, TranscriptionError(ErrorCode::ModelUnloaded, "Model was unloaded"));
    }
    if (retired) retired->terminate();

    Logger::instance().info(kLogSource, "Model unloaded" +
                            (abandoned.empty() ? std::string() :
                             ", rejected " + std::to_string(abandoned.size()) + " pending"));
    notify(snapshot);
}

// ---------------------------------------------------------------------------
// transcribe
// ---------------------------------------------------------------------------

void ModelManager::transcribe(const std::vector<uint8_t>& audio, uint64_t correlation_id,
                              ResolveCallback resolve, RejectCallback reject) {
    if (!is_ready()) {
        settle(reject, TranscriptionError(ErrorCode::ModelNotLoaded, "Model not loaded"));
        return;
    }

    // 1. Decode locally; a bad segment never reaches the worker.
    std::vector<float> samples;
    try {
        samples = converter_.decode(audio);
    } catch (const TranscriptionError& e) {
        Logger::instance().warn(kLogSource, "Chunk " + std::to_string(correlation_id) + ": " + e.what());
        settle(reject, e);
        return;
    }

    // 2. Register and dispatch.
    {
        std::lock_guard<std::mutex> lock(mu_);

        // The model may have been unloaded while decoding.
        if (state_.status == ModelStatus::loaded && worker_) {
            if (pending_.count(correlation_id)) {
                throw std::invalid_argument("Correlation id " + std::to_string(correlation_id) +
                                            " is already pending");
            }

            Pending entry;
            entry.resolve      = std::move(resolve);
            entry.reject       = std::move(reject);
            entry.submitted_at = Clock::now();
            entry.deadline     = entry.submitted_at + timeout_;
            pending_.emplace(correlation_id, std::move(entry));

            worker_->post(WorkerCommand::make_transcribe(std::move(samples), correlation_id));
            timeout_cv_.notify_all();
            return;
        }
    }

    settle(reject, TranscriptionError(ErrorCode::ModelNotLoaded, "Model not loaded"));
}

std::future<std::string> ModelManager::transcribe(const std::vector<uint8_t>& audio,
                                                  uint64_t correlation_id) {
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future = promise->get_future();

    transcribe(audio, correlation_id,
        [promise](const std::string& text) {
            promise->set_value(text);
        },
        [promise](const TranscriptionError& error) {
            promise->set_exception(std::make_exception_ptr(error));
        });

    return future;
}

// ---------------------------------------------------------------------------
// Worker events
// ---------------------------------------------------------------------------

EventHandler ModelManager::make_handler(uint64_t generation) {
    return [this, generation](const WorkerEvent& event) {
        on_worker_event(generation, event);
    };
}

void ModelManager::on_worker_event(uint64_t generation, const WorkerEvent& event) {
    // Results for a specific transcription.  The generation check and the
    // removal from pending_ happen under one lock so a retired worker can
    // never settle an entry registered after a reload.
    if (event.correlation_id &&
        (event.kind == EventKind::transcription_complete || event.kind == EventKind::error)) {
        std::optional<Pending> entry;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (generation != generation_) {
                Logger::instance().debug(kLogSource, std::string("Ignoring ") + event_kind_to_string(event.kind) +
                                         " from retired worker");
                return;
            }
            entry = take_pending_locked(*event.correlation_id);
        }
        if (!entry) return;

        if (event.kind == EventKind::transcription_complete) {
            invoke_guarded("Resolve callback", [&] { entry->resolve(event.text); });
        } else {
            settle(entry->reject, TranscriptionError(event.code, event.message));
        }
        return;
    }

    ModelState snapshot;
    std::map<uint64_t, Pending> abandoned;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (generation != generation_) {
            Logger::instance().debug(kLogSource, std::string("Ignoring ") + event_kind_to_string(event.kind) +
                                     " from retired worker");
            return;
        }

        ModelState next = state_;
        switch (event.kind) {
            case EventKind::progress:
                if (state_.status != ModelStatus::loading) return;
                upsert_progress(next.progress, event.progress);
                break;

            case EventKind::ready:
                if (state_.status != ModelStatus::loading) return;
                next.status = ModelStatus::loaded;
                next.progress.clear();
                Logger::instance().info(kLogSource, "Model ready");
                break;

            case EventKind::error:
                if (state_.status != ModelStatus::loading) {
                    Logger::instance().warn(kLogSource, "Worker error outside of loading: " + event.message);
                    return;
                }
                next.status = ModelStatus::error;
                next.progress.clear();
                next.error = event.message;
                Logger::instance().error(kLogSource, "Model load failed: " + event.message);
                break;

            case EventKind::terminated:
                next.status = ModelStatus::error;
                next.progress.clear();
                next.error = "Worker error: " + event.message;
                abandoned.swap(pending_);
                Logger::instance().error(kLogSource, *next.error);
                break;

            case EventKind::transcription_complete:
                Logger::instance().warn(kLogSource, "Result without correlation id dropped");
                return;
        }
        snapshot = set_state_locked(std::move(next));
    }

    for (auto& entry : abandoned) {
        settle(entry.second.reject, TranscriptionError(ErrorCode::WorkerFailure, "Worker error: " + event.message));
    }
    notify(snapshot);
}

std::optional<ModelManager::Pending> ModelManager::take_pending_locked(uint64_t id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        Logger::instance().warn(kLogSource, "Dropping result for unknown transcription id " + std::to_string(id));
        return std::nullopt;
    }
    Pending entry = std::move(it->second);
    pending_.erase(it);
    return entry;
}

// ---------------------------------------------------------------------------
// Timeouts
// ---------------------------------------------------------------------------

void ModelManager::timeout_loop() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!shutdown_) {
        if (pending_.empty()) {
            timeout_cv_.wait(lock);
            continue;
        }

        auto earliest = Clock::time_point::max();
        for (const auto& entry : pending_) {
            earliest = std::min(earliest, entry.second.deadline);
        }

        auto now = Clock::now();
        if (now < earliest) {
            timeout_cv_.wait_until(lock, earliest);
            continue;
        }

        std::vector<std::pair<uint64_t, Pending>> expired;
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }

        lock.unlock();
        for (auto& entry : expired) {
            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                now - entry.second.submitted_at);
            Logger::instance().warn(kLogSource, "Transcription " + std::to_string(entry.first) +
                                    " timed out after " + std::to_string(waited.count()) + " ms");
            settle(entry.second.reject, TranscriptionError(ErrorCode::TranscriptionTimeout, "Transcription timeout"));
        }
        lock.lock();
    }
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

ModelState ModelManager::set_state_locked(ModelState next) {
    if (next.status != state_.status) {
        Logger::instance().info(kLogSource, std::string("State: ") + status_to_string(state_.status) +
                                " -> " + status_to_string(next.status));
    }
    state_ = std::move(next);
    settled_cv_.notify_all();
    return state_;
}

void ModelManager::notify(const ModelState& snapshot) {
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& entry : listeners_) listeners.push_back(entry.second);
    }
    for (const auto& listener : listeners) {
        invoke_guarded("State listener", [&] { listener(snapshot); });
    }
}

std::function<void()> ModelManager::subscribe(StateListener listener) {
    std::lock_guard<std::mutex> lock(mu_);
    uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return [this, id]() {
        std::lock_guard<std::mutex> lock(mu_);
        listeners_.erase(id);
    };
}

ModelState ModelManager::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

bool ModelManager::is_ready() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.status == ModelStatus::loaded;
}

bool ModelManager::is_loading() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.status == ModelStatus::loading;
}

bool ModelManager::has_error() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.status == ModelStatus::error;
}

std::optional<std::string> ModelManager::error() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.error;
}

std::optional<ModelConfig> ModelManager::current_config() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.config;
}

size_t ModelManager::pending_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
}

bool ModelManager::wait_until_settled(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    return settled_cv_.wait_for(lock, timeout, [this] {
        return state_.status != ModelStatus::loading;
    });
}

} // namespace lt
