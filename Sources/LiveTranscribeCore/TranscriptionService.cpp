#include "TranscriptionService.hpp"

#include "Logger.hpp"

#include <stdexcept>

namespace lt {

namespace {

constexpr const char* kLogSource = "TranscriptionService";

void deliver(const ResultCallback& callback, const ChunkResult& result) {
    if (!callback) return;
    try {
        callback(result);
    } catch (const std::exception& e) {
        Logger::instance().error(kLogSource, "Result callback threw on chunk " +
                                 std::to_string(result.chunk.correlation_id) + ": " + e.what());
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TranscriptionService::TranscriptionService(ModelManager& manager, const Settings& settings,
                                           std::unique_ptr<ChunkRecorder> recorder)
    : manager_(manager), settings_(settings), recorder_(std::move(recorder)) {
    if (!recorder_) {
        recorder_ = std::make_unique<ChunkRecorder>();
    }
}

TranscriptionService::~TranscriptionService() {
    stop();
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

void TranscriptionService::start(std::shared_ptr<AudioStream> stream, ResultCallback on_result) {
    if (!stream) {
        throw TranscriptionError(ErrorCode::NoAudioSource, "No audio stream supplied");
    }

    // Reap a session whose loop halted on its own.
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (session_ && session_->running.load()) {
            throw TranscriptionError(ErrorCode::AlreadyRunning, "Transcription service is already running");
        }
        finished = std::move(record_thread_);
        session_.reset();
    }
    if (finished.joinable()) finished.join();

    // Warm the model up without waiting for it.
    ModelStatus status = manager_.state().status;
    if (status != ModelStatus::loaded && status != ModelStatus::loading) {
        try {
            manager_.load(settings_.model_config());
        } catch (const TranscriptionError& e) {
            if (e.code() != ErrorCode::AlreadyLoadingOrLoaded) throw;
            Logger::instance().debug(kLogSource, "Model load already under way");
        }
    }

    auto session = std::make_shared<Session>(static_cast<size_t>(settings_.transcript_retention));
    session->on_result = std::move(on_result);
    session->stream = std::move(stream);

    std::lock_guard<std::mutex> lock(mu_);
    if (session_ && session_->running.load()) {
        throw TranscriptionError(ErrorCode::AlreadyRunning, "Transcription service is already running");
    }
    session_ = session;
    record_thread_ = std::thread(&TranscriptionService::record_loop, this, session);

    Logger::instance().info(kLogSource, "Started, " + std::to_string(settings_.chunk_duration_ms) +
                            " ms segments");
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------

void TranscriptionService::stop() {
    std::shared_ptr<Session> session;
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(mu_);
        session = std::move(session_);
        thread = std::move(record_thread_);
    }
    if (!session) return;

    session->cancel.store(true);
    session->cv.notify_all();

    if (thread.joinable()) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }

    size_t abandoned = 0;
    {
        std::lock_guard<std::mutex> lock(session->mu);
        abandoned = session->segments.size();
        session->active = false;
        session->segments.clear();
        session->transcript.clear();
        session->on_result = nullptr;
        session->stream.reset();
    }
    session->running.store(false);

    Logger::instance().info(kLogSource, "Stopped" +
                            (abandoned ? ", abandoned " + std::to_string(abandoned) + " pending" : std::string()));
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::string TranscriptionService::get_transcript() const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mu_);
        session = session_;
    }
    if (!session) return "";

    std::lock_guard<std::mutex> lock(session->mu);
    return session->transcript.join();
}

std::vector<std::string> TranscriptionService::transcript_entries() const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mu_);
        session = session_;
    }
    if (!session) return {};

    std::lock_guard<std::mutex> lock(session->mu);
    return session->transcript.entries();
}

bool TranscriptionService::is_running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return session_ && session_->running.load();
}

size_t TranscriptionService::pending_count() const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mu_);
        session = session_;
    }
    if (!session) return 0;

    std::lock_guard<std::mutex> lock(session->mu);
    return session->segments.size();
}

float TranscriptionService::get_metering() const {
    return recorder_->get_metering();
}

// ---------------------------------------------------------------------------
// record_loop  (runs on background thread)
// ---------------------------------------------------------------------------

void TranscriptionService::record_loop(std::shared_ptr<Session> session) {
    std::shared_ptr<AudioStream> stream = session->stream;
    const auto duration = std::chrono::milliseconds(settings_.chunk_duration_ms);
    const size_t max_pending = settings_.max_pending_chunks > 0
                                   ? static_cast<size_t>(settings_.max_pending_chunks) : 0;

    while (!session->cancel.load()) {
        const uint64_t id = next_id_.fetch_add(1);

        // Backpressure: wait for in-flight segments to drain below the cap.
        if (max_pending > 0) {
            std::unique_lock<std::mutex> lock(session->mu);
            if (session->segments.size() >= max_pending) {
                Logger::instance().debug(kLogSource, "Waiting for " + std::to_string(session->segments.size()) +
                                         " pending segments");
            }
            session->cv.wait(lock, [&] {
                return session->cancel.load() || session->segments.size() < max_pending;
            });
        }
        if (session->cancel.load()) break;

        std::vector<uint8_t> segment;
        try {
            segment = recorder_->record_chunk(*stream, duration, session->cancel);
        } catch (const TranscriptionError& e) {
            Logger::instance().error(kLogSource, "Chunk " + std::to_string(id) + ": " + e.what());
            report_failure(session, id, e.code(), e.what());
            if (e.code() == ErrorCode::NoAudioSource) break;
            continue;
        } catch (const std::exception& e) {
            Logger::instance().error(kLogSource, "Chunk " + std::to_string(id) + ": recording failed: " + e.what());
            report_failure(session, id, ErrorCode::NoAudioSource, e.what());
            break;
        }

        if (segment.empty()) break;     // cancelled mid-segment

        {
            std::lock_guard<std::mutex> lock(session->mu);
            if (!session->active) break;
            session->segments[id] = segment;
        }

        Logger::instance().debug(kLogSource, "Chunk " + std::to_string(id) + " recorded, " +
                                 std::to_string(segment.size()) + " bytes");
        submit(session, id, segment);
    }

    session->running.store(false);
    session->cv.notify_all();
    Logger::instance().debug(kLogSource, "Record loop exited");
}

void TranscriptionService::submit(const std::shared_ptr<Session>& session, uint64_t id,
                                  const std::vector<uint8_t>& segment) {
    std::weak_ptr<Session> weak = session;
    try {
        manager_.transcribe(segment, id,
            [weak, id](const std::string& text) {
                auto s = weak.lock();
                if (!s) return;
                ChunkResult result;
                result.chunk.correlation_id = id;
                result.chunk.text = text;
                on_settled(s, std::move(result));
            },
            [weak, id](const TranscriptionError& error) {
                auto s = weak.lock();
                if (!s) return;
                ChunkResult result;
                result.chunk.correlation_id = id;
                result.error = error.code();
                result.error_message = error.what();
                on_settled(s, std::move(result));
            });
    } catch (const std::invalid_argument& e) {
        Logger::instance().error(kLogSource, e.what());
        ChunkResult result;
        result.chunk.correlation_id = id;
        result.error = ErrorCode::InferenceFailed;
        result.error_message = e.what();
        on_settled(session, std::move(result));
    }
}

// ---------------------------------------------------------------------------
// Completion path
// ---------------------------------------------------------------------------

void TranscriptionService::on_settled(const std::shared_ptr<Session>& session, ChunkResult result) {
    ResultCallback callback;
    {
        std::lock_guard<std::mutex> lock(session->mu);
        if (!session->active) return;

        auto it = session->segments.find(result.chunk.correlation_id);
        if (it == session->segments.end()) return;
        result.chunk.audio_segment = std::move(it->second);
        session->segments.erase(it);

        if (result.ok()) {
            session->transcript.append(result.chunk.text);
        }
        callback = session->on_result;
    }
    session->cv.notify_all();

    if (!result.ok()) {
        Logger::instance().warn(kLogSource, "Chunk " + std::to_string(result.chunk.correlation_id) +
                                " failed: " + result.error_message);
    }
    deliver(callback, result);
}

void TranscriptionService::report_failure(const std::shared_ptr<Session>& session, uint64_t id,
                                          ErrorCode code, const std::string& message) {
    ResultCallback callback;
    {
        std::lock_guard<std::mutex> lock(session->mu);
        if (!session->active) return;
        callback = session->on_result;
    }

    ChunkResult result;
    result.chunk.correlation_id = id;
    result.error = code;
    result.error_message = message;
    deliver(callback, result);
}

} // namespace lt
