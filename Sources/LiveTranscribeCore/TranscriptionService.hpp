#pragma once

#include "AudioStream.hpp"
#include "ChunkRecorder.hpp"
#include "ModelManager.hpp"
#include "RollingTranscript.hpp"
#include "Settings.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lt {

/// Records a live stream in fixed-duration segments and transcribes them
/// without ever waiting for a result before recording the next one:
///
///   record loop:   [seg 1] [seg 2] [seg 3] ...
///                     |       |       |
///   manager:          +--> transcribe(id) --> result (any order)
///                                               |
///   completion:              drop segment, append text, notify caller
///
/// Each segment's audio is retained until its result arrives.  The rolling
/// transcript is appended in completion order.
class TranscriptionService {
public:
    /// @param recorder  Defaults to a ChunkRecorder when null.
    TranscriptionService(ModelManager& manager, const Settings& settings,
                         std::unique_ptr<ChunkRecorder> recorder = nullptr);
    ~TranscriptionService();

    // Non-copyable.
    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    /// Start recording from `stream`.  `on_result` is called once per
    /// segment, on whichever thread settles it.  Loads the model first if it
    /// is neither loaded nor loading, without waiting for it to become ready.
    /// Throws TranscriptionError(AlreadyRunning) if a session is active.
    void start(std::shared_ptr<AudioStream> stream, ResultCallback on_result);

    /// Stop recording and abandon outstanding results.  Idempotent.
    /// The model stays loaded.
    void stop();

    /// Rolling transcript joined by single spaces.
    std::string get_transcript() const;
    std::vector<std::string> transcript_entries() const;

    bool is_running() const;

    /// Segments recorded but not yet settled.
    size_t pending_count() const;

    float get_metering() const;

private:
    /// Per-session state.  Completion callbacks hold a reference, so results
    /// that arrive after stop() find an inactive session and are dropped.
    struct Session {
        explicit Session(size_t retention) : transcript(retention) {}

        std::mutex                                  mu;
        std::condition_variable                     cv;
        std::map<uint64_t, std::vector<uint8_t>>    segments;
        RollingTranscript                           transcript;
        ResultCallback                              on_result;
        std::shared_ptr<AudioStream>                stream;
        bool                                        active = true;

        std::atomic<bool>                           cancel{false};
        std::atomic<bool>                           running{true};
    };

    /// Background thread entry point.
    void record_loop(std::shared_ptr<Session> session);

    /// Submit a stored segment to the manager.
    void submit(const std::shared_ptr<Session>& session, uint64_t id,
                const std::vector<uint8_t>& segment);

    static void on_settled(const std::shared_ptr<Session>& session, ChunkResult result);

    /// Deliver a failure that has no stored segment.
    static void report_failure(const std::shared_ptr<Session>& session, uint64_t id,
                               ErrorCode code, const std::string& message);

    ModelManager&                   manager_;
    Settings                        settings_;
    std::unique_ptr<ChunkRecorder>  recorder_;

    // Correlation ids are unique across sessions of this service.
    std::atomic<uint64_t>           next_id_{1};

    mutable std::mutex              mu_;
    std::shared_ptr<Session>        session_;
    std::thread                     record_thread_;
};

} // namespace lt
