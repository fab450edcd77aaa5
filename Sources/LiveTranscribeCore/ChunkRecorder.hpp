#pragma once

#include "AudioStream.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace lt {

/// Records one fixed-duration segment at a time from a live AudioStream and
/// packages it as a self-contained WAV file in memory.
///
/// The recorder never owns the stream.  Reads are issued in short blocks so
/// that a cancel request is noticed within one block.
class ChunkRecorder {
public:
    ChunkRecorder();
    virtual ~ChunkRecorder();

    // Non-copyable.
    ChunkRecorder(const ChunkRecorder&) = delete;
    ChunkRecorder& operator=(const ChunkRecorder&) = delete;

    /// Record `duration` worth of audio from `stream`.
    ///
    /// Returns the encoded segment, or an empty buffer when `cancel` was
    /// raised before the segment completed.  If the stream ends early the
    /// partial segment is returned.
    /// Throws TranscriptionError(NoAudioSource) when the stream has no audio
    /// or delivers nothing for the whole segment.
    virtual std::vector<uint8_t> record_chunk(AudioStream& stream,
                                              std::chrono::milliseconds duration,
                                              const std::atomic<bool>& cancel);

    /// Called on the recording thread with the RMS level of every block.
    void set_metering_callback(MeteringCallback cb);

    /// Most recent audio level in [0.0, 1.0].  Thread-safe.
    float get_metering() const;

    /// Compute RMS level from a buffer of PCM samples, clamped to [0, 1].
    static float compute_rms(const float* samples, size_t count);

protected:
    void update_level(float level);

private:
    static constexpr int kReadBlockMs = 100;

    // Extra time allowed past the nominal duration before giving up.
    static constexpr int kStallGraceMs = 2000;

    MeteringCallback    meter_cb_;
    std::atomic<float>  current_level_{0.0f};
};

} // namespace lt
