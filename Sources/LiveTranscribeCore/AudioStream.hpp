#pragma once

#include <chrono>
#include <cstddef>

namespace lt {

/// A live, already-open audio source owned by someone else.
/// Samples are delivered as mono float32 at sample_rate().
/// The transcription subsystem only reads; it never closes a stream.
class AudioStream {
public:
    virtual ~AudioStream() = default;

    virtual int sample_rate() const = 0;

    /// False when the stream has no audio track or has been exhausted.
    virtual bool has_audio() const = 0;

    /// Read up to `max_frames` samples into `out`.  Blocks until at least one
    /// sample is available, the stream ends, or `timeout` elapses.
    /// Returns the number of samples written (0 on timeout or end of stream).
    virtual size_t read(float* out, size_t max_frames, std::chrono::milliseconds timeout) = 0;
};

} // namespace lt
