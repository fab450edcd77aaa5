#pragma once

#include "AudioStream.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lt {

/// AudioStream backed by FFmpeg.  Opens either a capture device through
/// libavdevice (format "pulse", "alsa", "avfoundation", ...) or, when
/// `format` is empty, a media file.  Decoded audio is downmixed to mono
/// float32 at the source's native rate.
///
/// Single reader only.  Every read is bounded by its timeout: a stalled
/// device returns 0 frames instead of blocking the caller.
class FfmpegAudioStream : public AudioStream {
public:
    /// Throws TranscriptionError(NoAudioSource) if the input cannot be opened
    /// or carries no audio stream.
    /// @param realtime  Pace reads at playback speed (useful for files).
    FfmpegAudioStream(const std::string& format, const std::string& input, bool realtime = false);
    ~FfmpegAudioStream() override;

    // Non-copyable.
    FfmpegAudioStream(const FfmpegAudioStream&) = delete;
    FfmpegAudioStream& operator=(const FfmpegAudioStream&) = delete;

    int sample_rate() const override;
    bool has_audio() const override;
    size_t read(float* out, size_t max_frames, std::chrono::milliseconds timeout) override;

private:
    /// Read and decode packets until `fifo_` holds at least one sample, the
    /// input is exhausted or `read_deadline_` passes.
    void fill();

    /// AVIOInterruptCB hook; aborts blocking demuxer I/O past `read_deadline_`.
    static int interrupt_cb(void* opaque);

    /// Convert one decoded frame and append it to `fifo_`.
    void append_frame(void* frame);

    void close();

    std::string         input_;
    bool                realtime_ = false;
    bool                eof_ = false;
    int                 sample_rate_ = 0;
    int                 audio_idx_ = -1;
    std::vector<float>  fifo_;
    size_t              fifo_pos_ = 0;

    using TimePoint = std::chrono::steady_clock::time_point;
    TimePoint           started_at_;
    uint64_t            delivered_ = 0;
    TimePoint           read_deadline_ = TimePoint::max();

    // FFmpeg opaque handles, typed as void* to keep FFmpeg headers out of
    // the public interface.
    void* fmt_ctx_ = nullptr;   // AVFormatContext*
    void* dec_ctx_ = nullptr;   // AVCodecContext*
    void* swr_ctx_ = nullptr;   // SwrContext*
    void* packet_  = nullptr;   // AVPacket*
    void* frame_   = nullptr;   // AVFrame*
};

} // namespace lt
