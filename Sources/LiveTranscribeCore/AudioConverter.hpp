#pragma once

#include <cstdint>
#include <vector>

namespace lt {

/// Converts audio between formats using FFmpeg's libavformat / libavcodec /
/// libswresample, entirely in memory.
///
/// decode() turns a recorded segment (any container FFmpeg can probe) into
/// the normalized sample array the inference engine consumes; encode_wav()
/// packages captured samples into the segment format the recorder emits.
class AudioConverter {
public:
    static constexpr int kTargetSampleRate = 16000;

    AudioConverter();
    ~AudioConverter();

    // Non-copyable.
    AudioConverter(const AudioConverter&) = delete;
    AudioConverter& operator=(const AudioConverter&) = delete;

    /// Decode an encoded segment to mono float32 PCM at `target_sample_rate`.
    /// Throws TranscriptionError(AudioDecodeError) if the bytes cannot be
    /// demuxed/decoded or contain no samples.
    std::vector<float> decode(const std::vector<uint8_t>& encoded,
                              int target_sample_rate = kTargetSampleRate) const;

    /// Encode mono float32 samples as a 16-bit PCM WAV file.
    /// Throws std::runtime_error if FFmpeg cannot set up the muxer.
    static std::vector<uint8_t> encode_wav(const std::vector<float>& samples,
                                           int sample_rate);
};

} // namespace lt
