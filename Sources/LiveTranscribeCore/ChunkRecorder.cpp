#include "ChunkRecorder.hpp"

#include "AudioConverter.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>

namespace lt {

namespace {
constexpr const char* kLogSource = "ChunkRecorder";
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ChunkRecorder::ChunkRecorder() = default;
ChunkRecorder::~ChunkRecorder() = default;

// ---------------------------------------------------------------------------
// record_chunk
// ---------------------------------------------------------------------------

std::vector<uint8_t> ChunkRecorder::record_chunk(AudioStream& stream,
                                                 std::chrono::milliseconds duration,
                                                 const std::atomic<bool>& cancel) {
    if (!stream.has_audio()) {
        throw TranscriptionError(ErrorCode::NoAudioSource, "Audio stream has no audio track");
    }

    const int sample_rate = stream.sample_rate();
    if (sample_rate <= 0) {
        throw TranscriptionError(ErrorCode::NoAudioSource, "Audio stream reports no sample rate");
    }

    const size_t target = static_cast<size_t>(
        static_cast<int64_t>(sample_rate) * duration.count() / 1000);
    const size_t block = static_cast<size_t>(sample_rate) * kReadBlockMs / 1000;

    std::vector<float> pcm;
    pcm.reserve(target);
    std::vector<float> buf(std::max<size_t>(block, 1));

    const auto deadline = Clock::now() + duration + std::chrono::milliseconds(kStallGraceMs);

    while (pcm.size() < target) {
        if (cancel.load()) {
            return {};
        }

        size_t want = std::min(buf.size(), target - pcm.size());
        size_t got = stream.read(buf.data(), want, std::chrono::milliseconds(kReadBlockMs));

        if (got > 0) {
            float level = compute_rms(buf.data(), got);
            update_level(level);
            pcm.insert(pcm.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(got));
            continue;
        }

        if (!stream.has_audio()) {
            break;      // end of stream
        }
        if (Clock::now() >= deadline) {
            if (pcm.empty()) {
                throw TranscriptionError(ErrorCode::NoAudioSource,
                                         "Audio stream produced no frames for the whole segment");
            }
            Logger::instance().warn(kLogSource, "Audio stream stalled, closing segment early");
            break;
        }
    }

    if (cancel.load()) {
        return {};
    }
    if (pcm.empty()) {
        throw TranscriptionError(ErrorCode::NoAudioSource, "Audio stream ended before any frames arrived");
    }
    if (pcm.size() < target) {
        Logger::instance().debug(kLogSource, "Stream ended, emitting partial segment of " +
                                 std::to_string(pcm.size()) + " samples");
    }

    return AudioConverter::encode_wav(pcm, sample_rate);
}

// ---------------------------------------------------------------------------
// metering
// ---------------------------------------------------------------------------

void ChunkRecorder::set_metering_callback(MeteringCallback cb) {
    meter_cb_ = std::move(cb);
}

float ChunkRecorder::get_metering() const {
    return current_level_.load();
}

void ChunkRecorder::update_level(float level) {
    current_level_.store(level);
    if (meter_cb_) meter_cb_(level);
}

// ---------------------------------------------------------------------------
// compute_rms
// ---------------------------------------------------------------------------

float ChunkRecorder::compute_rms(const float* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    float rms = static_cast<float>(std::sqrt(sum / static_cast<double>(count)));

    // Clamp to [0, 1].
    return std::min(1.0f, std::max(0.0f, rms));
}

} // namespace lt
