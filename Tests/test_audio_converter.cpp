#include "AudioConverter.hpp"
#include "TestSupport.hpp"

#include <cmath>
#include <cstring>

using namespace lt_test;

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

/// 16-bit PCM WAV with every sample set to `value`.
std::vector<uint8_t> make_wav(int sample_rate, int channels, size_t frames, int16_t value) {
    const uint32_t data_size = static_cast<uint32_t>(frames * channels * 2);
    std::vector<uint8_t> out;
    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    put_u32(out, 36 + data_size);
    out.insert(out.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    put_u32(out, 16);
    put_u16(out, 1);                                        // PCM
    put_u16(out, static_cast<uint16_t>(channels));
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate * channels * 2));
    put_u16(out, static_cast<uint16_t>(channels * 2));
    put_u16(out, 16);
    out.insert(out.end(), {'d', 'a', 't', 'a'});
    put_u32(out, data_size);
    for (size_t i = 0; i < frames * static_cast<size_t>(channels); ++i) {
        put_u16(out, static_cast<uint16_t>(value));
    }
    return out;
}

bool decode_fails(const lt::AudioConverter& converter, const std::vector<uint8_t>& bytes) {
    try {
        converter.decode(bytes);
    } catch (const lt::TranscriptionError& e) {
        return e.code() == lt::ErrorCode::AudioDecodeError;
    }
    return false;
}

bool near(size_t actual, size_t expected, size_t tolerance) {
    return actual + tolerance >= expected && actual <= expected + tolerance;
}

}

int main() {
    lt::AudioConverter converter;

    {
        auto pcm = converter.decode(make_wav(16000, 1, 1600, 16384));
        expect_true(pcm.size() == 1600, "16k mono", "expected 1600 samples, got " + std::to_string(pcm.size()));
        expect_true(std::fabs(pcm[800] - 0.5f) < 0.01f, "16k mono", "sample value " + std::to_string(pcm[800]));
        pass("16k mono");
    }

    {
        auto pcm = converter.decode(make_wav(8000, 1, 800, 8192));
        expect_true(near(pcm.size(), 1600, 64), "8k resampled", "expected ~1600 samples, got " +
                    std::to_string(pcm.size()));
        expect_true(std::fabs(pcm[pcm.size() / 2] - 0.25f) < 0.02f, "8k resampled", "mid sample " +
                    std::to_string(pcm[pcm.size() / 2]));
        pass("8k resampled");
    }

    {
        auto pcm = converter.decode(make_wav(16000, 2, 1600, 16384));
        expect_true(pcm.size() == 1600, "Stereo downmix", "expected 1600 samples, got " + std::to_string(pcm.size()));
        pass("Stereo downmix");
    }

    {
        expect_true(decode_fails(converter, {}), "Decode errors", "empty buffer accepted");
        const std::string text = "this segment holds no audio, only a sentence of plain text. ";
        std::vector<uint8_t> garbage;
        while (garbage.size() < 512) garbage.insert(garbage.end(), text.begin(), text.end());
        expect_true(decode_fails(converter, garbage), "Decode errors", "garbage accepted");
        pass("Decode errors");
    }

    {
        auto wav = lt::AudioConverter::encode_wav(sine(8000, 16000), 16000);
        expect_true(wav.size() > 44, "Encode WAV", "output too small");
        expect_true(std::memcmp(wav.data(), "RIFF", 4) == 0, "Encode WAV", "missing RIFF tag");
        expect_true(std::memcmp(wav.data() + 8, "WAVE", 4) == 0, "Encode WAV", "missing WAVE tag");
        auto pcm = converter.decode(wav);
        expect_true(pcm.size() == 8000, "Encode WAV", "decoded " + std::to_string(pcm.size()) + " samples");
        pass("Encode WAV");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
