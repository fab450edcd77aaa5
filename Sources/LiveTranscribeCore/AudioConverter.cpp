#include "AudioConverter.hpp"

#include "Types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
}

namespace lt {

namespace {

constexpr int kIoBufferSize = 4096;

// ---------------------------------------------------------------------------
// In-memory AVIO callbacks
// ---------------------------------------------------------------------------

struct MemoryReader {
    const uint8_t*  data;
    size_t          size;
    size_t          pos;
};

int memory_read(void* opaque, uint8_t* buf, int buf_size) {
    auto* r = static_cast<MemoryReader*>(opaque);
    size_t remaining = r->size - r->pos;
    if (remaining == 0) return AVERROR_EOF;

    size_t n = std::min(remaining, static_cast<size_t>(buf_size));
    std::memcpy(buf, r->data + r->pos, n);
    r->pos += n;
    return static_cast<int>(n);
}

int64_t memory_read_seek(void* opaque, int64_t offset, int whence) {
    auto* r = static_cast<MemoryReader*>(opaque);
    if (whence & AVSEEK_SIZE) return static_cast<int64_t>(r->size);

    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(r->pos); break;
        case SEEK_END: base = static_cast<int64_t>(r->size); break;
        default: return -1;
    }
    int64_t target = base + offset;
    if (target < 0 || target > static_cast<int64_t>(r->size)) return -1;
    r->pos = static_cast<size_t>(target);
    return target;
}

struct MemoryWriter {
    std::vector<uint8_t>    data;
    size_t                  pos = 0;
};

// libavformat 61 (FFmpeg 7) made the write buffer const.
#if LIBAVFORMAT_VERSION_MAJOR < 61
int memory_write(void* opaque, uint8_t* buf, int buf_size) {
#else
int memory_write(void* opaque, const uint8_t* buf, int buf_size) {
#endif
    auto* w = static_cast<MemoryWriter*>(opaque);
    size_t end = w->pos + static_cast<size_t>(buf_size);
    if (end > w->data.size()) w->data.resize(end);
    std::memcpy(w->data.data() + w->pos, buf, static_cast<size_t>(buf_size));
    w->pos = end;
    return buf_size;
}

int64_t memory_write_seek(void* opaque, int64_t offset, int whence) {
    auto* w = static_cast<MemoryWriter*>(opaque);
    if (whence & AVSEEK_SIZE) return static_cast<int64_t>(w->data.size());

    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(w->pos); break;
        case SEEK_END: base = static_cast<int64_t>(w->data.size()); break;
        default: return -1;
    }
    int64_t target = base + offset;
    if (target < 0) return -1;
    w->pos = static_cast<size_t>(target);
    return target;
}

// ---------------------------------------------------------------------------
// RAII holders for the decode path
// ---------------------------------------------------------------------------

class IoContext {
public:
    IoContext(void* opaque, bool writable,
              int (*read)(void*, uint8_t*, int),
#if LIBAVFORMAT_VERSION_MAJOR < 61
              int (*write)(void*, uint8_t*, int),
#else
              int (*write)(void*, const uint8_t*, int),
#endif
              int64_t (*seek)(void*, int64_t, int)) {
        auto* buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
        if (!buffer) return;
        ctx_ = avio_alloc_context(buffer, kIoBufferSize, writable ? 1 : 0,
                                  opaque, read, write, seek);
        if (!ctx_) av_free(buffer);
    }
    ~IoContext() {
        if (ctx_) {
            av_freep(&ctx_->buffer);
            avio_context_free(&ctx_);
        }
    }
    AVIOContext* get() const { return ctx_; }

private:
    AVIOContext* ctx_ = nullptr;
};

struct DecodeState {
    AVFormatContext*    fmt_ctx = nullptr;
    AVCodecContext*     dec_ctx = nullptr;
    SwrContext*         swr = nullptr;
    AVPacket*           pkt = nullptr;
    AVFrame*            frame = nullptr;

    ~DecodeState() {
        if (frame)   av_frame_free(&frame);
        if (pkt)     av_packet_free(&pkt);
        if (swr)     swr_free(&swr);
        if (dec_ctx) avcodec_free_context(&dec_ctx);
        if (fmt_ctx) avformat_close_input(&fmt_ctx);
    }
};

[[noreturn]] void fail_decode(const std::string& what, int err = 0) {
    std::string message = "Audio processing error: " + what;
    if (err < 0) {
        char errbuf[256];
        av_strerror(err, errbuf, sizeof(errbuf));
        message += std::string(" (") + errbuf + ")";
    }
    throw TranscriptionError(ErrorCode::AudioDecodeError, message);
}

void convert_frame(SwrContext* swr, AVFrame* frame, int in_rate, int out_rate,
                   std::vector<float>& pcm_out) {
    int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr, in_rate) + frame->nb_samples,
        out_rate, in_rate, AV_ROUND_UP));

    std::vector<float> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    int converted = swr_convert(swr, &out_buf, out_samples,
                                (const uint8_t**)frame->extended_data,
                                frame->nb_samples);
    if (converted > 0) {
        pcm_out.insert(pcm_out.end(), buf.begin(), buf.begin() + converted);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioConverter::AudioConverter() = default;
AudioConverter::~AudioConverter() = default;

// ---------------------------------------------------------------------------
// decode
// ---------------------------------------------------------------------------

std::vector<float> AudioConverter::decode(const std::vector<uint8_t>& encoded,
                                          int target_sample_rate) const {
    if (encoded.empty()) {
        fail_decode("empty audio segment");
    }

    // 1. Open the buffer as an input
    MemoryReader reader{encoded.data(), encoded.size(), 0};
    IoContext io(&reader, false, memory_read, nullptr, memory_read_seek);
    if (!io.get()) fail_decode("failed to allocate I/O context");

    DecodeState st;
    st.fmt_ctx = avformat_alloc_context();
    if (!st.fmt_ctx) fail_decode("failed to allocate format context");
    st.fmt_ctx->pb = io.get();
    st.fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    int ret = avformat_open_input(&st.fmt_ctx, nullptr, nullptr, nullptr);
    if (ret < 0) {
        st.fmt_ctx = nullptr;   // freed by avformat_open_input on failure
        fail_decode("unrecognized container", ret);
    }

    ret = avformat_find_stream_info(st.fmt_ctx, nullptr);
    if (ret < 0) fail_decode("failed to find stream info", ret);

    // 2. Find the audio stream
    int audio_idx = av_find_best_stream(st.fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) fail_decode("no audio stream in segment");

    AVStream* stream = st.fmt_ctx->streams[audio_idx];

    // 3. Open decoder
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) fail_decode("no decoder for audio codec");
    st.dec_ctx = avcodec_alloc_context3(decoder);
    if (!st.dec_ctx) fail_decode("failed to allocate decoder");
    avcodec_parameters_to_context(st.dec_ctx, stream->codecpar);
    ret = avcodec_open2(st.dec_ctx, decoder, nullptr);
    if (ret < 0) fail_decode("failed to open audio decoder", ret);

    // 4. Set up resampler
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    ret = swr_alloc_set_opts2(&st.swr,
        &out_layout, AV_SAMPLE_FMT_FLT, target_sample_rate,
        &st.dec_ctx->ch_layout, st.dec_ctx->sample_fmt, st.dec_ctx->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(st.swr) < 0) fail_decode("failed to initialize audio resampler", ret);

    // 5. Read packets, decode frames, resample
    const int in_rate = st.dec_ctx->sample_rate;
    std::vector<float> pcm_out;
    st.pkt = av_packet_alloc();
    st.frame = av_frame_alloc();
    if (!st.pkt || !st.frame) fail_decode("out of memory");

    while (av_read_frame(st.fmt_ctx, st.pkt) >= 0) {
        if (st.pkt->stream_index != audio_idx) {
            av_packet_unref(st.pkt);
            continue;
        }
        if (avcodec_send_packet(st.dec_ctx, st.pkt) < 0) {
            av_packet_unref(st.pkt);
            continue;   // skip corrupt packet
        }
        while (avcodec_receive_frame(st.dec_ctx, st.frame) == 0) {
            convert_frame(st.swr, st.frame, in_rate, target_sample_rate, pcm_out);
        }
        av_packet_unref(st.pkt);
    }

    // 6. Flush decoder
    avcodec_send_packet(st.dec_ctx, nullptr);
    while (avcodec_receive_frame(st.dec_ctx, st.frame) == 0) {
        convert_frame(st.swr, st.frame, in_rate, target_sample_rate, pcm_out);
    }

    // 7. Flush resampler
    int pending = static_cast<int>(swr_get_delay(st.swr, target_sample_rate));
    if (pending > 0) {
        std::vector<float> buf(static_cast<size_t>(pending));
        uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
        int converted = swr_convert(st.swr, &out_buf, pending, nullptr, 0);
        if (converted > 0) {
            pcm_out.insert(pcm_out.end(), buf.begin(), buf.begin() + converted);
        }
    }

    if (pcm_out.empty()) fail_decode("segment contains no samples");
    return pcm_out;
}

// ---------------------------------------------------------------------------
// encode_wav  (static)
// ---------------------------------------------------------------------------

std::vector<uint8_t> AudioConverter::encode_wav(const std::vector<float>& samples,
                                                int sample_rate) {
    if (sample_rate <= 0) {
        throw std::runtime_error("encode_wav: invalid sample rate");
    }

    MemoryWriter writer;
    IoContext io(&writer, true, nullptr, memory_write, memory_write_seek);
    if (!io.get()) throw std::runtime_error("encode_wav: failed to allocate I/O context");

    AVFormatContext* ofmt_ctx = nullptr;
    int ret = avformat_alloc_output_context2(&ofmt_ctx, nullptr, "wav", nullptr);
    if (ret < 0 || !ofmt_ctx) throw std::runtime_error("encode_wav: wav muxer unavailable");
    ofmt_ctx->pb = io.get();
    ofmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE);
    if (!codec) {
        avformat_free_context(ofmt_ctx);
        throw std::runtime_error("encode_wav: pcm_s16le encoder unavailable");
    }

    AVStream* out_stream = avformat_new_stream(ofmt_ctx, codec);
    AVCodecContext* enc_ctx = avcodec_alloc_context3(codec);
    enc_ctx->sample_rate = sample_rate;
    enc_ctx->ch_layout = (AVChannelLayout)AV_CHANNEL_LAYOUT_MONO;
    enc_ctx->sample_fmt = AV_SAMPLE_FMT_S16;
    enc_ctx->time_base = AVRational{1, sample_rate};

    ret = avcodec_open2(enc_ctx, codec, nullptr);
    if (ret < 0) {
        avcodec_free_context(&enc_ctx);
        avformat_free_context(ofmt_ctx);
        throw std::runtime_error("encode_wav: failed to open encoder");
    }
    avcodec_parameters_from_context(out_stream->codecpar, enc_ctx);
    out_stream->time_base = AVRational{1, sample_rate};

    ret = avformat_write_header(ofmt_ctx, nullptr);
    if (ret < 0) {
        avcodec_free_context(&enc_ctx);
        avformat_free_context(ofmt_ctx);
        throw std::runtime_error("encode_wav: failed to write header");
    }

    AVPacket* pkt = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();

    auto drain = [&]() {
        while (avcodec_receive_packet(enc_ctx, pkt) == 0) {
            pkt->stream_index = 0;
            av_packet_rescale_ts(pkt, enc_ctx->time_base, out_stream->time_base);
            av_interleaved_write_frame(ofmt_ctx, pkt);
        }
    };

    constexpr size_t kFrameSamples = 1024;
    int64_t pts = 0;
    for (size_t offset = 0; offset < samples.size(); offset += kFrameSamples) {
        size_t n = std::min(kFrameSamples, samples.size() - offset);

        frame->nb_samples = static_cast<int>(n);
        frame->format = AV_SAMPLE_FMT_S16;
        frame->ch_layout = (AVChannelLayout)AV_CHANNEL_LAYOUT_MONO;
        frame->sample_rate = sample_rate;
        frame->pts = pts;
        if (av_frame_get_buffer(frame, 0) < 0) break;

        auto* dst = reinterpret_cast<int16_t*>(frame->data[0]);
        for (size_t i = 0; i < n; ++i) {
            float s = std::max(-1.0f, std::min(1.0f, samples[offset + i]));
            dst[i] = static_cast<int16_t>(std::lround(s * 32767.0f));
        }

        avcodec_send_frame(enc_ctx, frame);
        drain();
        av_frame_unref(frame);
        pts += static_cast<int64_t>(n);
    }

    // Flush encoder
    avcodec_send_frame(enc_ctx, nullptr);
    drain();
    av_write_trailer(ofmt_ctx);
    avio_flush(io.get());

    av_frame_free(&frame);
    av_packet_free(&pkt);
    avcodec_free_context(&enc_ctx);
    avformat_free_context(ofmt_ctx);

    return std::move(writer.data);
}

} // namespace lt
