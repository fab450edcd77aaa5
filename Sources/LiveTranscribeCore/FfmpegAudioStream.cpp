#include "FfmpegAudioStream.hpp"

#include "Logger.hpp"
#include "Types.hpp"

#include <algorithm>
#include <cstring>
#include <thread>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}

namespace lt {

namespace {

constexpr const char* kLogSource = "FfmpegAudioStream";

// Upper bound on opening and probing the input.
constexpr std::chrono::seconds kOpenTimeout(10);

// Poll interval while a non-blocking device has nothing to hand out.
constexpr std::chrono::milliseconds kPollInterval(5);

std::string av_error_string(int err) {
    char errbuf[256];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

FfmpegAudioStream::FfmpegAudioStream(const std::string& format,
                                     const std::string& input,
                                     bool realtime)
    : input_(input), realtime_(realtime) {
    avdevice_register_all();

    const AVInputFormat* in_fmt = nullptr;
    if (!format.empty()) {
        in_fmt = av_find_input_format(format.c_str());
        if (!in_fmt) {
            throw TranscriptionError(ErrorCode::NoAudioSource,
                                     "Unknown input format '" + format + "'");
        }
    }

    AVFormatContext* fmt_ctx = avformat_alloc_context();
    if (!fmt_ctx) {
        throw TranscriptionError(ErrorCode::NoAudioSource, "Failed to allocate format context");
    }
    fmt_ctx->interrupt_callback.callback = &FfmpegAudioStream::interrupt_cb;
    fmt_ctx->interrupt_callback.opaque   = this;
    if (in_fmt) {
        // Capture devices hand back EAGAIN instead of blocking; fill() polls.
        fmt_ctx->flags |= AVFMT_FLAG_NONBLOCK;
    }

    read_deadline_ = std::chrono::steady_clock::now() + kOpenTimeout;

    // avformat_open_input frees fmt_ctx on failure.
    int ret = avformat_open_input(&fmt_ctx, input_.c_str(), in_fmt, nullptr);
    if (ret < 0) {
        read_deadline_ = TimePoint::max();
        throw TranscriptionError(ErrorCode::NoAudioSource,
                                 "Failed to open input '" + input_ + "': " + av_error_string(ret));
    }
    fmt_ctx_ = fmt_ctx;

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    read_deadline_ = TimePoint::max();
    if (ret < 0) {
        close();
        throw TranscriptionError(ErrorCode::NoAudioSource, "Failed to find stream info for '" + input_ + "'");
    }

    audio_idx_ = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx_ < 0) {
        close();
        throw TranscriptionError(ErrorCode::NoAudioSource, "No audio track in '" + input_ + "'");
    }

    AVStream* stream = fmt_ctx->streams[audio_idx_];
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        close();
        throw TranscriptionError(ErrorCode::NoAudioSource, "No decoder for audio track in '" + input_ + "'");
    }

    AVCodecContext* dec_ctx = avcodec_alloc_context3(decoder);
    dec_ctx_ = dec_ctx;
    avcodec_parameters_to_context(dec_ctx, stream->codecpar);
    ret = avcodec_open2(dec_ctx, decoder, nullptr);
    if (ret < 0) {
        close();
        throw TranscriptionError(ErrorCode::NoAudioSource, "Failed to open audio decoder: " + av_error_string(ret));
    }

    sample_rate_ = dec_ctx->sample_rate;

    // Downmix to mono float32 at the native rate.
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* swr = nullptr;
    ret = swr_alloc_set_opts2(&swr,
        &out_layout, AV_SAMPLE_FMT_FLT, sample_rate_,
        &dec_ctx->ch_layout, dec_ctx->sample_fmt, dec_ctx->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(swr) < 0) {
        if (swr) swr_free(&swr);
        close();
        throw TranscriptionError(ErrorCode::NoAudioSource, "Failed to initialize audio resampler");
    }
    swr_ctx_ = swr;

    packet_ = av_packet_alloc();
    frame_  = av_frame_alloc();

    Logger::instance().info(kLogSource, "Opened '" + input_ + "' at " +
                            std::to_string(sample_rate_) + " Hz" +
                            (realtime_ ? " (paced)" : ""));
}

FfmpegAudioStream::~FfmpegAudioStream() {
    close();
}

void FfmpegAudioStream::close() {
    if (frame_) {
        AVFrame* frame = static_cast<AVFrame*>(frame_);
        av_frame_free(&frame);
        frame_ = nullptr;
    }
    if (packet_) {
        AVPacket* pkt = static_cast<AVPacket*>(packet_);
        av_packet_free(&pkt);
        packet_ = nullptr;
    }
    if (swr_ctx_) {
        SwrContext* swr = static_cast<SwrContext*>(swr_ctx_);
        swr_free(&swr);
        swr_ctx_ = nullptr;
    }
    if (dec_ctx_) {
        AVCodecContext* dec = static_cast<AVCodecContext*>(dec_ctx_);
        avcodec_free_context(&dec);
        dec_ctx_ = nullptr;
    }
    if (fmt_ctx_) {
        AVFormatContext* fmt = static_cast<AVFormatContext*>(fmt_ctx_);
        avformat_close_input(&fmt);
        fmt_ctx_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// AudioStream
// ---------------------------------------------------------------------------

int FfmpegAudioStream::sample_rate() const {
    return sample_rate_;
}

bool FfmpegAudioStream::has_audio() const {
    return !eof_ || fifo_pos_ < fifo_.size();
}

size_t FfmpegAudioStream::read(float* out, size_t max_frames, std::chrono::milliseconds timeout) {
    if (!out || max_frames == 0) return 0;

    const TimePoint deadline = std::chrono::steady_clock::now() + timeout;

    if (fifo_pos_ >= fifo_.size()) {
        fifo_.clear();
        fifo_pos_ = 0;
        read_deadline_ = deadline;
        fill();
        read_deadline_ = TimePoint::max();
    }

    size_t n = std::min(max_frames, fifo_.size() - fifo_pos_);
    if (n == 0) return 0;

    if (realtime_) {
        auto now = std::chrono::steady_clock::now();
        if (delivered_ == 0) started_at_ = now;

        // Do not hand out samples before their playback time.
        auto due = started_at_ + std::chrono::microseconds(
            static_cast<int64_t>((delivered_ + n) * 1000000 / static_cast<uint64_t>(sample_rate_)));
        if (due > deadline) {
            std::this_thread::sleep_until(deadline);
            auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
                deadline - started_at_).count();
            uint64_t allowed = static_cast<uint64_t>(elapsed_us) * static_cast<uint64_t>(sample_rate_) / 1000000;
            if (allowed <= delivered_) return 0;
            n = std::min<size_t>(n, static_cast<size_t>(allowed - delivered_));
        } else {
            std::this_thread::sleep_until(due);
        }
    }

    std::memcpy(out, fifo_.data() + fifo_pos_, n * sizeof(float));
    fifo_pos_ += n;
    delivered_ += n;
    return n;
}

// ---------------------------------------------------------------------------
// fill / append_frame
// ---------------------------------------------------------------------------

void FfmpegAudioStream::fill() {
    if (eof_) return;

    AVFormatContext* fmt = static_cast<AVFormatContext*>(fmt_ctx_);
    AVCodecContext* dec  = static_cast<AVCodecContext*>(dec_ctx_);
    AVPacket* pkt        = static_cast<AVPacket*>(packet_);
    AVFrame* frame       = static_cast<AVFrame*>(frame_);

    while (fifo_.empty()) {
        int ret = av_read_frame(fmt, pkt);
        if (ret == AVERROR(EAGAIN)) {
            if (std::chrono::steady_clock::now() >= read_deadline_) return;
            std::this_thread::sleep_for(kPollInterval);
            continue;
        }
        if (ret == AVERROR_EXIT) {
            // Interrupted at the read deadline; the source may still recover.
            Logger::instance().debug(kLogSource, "Read on '" + input_ + "' timed out");
            if (fmt->pb) {
                // The interrupted transfer leaves the I/O context flagged as failed.
                fmt->pb->eof_reached = 0;
                fmt->pb->error = 0;
            }
            return;
        }
        if (ret < 0) {
            if (ret != AVERROR_EOF) {
                Logger::instance().warn(kLogSource, "Read error on '" + input_ + "': " + av_error_string(ret));
            }
            // Flush the decoder.
            avcodec_send_packet(dec, nullptr);
            while (avcodec_receive_frame(dec, frame) == 0) {
                append_frame(frame);
            }
            eof_ = true;
            return;
        }

        if (pkt->stream_index == audio_idx_) {
            if (avcodec_send_packet(dec, pkt) == 0) {
                while (avcodec_receive_frame(dec, frame) == 0) {
                    append_frame(frame);
                }
            }
        }
        av_packet_unref(pkt);

        if (fifo_.empty() && std::chrono::steady_clock::now() >= read_deadline_) return;
    }
}

int FfmpegAudioStream::interrupt_cb(void* opaque) {
    const FfmpegAudioStream* self = static_cast<const FfmpegAudioStream*>(opaque);
    return std::chrono::steady_clock::now() >= self->read_deadline_ ? 1 : 0;
}

void FfmpegAudioStream::append_frame(void* frame_ptr) {
    AVFrame* frame = static_cast<AVFrame*>(frame_ptr);
    SwrContext* swr = static_cast<SwrContext*>(swr_ctx_);

    int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr, sample_rate_) + frame->nb_samples,
        sample_rate_, sample_rate_, AV_ROUND_UP));

    std::vector<float> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    int converted = swr_convert(swr, &out_buf, out_samples,
                                (const uint8_t**)frame->extended_data,
                                frame->nb_samples);
    if (converted > 0) {
        fifo_.insert(fifo_.end(), buf.begin(), buf.begin() + converted);
    }
    av_frame_unref(frame);
}

} // namespace lt
