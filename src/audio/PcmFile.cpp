#include "PcmFile.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include "core/Logger.hpp"

namespace mc {

namespace {

constexpr usize kFramesPerChunk = 4096;

// Inverse of swresample's s16 -> float (x / 32768), so decoded samples
// are written back unchanged
i16 toS16(f32 sample) {
    long scaled = std::lrint(static_cast<f64>(sample) * 32768.0);
    return static_cast<i16>(std::clamp(scaled, -32768L, 32767L));
}

struct OpenedInput {
    AVInputContextPtr formatCtx;
    AVCodecContextPtr codecCtx;
    int streamIndex{-1};
};

Result<OpenedInput> openInput(const fs::path& path) {
    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, path.string().c_str(), nullptr, nullptr);
    if (ret < 0) {
        return Result<OpenedInput>::err("Could not open " + path.string() +
                                        ": " + averr(ret));
    }

    OpenedInput in;
    in.formatCtx.reset(raw);

    // Header-only files can fail probing but still describe their stream
    ret = avformat_find_stream_info(in.formatCtx.get(), nullptr);
    if (ret < 0 && in.formatCtx->nb_streams == 0) {
        return Result<OpenedInput>::err("Could not read stream info from " +
                                        path.string() + ": " + averr(ret));
    }

    in.streamIndex = av_find_best_stream(
            in.formatCtx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (in.streamIndex < 0) {
        return Result<OpenedInput>::err("No audio stream in " + path.string());
    }

    auto* par = in.formatCtx->streams[in.streamIndex]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) {
        return Result<OpenedInput>::err("No decoder for " + path.string());
    }

    in.codecCtx.reset(avcodec_alloc_context3(codec));
    if (!in.codecCtx) {
        return Result<OpenedInput>::err("Could not allocate decoder context");
    }
    if ((ret = avcodec_parameters_to_context(in.codecCtx.get(), par)) < 0 ||
        (ret = avcodec_open2(in.codecCtx.get(), codec, nullptr)) < 0) {
        return Result<OpenedInput>::err("Could not open decoder for " +
                                        path.string() + ": " + averr(ret));
    }

    if (in.codecCtx->sample_rate <= 0 ||
        in.codecCtx->ch_layout.nb_channels <= 0) {
        return Result<OpenedInput>::err("Invalid stream parameters in " +
                                        path.string());
    }

    return Result<OpenedInput>::ok(std::move(in));
}

void appendConverted(SwrContext* swr,
                     PcmData& out,
                     const u8** in,
                     int inFrames) {
    int maxOut = swr_get_out_samples(swr, inFrames);
    if (maxOut <= 0)
        return;

    std::vector<u8*> outPtrs(out.channels.size());
    usize start = out.frames();
    for (usize c = 0; c < out.channels.size(); ++c) {
        out.channels[c].resize(start + maxOut);
        outPtrs[c] = reinterpret_cast<u8*>(out.channels[c].data() + start);
    }

    int got = swr_convert(swr, outPtrs.data(), maxOut, in, inFrames);
    usize produced = got > 0 ? static_cast<usize>(got) : 0;
    for (auto& ch : out.channels)
        ch.resize(start + produced);
}

} // namespace

PcmData PcmData::silence(AudioFormat format, usize frames) {
    PcmData pcm;
    pcm.format = format;
    pcm.channels.assign(format.channels, std::vector<f32>(frames, 0.0f));
    return pcm;
}

WavWriter::WavWriter() = default;

WavWriter::~WavWriter() {
    if (isOpen()) {
        if (auto res = close(); !res) {
            LOG_WARN("WavWriter: {}", res.error().message);
        }
    }
}

Result<void> WavWriter::open(const fs::path& path, const AudioFormat& format) {
    if (formatCtx_)
        return Result<void>::err("Writer already open: " + path_.string());
    if (!format.valid())
        return Result<void>::err("Invalid audio format");

    AVFormatContext* raw = nullptr;
    int ret = avformat_alloc_output_context2(
            &raw, nullptr, "wav", path.string().c_str());
    if (ret < 0 || !raw) {
        return Result<void>::err("Could not create WAV muxer: " + averr(ret));
    }
    AVOutputContextPtr ctx(raw);

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE);
    if (!codec)
        return Result<void>::err("pcm_s16le encoder not available");

    AVCodecContextPtr cc(avcodec_alloc_context3(codec));
    if (!cc)
        return Result<void>::err("Could not allocate encoder context");

    cc->sample_fmt = AV_SAMPLE_FMT_S16;
    cc->sample_rate = static_cast<int>(format.sampleRate);
    av_channel_layout_default(&cc->ch_layout, static_cast<int>(format.channels));
    cc->time_base = AVRational{1, static_cast<int>(format.sampleRate)};
    if (ctx->oformat->flags & AVFMT_GLOBALHEADER)
        cc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    if ((ret = avcodec_open2(cc.get(), codec, nullptr)) < 0)
        return Result<void>::err("Could not open encoder: " + averr(ret));

    AVStream* stream = avformat_new_stream(ctx.get(), nullptr);
    if (!stream)
        return Result<void>::err("Could not create output stream");
    stream->time_base = cc->time_base;
    if ((ret = avcodec_parameters_from_context(stream->codecpar, cc.get())) < 0)
        return Result<void>::err("Could not copy codec parameters: " +
                                 averr(ret));

    if ((ret = avio_open(&ctx->pb, path.string().c_str(), AVIO_FLAG_WRITE)) < 0)
        return Result<void>::err("Could not open " + path.string() + ": " +
                                 averr(ret));

    if ((ret = avformat_write_header(ctx.get(), nullptr)) < 0)
        return Result<void>::err("Could not write WAV header: " + averr(ret));

    frame_.reset(av_frame_alloc());
    packet_.reset(av_packet_alloc());
    if (!frame_ || !packet_)
        return Result<void>::err("Could not allocate frame/packet");

    formatCtx_ = std::move(ctx);
    codecCtx_ = std::move(cc);
    stream_ = stream;
    format_ = format;
    framesWritten_ = 0;
    path_ = path;

    LOG_DEBUG("WavWriter: opened {} ({} Hz, {} ch)",
              path.string(),
              format.sampleRate,
              format.channels);
    return Result<void>::ok();
}

Result<void> WavWriter::writeInterleaved(std::span<const i16> samples) {
    if (!formatCtx_)
        return Result<void>::err("Writer is not open");

    const usize channels = format_.channels;
    usize totalFrames = samples.size() / channels;
    usize offset = 0;

    while (offset < totalFrames) {
        usize n = std::min(kFramesPerChunk, totalFrames - offset);

        frame_->nb_samples = static_cast<int>(n);
        frame_->format = AV_SAMPLE_FMT_S16;
        frame_->sample_rate = codecCtx_->sample_rate;
        if (int ret = av_channel_layout_copy(&frame_->ch_layout,
                                             &codecCtx_->ch_layout);
            ret < 0) {
            return Result<void>::err("Could not set channel layout: " +
                                     averr(ret));
        }
        if (int ret = av_frame_get_buffer(frame_.get(), 0); ret < 0) {
            av_frame_unref(frame_.get());
            return Result<void>::err("Could not allocate frame buffer: " +
                                     averr(ret));
        }

        std::memcpy(frame_->data[0],
                    samples.data() + offset * channels,
                    n * channels * sizeof(i16));
        frame_->pts = static_cast<i64>(framesWritten_);

        auto res = encode(frame_.get());
        av_frame_unref(frame_.get());
        if (!res)
            return res;

        framesWritten_ += n;
        offset += n;
    }
    return Result<void>::ok();
}

Result<void> WavWriter::writePlanar(const PcmData& pcm) {
    if (!formatCtx_)
        return Result<void>::err("Writer is not open");
    if (pcm.channels.size() != format_.channels)
        return Result<void>::err("Channel count does not match writer format");

    const usize channels = format_.channels;
    const usize frames = pcm.frames();
    std::vector<i16> interleaved;
    interleaved.reserve(kFramesPerChunk * channels);

    for (usize start = 0; start < frames; start += kFramesPerChunk) {
        usize n = std::min(kFramesPerChunk, frames - start);
        interleaved.resize(n * channels);
        for (usize f = 0; f < n; ++f) {
            for (usize c = 0; c < channels; ++c)
                interleaved[f * channels + c] = toS16(pcm.channels[c][start + f]);
        }
        if (auto res = writeInterleaved(interleaved); !res)
            return res;
    }
    return Result<void>::ok();
}

Result<void> WavWriter::encode(AVFrame* frame) {
    int ret = avcodec_send_frame(codecCtx_.get(), frame);
    if (ret < 0)
        return Result<void>::err("Encoder rejected frame: " + averr(ret));

    while (true) {
        ret = avcodec_receive_packet(codecCtx_.get(), packet_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            break;
        if (ret < 0)
            return Result<void>::err("Encoding failed: " + averr(ret));

        av_packet_rescale_ts(
                packet_.get(), codecCtx_->time_base, stream_->time_base);
        packet_->stream_index = stream_->index;
        ret = av_interleaved_write_frame(formatCtx_.get(), packet_.get());
        if (ret < 0)
            return Result<void>::err("Write to " + path_.string() +
                                     " failed: " + averr(ret));
    }
    return Result<void>::ok();
}

Result<void> WavWriter::close() {
    if (!formatCtx_)
        return Result<void>::ok();

    auto result = encode(nullptr);
    if (int ret = av_write_trailer(formatCtx_.get()); ret < 0 && result) {
        result = Result<void>::err("Could not finalize " + path_.string() +
                                   ": " + averr(ret));
    }
    if (formatCtx_->pb && formatCtx_->pb->error < 0 && result) {
        result = Result<void>::err("I/O error on " + path_.string() + ": " +
                                   averr(formatCtx_->pb->error));
    }

    LOG_DEBUG("WavWriter: closed {} ({} frames)", path_.string(), framesWritten_);

    packet_.reset();
    frame_.reset();
    codecCtx_.reset();
    formatCtx_.reset();
    stream_ = nullptr;
    return result;
}

Result<PcmData> readPcmFile(const fs::path& path) {
    auto opened = openInput(path);
    if (!opened)
        return Result<PcmData>::err(opened.error());
    auto& in = *opened;
    auto* cc = in.codecCtx.get();

    PcmData out;
    out.format.sampleRate = static_cast<u32>(cc->sample_rate);
    out.format.channels = static_cast<u32>(cc->ch_layout.nb_channels);
    out.channels.resize(out.format.channels);

    SwrContext* rawSwr = nullptr;
    int ret = swr_alloc_set_opts2(&rawSwr,
                                  &cc->ch_layout,
                                  AV_SAMPLE_FMT_FLTP,
                                  cc->sample_rate,
                                  &cc->ch_layout,
                                  cc->sample_fmt,
                                  cc->sample_rate,
                                  0,
                                  nullptr);
    SwrContextPtr swr(rawSwr);
    if (ret < 0 || !swr || swr_init(swr.get()) < 0)
        return Result<PcmData>::err("Could not initialize sample converter");

    AVPacketPtr packet(av_packet_alloc());
    AVFramePtr frame(av_frame_alloc());
    if (!packet || !frame)
        return Result<PcmData>::err("Could not allocate frame/packet");

    auto drainFrames = [&]() -> Result<void> {
        while (true) {
            int r = avcodec_receive_frame(cc, frame.get());
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF)
                return Result<void>::ok();
            if (r < 0)
                return Result<void>::err("Decoding " + path.string() +
                                         " failed: " + averr(r));
            appendConverted(swr.get(),
                            out,
                            const_cast<const u8**>(frame->extended_data),
                            frame->nb_samples);
            av_frame_unref(frame.get());
        }
    };

    while ((ret = av_read_frame(in.formatCtx.get(), packet.get())) >= 0) {
        if (packet->stream_index == in.streamIndex) {
            int r = avcodec_send_packet(cc, packet.get());
            av_packet_unref(packet.get());
            if (r < 0)
                return Result<PcmData>::err("Corrupt audio data in " +
                                            path.string() + ": " + averr(r));
            if (auto res = drainFrames(); !res)
                return Result<PcmData>::err(res.error());
        } else {
            av_packet_unref(packet.get());
        }
    }
    if (ret != AVERROR_EOF)
        return Result<PcmData>::err("Read error in " + path.string() + ": " +
                                    averr(ret));

    if (avcodec_send_packet(cc, nullptr) >= 0) {
        if (auto res = drainFrames(); !res)
            return Result<PcmData>::err(res.error());
    }
    appendConverted(swr.get(), out, nullptr, 0);

    LOG_DEBUG("Read {} frames from {}", out.frames(), path.string());
    return Result<PcmData>::ok(std::move(out));
}

Result<PcmFileInfo> probePcmFile(const fs::path& path) {
    auto opened = openInput(path);
    if (!opened)
        return Result<PcmFileInfo>::err(opened.error());
    auto& in = *opened;

    PcmFileInfo info;
    info.format.sampleRate = static_cast<u32>(in.codecCtx->sample_rate);
    info.format.channels = static_cast<u32>(in.codecCtx->ch_layout.nb_channels);

    AVStream* st = in.formatCtx->streams[in.streamIndex];
    AVRational frameBase{1, in.codecCtx->sample_rate};
    if (st->duration != AV_NOPTS_VALUE && st->duration > 0) {
        info.frames = static_cast<u64>(
                av_rescale_q(st->duration, st->time_base, frameBase));
    } else if (in.formatCtx->duration != AV_NOPTS_VALUE &&
               in.formatCtx->duration > 0) {
        info.frames = static_cast<u64>(av_rescale_q(
                in.formatCtx->duration, AV_TIME_BASE_Q, frameBase));
    }
    return Result<PcmFileInfo>::ok(info);
}

} // namespace mc
