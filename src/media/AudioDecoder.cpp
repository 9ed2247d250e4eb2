#include "AudioDecoder.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

struct AudioDecoder::FFmpegAudioContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwrContext* swrCtx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    int audioStreamIdx = -1;

    ~FFmpegAudioContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        if (swrCtx) swr_free(&swrCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

AudioDecoder::AudioDecoder(QObject* parent) : QObject(parent) {}
AudioDecoder::~AudioDecoder() { close(); }

bool AudioDecoder::fail(const QString& message) {
    m_error = message;
    m_ctx.reset();
    m_isOpen = false;
    return false;
}

bool AudioDecoder::open(const QString& filePath, int outputSampleRate) {
    close();
    m_error.clear();
    m_outputRate = outputSampleRate;

    m_ctx = std::make_unique<FFmpegAudioContext>();

    int ret = avformat_open_input(&m_ctx->fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) return fail(QString("Cannot open audio file: %1").arg(filePath));

    ret = avformat_find_stream_info(m_ctx->fmtCtx, nullptr);
    if (ret < 0) return fail(QString("Cannot read stream info: %1").arg(filePath));

    m_ctx->audioStreamIdx = av_find_best_stream(m_ctx->fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (m_ctx->audioStreamIdx < 0) return fail(QString("No audio stream in %1").arg(filePath));

    AVStream* stream = m_ctx->fmtCtx->streams[m_ctx->audioStreamIdx];
    AVCodecParameters* par = stream->codecpar;

    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) return fail("No decoder for the audio stream");

    m_ctx->codecCtx = avcodec_alloc_context3(codec);
    if (!m_ctx->codecCtx) return fail("Cannot allocate audio decoder");
    if (avcodec_parameters_to_context(m_ctx->codecCtx, par) < 0)
        return fail("Cannot configure audio decoder");

    ret = avcodec_open2(m_ctx->codecCtx, codec, nullptr);
    if (ret < 0) return fail(QString("Cannot open audio decoder %1").arg(codec->name));

    m_info.sampleRate = m_ctx->codecCtx->sample_rate;
    m_info.channels = m_ctx->codecCtx->ch_layout.nb_channels;
    m_info.codecName = QString(codec->name);
    m_info.duration = (m_ctx->fmtCtx->duration > 0)
        ? static_cast<double>(m_ctx->fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    // Some demuxers leave the layout unspecified; assume the default order
    AVChannelLayout inLayout{};
    if (m_ctx->codecCtx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC)
        av_channel_layout_default(&inLayout, m_info.channels);
    else if (av_channel_layout_copy(&inLayout, &m_ctx->codecCtx->ch_layout) < 0)
        return fail("Cannot read channel layout");

    AVChannelLayout monoLayout{};
    av_channel_layout_default(&monoLayout, 1);
    ret = swr_alloc_set_opts2(&m_ctx->swrCtx,
        &monoLayout, AV_SAMPLE_FMT_FLT, m_outputRate,
        &inLayout, m_ctx->codecCtx->sample_fmt, m_info.sampleRate,
        0, nullptr);
    av_channel_layout_uninit(&inLayout);
    if (ret < 0 || !m_ctx->swrCtx) return fail("Cannot create audio resampler");

    ret = swr_init(m_ctx->swrCtx);
    if (ret < 0) return fail("Cannot initialize audio resampler");

    m_ctx->frame = av_frame_alloc();
    m_ctx->packet = av_packet_alloc();
    if (!m_ctx->frame || !m_ctx->packet) return fail("Cannot allocate audio buffers");

    m_isOpen = true;
    return true;
}

void AudioDecoder::close() {
    m_ctx.reset();
    m_isOpen = false;
    m_info = AudioInfo{};
}

bool AudioDecoder::convertFrame(std::vector<float>& samples) {
    AVFrame* frame = m_ctx->frame;
    int capacity = swr_get_out_samples(m_ctx->swrCtx, frame->nb_samples);
    if (capacity < 0) return false;

    size_t offset = samples.size();
    samples.resize(offset + static_cast<size_t>(capacity));
    uint8_t* outPtr = reinterpret_cast<uint8_t*>(samples.data() + offset);

    int converted = swr_convert(m_ctx->swrCtx,
        &outPtr, capacity,
        const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
    if (converted < 0) {
        samples.resize(offset);
        return false;
    }
    samples.resize(offset + static_cast<size_t>(converted));
    return true;
}

bool AudioDecoder::drainResampler(std::vector<float>& samples) {
    while (true) {
        int pending = swr_get_out_samples(m_ctx->swrCtx, 0);
        if (pending <= 0) return true;

        size_t offset = samples.size();
        samples.resize(offset + static_cast<size_t>(pending));
        uint8_t* outPtr = reinterpret_cast<uint8_t*>(samples.data() + offset);
        int converted = swr_convert(m_ctx->swrCtx, &outPtr, pending, nullptr, 0);
        if (converted < 0) {
            samples.resize(offset);
            return false;
        }
        samples.resize(offset + static_cast<size_t>(converted));
        if (converted == 0) return true;
    }
}

bool AudioDecoder::decodeAll(std::vector<float>& samples) {
    if (!m_isOpen || !m_ctx) {
        m_error = "Audio decoder is not open";
        return false;
    }

    bool draining = false;
    while (true) {
        if (!draining) {
            int ret = av_read_frame(m_ctx->fmtCtx, m_ctx->packet);
            if (ret < 0) {
                draining = true;
                ret = avcodec_send_packet(m_ctx->codecCtx, nullptr);
                if (ret < 0 && ret != AVERROR_EOF) {
                    m_error = "Cannot flush audio decoder";
                    return false;
                }
            } else {
                if (m_ctx->packet->stream_index != m_ctx->audioStreamIdx) {
                    av_packet_unref(m_ctx->packet);
                    continue;
                }
                ret = avcodec_send_packet(m_ctx->codecCtx, m_ctx->packet);
                av_packet_unref(m_ctx->packet);
                if (ret < 0) continue;  // skip corrupt packets
            }
        }

        int ret = 0;
        while ((ret = avcodec_receive_frame(m_ctx->codecCtx, m_ctx->frame)) >= 0) {
            bool ok = convertFrame(samples);
            av_frame_unref(m_ctx->frame);
            if (!ok) {
                m_error = "Audio resampling failed";
                return false;
            }
        }

        if (draining) {
            if (ret == AVERROR_EOF) break;
            if (ret != AVERROR(EAGAIN)) {
                m_error = "Audio decode error while draining";
                return false;
            }
            break;
        }
    }

    if (!drainResampler(samples)) {
        m_error = "Audio resampling failed";
        return false;
    }
    return true;
}
