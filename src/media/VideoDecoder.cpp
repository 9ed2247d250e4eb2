#include "VideoDecoder.h"
#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}

namespace {

QString avErrorText(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, buf, sizeof(buf));
    return QString::fromUtf8(buf);
}

} // namespace

struct VideoDecoder::FFmpegContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwsContext* swsCtx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    int videoStreamIdx = -1;
    double timeBase = 0.0;
    bool eofReached = false;   // demuxer has no more packets
    bool flushed = false;      // flush packet sent to codec

    ~FFmpegContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        if (swsCtx) sws_freeContext(swsCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

VideoDecoder::VideoDecoder(QObject* parent) : QObject(parent) {}

VideoDecoder::~VideoDecoder() {
    close();
}

bool VideoDecoder::fail(const QString& message) {
    m_error = message;
    m_ctx.reset();
    m_isOpen = false;
    return false;
}

bool VideoDecoder::open(const QString& filePath) {
    close();
    m_error.clear();

    m_ctx = std::make_unique<FFmpegContext>();

    int ret = avformat_open_input(&m_ctx->fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0)
        return fail(QString("Cannot open video %1 (%2)").arg(filePath, avErrorText(ret)));

    ret = avformat_find_stream_info(m_ctx->fmtCtx, nullptr);
    if (ret < 0)
        return fail(QString("Cannot read stream info of %1 (%2)").arg(filePath, avErrorText(ret)));

    m_ctx->videoStreamIdx = av_find_best_stream(m_ctx->fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (m_ctx->videoStreamIdx < 0)
        return fail(QString("No video stream in %1").arg(filePath));

    AVStream* stream = m_ctx->fmtCtx->streams[m_ctx->videoStreamIdx];
    AVCodecParameters* par = stream->codecpar;

    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec)
        return fail(QString("No decoder for the video stream of %1").arg(filePath));

    m_ctx->codecCtx = avcodec_alloc_context3(codec);
    if (!m_ctx->codecCtx)
        return fail("Cannot allocate decoder context");

    ret = avcodec_parameters_to_context(m_ctx->codecCtx, par);
    if (ret < 0)
        return fail(QString("Cannot configure decoder (%1)").arg(avErrorText(ret)));

    ret = avcodec_open2(m_ctx->codecCtx, codec, nullptr);
    if (ret < 0)
        return fail(QString("Cannot open decoder %1 (%2)").arg(codec->name, avErrorText(ret)));

    m_ctx->timeBase = av_q2d(stream->time_base);

    m_info.width = m_ctx->codecCtx->width;
    m_info.height = m_ctx->codecCtx->height;
    m_info.codecName = QString(codec->name);

    if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0)
        m_info.fps = av_q2d(stream->avg_frame_rate);
    else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0)
        m_info.fps = av_q2d(stream->r_frame_rate);

    // Prefer video stream duration over container duration
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        m_info.duration = static_cast<double>(stream->duration) * m_ctx->timeBase;
    } else if (m_ctx->fmtCtx->duration > 0) {
        m_info.duration = static_cast<double>(m_ctx->fmtCtx->duration) / AV_TIME_BASE;
    }

    // Container frame count when present, otherwise estimated from duration
    if (stream->nb_frames > 0)
        m_info.totalFrames = stream->nb_frames;
    else if (m_info.fps > 0 && m_info.duration > 0)
        m_info.totalFrames = std::llround(m_info.duration * m_info.fps);

    m_ctx->frame = av_frame_alloc();
    m_ctx->packet = av_packet_alloc();
    if (!m_ctx->frame || !m_ctx->packet)
        return fail("Cannot allocate decoder buffers");

    m_isOpen = true;
    m_exhausted = false;
    m_currentTime = 0.0;
    return true;
}

void VideoDecoder::close() {
    m_ctx.reset();
    m_isOpen = false;
    m_exhausted = false;
    m_currentTime = 0.0;
    m_info = VideoInfo{};
}

QImage VideoDecoder::convertCurrentFrame() {
    AVFrame* src = m_ctx->frame;

    // Frame geometry may change mid-stream, so the scaler is looked up per frame
    m_ctx->swsCtx = sws_getCachedContext(
        m_ctx->swsCtx,
        src->width, src->height, static_cast<AVPixelFormat>(src->format),
        src->width, src->height, AV_PIX_FMT_RGB32,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_ctx->swsCtx) return QImage();

    QImage image(src->width, src->height, QImage::Format_RGB32);
    if (image.isNull()) return QImage();

    uint8_t* dstData[4] = { image.bits(), nullptr, nullptr, nullptr };
    int dstLinesize[4] = { static_cast<int>(image.bytesPerLine()), 0, 0, 0 };
    sws_scale(m_ctx->swsCtx, src->data, src->linesize, 0, src->height, dstData, dstLinesize);
    return image;
}

SourceFrame VideoDecoder::readFrame() {
    if (!m_isOpen || !m_ctx || m_exhausted) return SourceFrame::exhausted();

    while (true) {
        // Try to receive a frame from the codec first (handles buffered B-frames)
        int ret = avcodec_receive_frame(m_ctx->codecCtx, m_ctx->frame);
        if (ret == 0) {
            if (m_ctx->frame->pts != AV_NOPTS_VALUE)
                m_currentTime = static_cast<double>(m_ctx->frame->pts) * m_ctx->timeBase;

            QImage image = convertCurrentFrame();
            av_frame_unref(m_ctx->frame);
            if (image.isNull()) {
                m_error = "Cannot convert decoded frame";
                return SourceFrame::readError();
            }
            return SourceFrame::frame(image);
        }

        if (ret == AVERROR_EOF) {
            m_exhausted = true;
            return SourceFrame::exhausted();
        }

        if (ret != AVERROR(EAGAIN)) {
            m_error = QString("Decode error (%1)").arg(avErrorText(ret));
            return SourceFrame::readError();
        }

        // Codec needs more input
        if (m_ctx->eofReached) {
            if (!m_ctx->flushed) {
                m_ctx->flushed = true;
                ret = avcodec_send_packet(m_ctx->codecCtx, nullptr);
                if (ret < 0 && ret != AVERROR_EOF) {
                    m_error = QString("Cannot flush decoder (%1)").arg(avErrorText(ret));
                    m_exhausted = true;
                    return SourceFrame::readError();
                }
                continue;
            }
            m_exhausted = true;
            return SourceFrame::exhausted();
        }

        ret = av_read_frame(m_ctx->fmtCtx, m_ctx->packet);
        if (ret < 0) {
            // Drain the codec on EOF as well as on a broken container
            m_ctx->eofReached = true;
            if (ret != AVERROR_EOF) {
                m_error = QString("Read error (%1)").arg(avErrorText(ret));
                return SourceFrame::readError();
            }
            continue;
        }

        if (m_ctx->packet->stream_index != m_ctx->videoStreamIdx) {
            av_packet_unref(m_ctx->packet);
            continue;
        }

        ret = avcodec_send_packet(m_ctx->codecCtx, m_ctx->packet);
        av_packet_unref(m_ctx->packet);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            m_error = QString("Corrupt packet (%1)").arg(avErrorText(ret));
            return SourceFrame::readError();
        }
    }
}
