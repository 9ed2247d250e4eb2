#include "VideoEncoder.h"

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

struct VideoEncoder::FFmpegEncodeContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    AVStream* stream = nullptr;
    SwsContext* swsCtx = nullptr;
    AVFrame* yuvFrame = nullptr;
    AVPacket* packet = nullptr;
    bool headerWritten = false;
    bool trailerWritten = false;

    ~FFmpegEncodeContext() {
        // An unfinished file still gets its trailer so the muxer frees its state
        if (headerWritten && !trailerWritten) av_write_trailer(fmtCtx);
        if (packet) av_packet_free(&packet);
        if (yuvFrame) av_frame_free(&yuvFrame);
        if (swsCtx) sws_freeContext(swsCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) {
            if (fmtCtx->pb && !(fmtCtx->oformat->flags & AVFMT_NOFILE))
                avio_closep(&fmtCtx->pb);
            avformat_free_context(fmtCtx);
        }
    }
};

VideoEncoder::VideoEncoder(QObject* parent) : QObject(parent) {}

VideoEncoder::~VideoEncoder() {
    close();
}

bool VideoEncoder::fail(const QString& message) {
    m_error = message;
    m_ctx.reset();
    m_isOpen = false;
    return false;
}

bool VideoEncoder::open(const QString& filePath, const VideoEncoderSettings& settings) {
    close();
    m_error.clear();
    m_settings = settings;

    if (settings.width <= 0 || settings.height <= 0 || settings.fps <= 0.0)
        return fail("Invalid encoder geometry or frame rate");

    m_ctx = std::make_unique<FFmpegEncodeContext>();
    const QByteArray path = filePath.toUtf8();

    int ret = avformat_alloc_output_context2(&m_ctx->fmtCtx, nullptr, nullptr, path.constData());
    if (ret < 0 || !m_ctx->fmtCtx)
        return fail(QString("No container for %1 (%2)").arg(filePath, avErrorText(ret)));

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    if (!codec) return fail("MPEG-4 encoder not available");

    m_ctx->stream = avformat_new_stream(m_ctx->fmtCtx, nullptr);
    m_ctx->codecCtx = avcodec_alloc_context3(codec);
    if (!m_ctx->stream || !m_ctx->codecCtx) return fail("Cannot allocate encoder");

    // MPEG-4 limits the time base denominator to 16 bits
    AVRational fpsQ = av_d2q(settings.fps, 65535);
    AVCodecContext* enc = m_ctx->codecCtx;
    enc->width = settings.width;
    enc->height = settings.height;
    enc->pix_fmt = AV_PIX_FMT_YUV420P;
    enc->time_base = AVRational{fpsQ.den, fpsQ.num};
    enc->framerate = fpsQ;
    enc->gop_size = 12;
    enc->max_b_frames = 0;
    enc->thread_count = settings.threads;
    enc->flags |= AV_CODEC_FLAG_QSCALE;
    enc->global_quality = FF_QP2LAMBDA * settings.quantizer;

    if (m_ctx->fmtCtx->oformat->flags & AVFMT_GLOBALHEADER)
        enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    ret = avcodec_open2(enc, codec, nullptr);
    if (ret < 0) return fail(QString("Cannot open MPEG-4 encoder (%1)").arg(avErrorText(ret)));

    ret = avcodec_parameters_from_context(m_ctx->stream->codecpar, enc);
    if (ret < 0) return fail("Cannot copy encoder parameters");
    m_ctx->stream->time_base = enc->time_base;
    m_ctx->stream->avg_frame_rate = fpsQ;

    if (!(m_ctx->fmtCtx->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&m_ctx->fmtCtx->pb, path.constData(), AVIO_FLAG_WRITE);
        if (ret < 0) return fail(QString("Cannot create %1 (%2)").arg(filePath, avErrorText(ret)));
    }

    ret = avformat_write_header(m_ctx->fmtCtx, nullptr);
    if (ret < 0) return fail(QString("Cannot write header (%1)").arg(avErrorText(ret)));
    m_ctx->headerWritten = true;

    m_ctx->yuvFrame = av_frame_alloc();
    m_ctx->packet = av_packet_alloc();
    if (!m_ctx->yuvFrame || !m_ctx->packet) return fail("Cannot allocate frame buffers");

    m_ctx->yuvFrame->format = enc->pix_fmt;
    m_ctx->yuvFrame->width = enc->width;
    m_ctx->yuvFrame->height = enc->height;
    ret = av_frame_get_buffer(m_ctx->yuvFrame, 0);
    if (ret < 0) return fail("Cannot allocate YUV frame");

    m_isOpen = true;
    m_framesWritten = 0;
    return true;
}

bool VideoEncoder::drainPackets() {
    while (true) {
        int ret = avcodec_receive_packet(m_ctx->codecCtx, m_ctx->packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
        if (ret < 0) {
            m_error = QString("Encode error (%1)").arg(avErrorText(ret));
            return false;
        }

        m_ctx->packet->stream_index = m_ctx->stream->index;
        av_packet_rescale_ts(m_ctx->packet, m_ctx->codecCtx->time_base, m_ctx->stream->time_base);
        ret = av_interleaved_write_frame(m_ctx->fmtCtx, m_ctx->packet);
        av_packet_unref(m_ctx->packet);
        if (ret < 0) {
            m_error = QString("Cannot write packet (%1)").arg(avErrorText(ret));
            return false;
        }
    }
}

bool VideoEncoder::writeFrame(const QImage& frame) {
    if (!m_isOpen || !m_ctx) {
        m_error = "Encoder is not open";
        return false;
    }

    QImage rgb = frame;
    if (rgb.size() != QSize(m_settings.width, m_settings.height))
        rgb = rgb.scaled(m_settings.width, m_settings.height,
                         Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
    if (rgb.format() != QImage::Format_RGB32)
        rgb = rgb.convertToFormat(QImage::Format_RGB32);

    m_ctx->swsCtx = sws_getCachedContext(
        m_ctx->swsCtx,
        rgb.width(), rgb.height(), AV_PIX_FMT_RGB32,
        m_settings.width, m_settings.height, AV_PIX_FMT_YUV420P,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_ctx->swsCtx) {
        m_error = "Cannot create colorspace converter";
        return false;
    }

    // The codec may still reference the previous frame's buffers
    int ret = av_frame_make_writable(m_ctx->yuvFrame);
    if (ret < 0) {
        m_error = "Frame buffer not writable";
        return false;
    }

    const uint8_t* srcData[4] = { rgb.constBits(), nullptr, nullptr, nullptr };
    int srcLinesize[4] = { static_cast<int>(rgb.bytesPerLine()), 0, 0, 0 };
    sws_scale(m_ctx->swsCtx, srcData, srcLinesize, 0, rgb.height(),
              m_ctx->yuvFrame->data, m_ctx->yuvFrame->linesize);

    m_ctx->yuvFrame->pts = m_framesWritten;
    m_ctx->yuvFrame->quality = m_ctx->codecCtx->global_quality;

    ret = avcodec_send_frame(m_ctx->codecCtx, m_ctx->yuvFrame);
    if (ret < 0) {
        m_error = QString("Cannot encode frame (%1)").arg(avErrorText(ret));
        return false;
    }
    ++m_framesWritten;
    return drainPackets();
}

bool VideoEncoder::finish() {
    if (!m_isOpen || !m_ctx) {
        m_error = "Encoder is not open";
        return false;
    }

    bool ok = true;
    int ret = avcodec_send_frame(m_ctx->codecCtx, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot flush encoder (%1)").arg(avErrorText(ret));
        ok = false;
    } else {
        ok = drainPackets();
    }

    ret = av_write_trailer(m_ctx->fmtCtx);
    m_ctx->trailerWritten = true;
    if (ret < 0) {
        m_error = QString("Cannot write trailer (%1)").arg(avErrorText(ret));
        ok = false;
    }

    m_ctx.reset();
    m_isOpen = false;
    return ok;
}

void VideoEncoder::close() {
    m_ctx.reset();
    m_isOpen = false;
}
