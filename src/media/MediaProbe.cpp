#include "MediaProbe.h"
#include <memory>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

namespace {

struct InputCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
using InputPtr = std::unique_ptr<AVFormatContext, InputCloser>;

} // namespace

QString MediaInfo::audioSummary() const {
    if (!hasAudio()) return QStringLiteral("no audio");
    return QString("%1, %2 Hz, %3 ch").arg(audioCodec).arg(audioSampleRate).arg(audioChannels);
}

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_error.clear();

    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open %1 (%2)").arg(filePath, QString::fromUtf8(errBuf));
        return false;
    }
    InputPtr input(raw);

    if (avformat_find_stream_info(input.get(), nullptr) < 0) {
        m_error = QString("Cannot read stream info of %1").arg(filePath);
        return false;
    }

    m_info.containerFormat = QString::fromUtf8(input->iformat->name);
    if (input->duration > 0)
        m_info.duration = static_cast<double>(input->duration) / AV_TIME_BASE;

    for (unsigned i = 0; i < input->nb_streams; ++i) {
        switch (input->streams[i]->codecpar->codec_type) {
        case AVMEDIA_TYPE_VIDEO: ++m_info.videoStreams; break;
        case AVMEDIA_TYPE_AUDIO: ++m_info.audioStreams; break;
        default: break;
        }
    }

    int audioIdx = av_find_best_stream(input.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioIdx >= 0) {
        const AVCodecParameters* par = input->streams[audioIdx]->codecpar;
        m_info.audioSampleRate = par->sample_rate;
        m_info.audioChannels = par->ch_layout.nb_channels;
        m_info.audioCodec = QString::fromUtf8(avcodec_get_name(par->codec_id));
    }
    return true;
}
